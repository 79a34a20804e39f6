#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <pcrecpp.h>

#include "canonical.hpp"
#include "common.hpp"


namespace dnostool {

std::string Trim(const std::string& s) {
	size_t b = s.find_first_not_of(" \t\r\n");
	if (b == std::string::npos)
		return std::string();
	size_t e = s.find_last_not_of(" \t\r\n");
	return s.substr(b, e - b + 1);
}

static std::string Lower(const std::string& s) {
	std::string ret(s);
	for (size_t i = 0; i < ret.length(); ++i)
		ret[i] = static_cast< char >(tolower(static_cast< unsigned char >(ret[i])));
	return ret;
}

static std::string Upper(const std::string& s) {
	std::string ret(s);
	for (size_t i = 0; i < ret.length(); ++i)
		ret[i] = static_cast< char >(toupper(static_cast< unsigned char >(ret[i])));
	return ret;
}

static bool IsHex(const std::string& s) {
	for (size_t i = 0; i < s.length(); ++i) {
		if (!isxdigit(static_cast< unsigned char >(s[i])))
			return false;
	}
	return !s.empty();
}

static std::vector< std::string > SplitAny(const std::string& s,
const char* seps) {
	std::vector< std::string > ret;
	std::string cur;
	for (size_t i = 0; i < s.length(); ++i) {
		if (strchr(seps, s[i])) {
			ret.push_back(cur);
			cur.clear();
		} else
			cur += s[i];
	}
	ret.push_back(cur);
	return ret;
}

std::string CanonicalMac(const std::string& mac) {
	std::string in = Trim(mac);
	std::string hex;
	std::vector< std::string > groups;
	if (in.find('.') != std::string::npos) {
		groups = SplitAny(in, ".");
		if (groups.size() != 3)
			return mac;
		for (size_t i = 0; i < groups.size(); ++i) {
			if (!IsHex(groups[i]) || groups[i].length() > 4)
				return mac;
			hex += std::string(4 - groups[i].length(), '0') + groups[i];
		}
	} else if (in.find(':') != std::string::npos
	|| in.find('-') != std::string::npos) {
		groups = SplitAny(in, ":-");
		if (groups.size() != 6)
			return mac;
		for (size_t i = 0; i < groups.size(); ++i) {
			if (!IsHex(groups[i]) || groups[i].length() > 2)
				return mac;
			hex += std::string(2 - groups[i].length(), '0') + groups[i];
		}
	} else {
		if (!IsHex(in) || in.length() != 12)
			return mac;
		hex = in;
	}
	hex = Upper(hex);
	std::string ret;
	for (size_t i = 0; i < 12; i += 2) {
		if (i > 0)
			ret += ':';
		ret += hex.substr(i, 2);
	}
	return ret;
}


struct InterfaceAlias {
	const char* alias;
	const char* long_name;
};

// Aliases are matched case-insensitively; the long form maps to itself.
static const InterfaceAlias s_interface_aliases[] = {
	{"fa", "FastEthernet"},
	{"fast", "FastEthernet"},
	{"fastethernet", "FastEthernet"},
	{"gi", "GigabitEthernet"},
	{"gig", "GigabitEthernet"},
	{"gige", "GigabitEthernet"},
	{"gigabitethernet", "GigabitEthernet"},
	{"te", "TenGigabitEthernet"},
	{"ten", "TenGigabitEthernet"},
	{"tengig", "TenGigabitEthernet"},
	{"tengige", "TenGigabitEthernet"},
	{"tengigabitethernet", "TenGigabitEthernet"},
	{"tw", "TwentyFiveGigE"},
	{"twe", "TwentyFiveGigE"},
	{"twentyfivegige", "TwentyFiveGigE"},
	{"fo", "FortyGigabitEthernet"},
	{"fortygig", "FortyGigabitEthernet"},
	{"fortygigabitethernet", "FortyGigabitEthernet"},
	{"hu", "HundredGigabitEthernet"},
	{"hundredgig", "HundredGigabitEthernet"},
	{"hundredgigabitethernet", "HundredGigabitEthernet"},
	{"et", "Ethernet"},
	{"eth", "Ethernet"},
	{"ethernet", "Ethernet"},
	{"po", "Port-Channel"},
	{"port-channel", "Port-Channel"},
	{"portchannel", "Port-Channel"},
	{"vl", "Vlan"},
	{"vlan", "Vlan"},
	{"lo", "Loopback"},
	{"loopback", "Loopback"},
	{"tu", "Tunnel"},
	{"tunnel", "Tunnel"},
	{0, 0}
};

std::string CanonicalInterfaceName(const std::string& name) {
	static const pcrecpp::RE split1("([A-Za-z][A-Za-z-]*)\\s*([0-9].*)");
	std::string type;
	std::string number;
	if (!split1.FullMatch(Trim(name), &type, &number))
		return name;
	std::string key = Lower(type);
	for (const InterfaceAlias* a = s_interface_aliases; a->alias; ++a) {
		if (key == a->alias)
			return std::string(a->long_name) + number;
	}
	return name;
}

long ParseSpeed(const std::string& speed) {
	std::string s = Trim(speed);
	if (s == "Unknown")
		return 0;
	char* end = 0;
	errno = 0;
	long l = strtol(s.c_str(), &end, 10);
	if (s.empty() || errno != 0 || *end != '\0' || l < 0)
		throw ParseException(fmt("Invalid interface speed: '%s'", speed.c_str()));
	return l;
}

double ParseArpAge(const std::string& age) {
	std::string s;
	for (size_t i = 0; i < age.length(); ++i) {
		if (!isspace(static_cast< unsigned char >(age[i])))
			s += age[i];
	}
	if (Lower(s) == "n/a")
		return -1.0;
	static const pcrecpp::RE age1("(?:([0-9]+)h)?(?:([0-9]+)m)?(?:([0-9]+)s)?");
	std::string h;
	std::string m;
	std::string sec;
	if (s.empty() || !age1.FullMatch(s, &h, &m, &sec))
		throw ParseException(fmt("Invalid ARP age: '%s'", age.c_str()));
	return atol(h.c_str()) * 3600.0 + atol(m.c_str()) * 60.0
	+ atol(sec.c_str());
}

int ParseVlan(const std::string& vlan) {
	char* end = 0;
	errno = 0;
	long l = strtol(vlan.c_str(), &end, 10);
	if (vlan.empty() || errno != 0 || *end != '\0' || l < 0 || l > 4095)
		throw ParseException(fmt("Invalid VLAN: '%s'", vlan.c_str()));
	return static_cast< int >(l);
}

double ParseUptime(const std::string& uptime) {
	static const pcrecpp::RE uptime1(
		"\\s*(?:([0-9]+)\\s*days?,?\\s*)?([0-9]+)h:([0-9]+)m:([0-9]+)s\\s*");
	static const pcrecpp::RE uptime2(
		"\\s*(?:([0-9]+)\\s*days?,?\\s*)?([0-9]+)\\s*hours?,?\\s*([0-9]+)\\s*"
		"minutes?,?\\s*([0-9]+)\\s*seconds?\\s*");
	std::string d;
	std::string h;
	std::string m;
	std::string s;
	if (!uptime1.FullMatch(uptime, &d, &h, &m, &s)
	&& !uptime2.FullMatch(uptime, &d, &h, &m, &s))
		throw ParseException(fmt("Invalid uptime: '%s'", uptime.c_str()));
	return atol(d.c_str()) * 86400.0 + atol(h.c_str()) * 3600.0
	+ atol(m.c_str()) * 60.0 + atol(s.c_str());
}

} // namespace dnostool
