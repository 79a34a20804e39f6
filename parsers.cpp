#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <set>

#include <pcrecpp.h>

#include "parsers.hpp"
#include "canonical.hpp"
#include "common.hpp"
#include "log.hpp"
#include "table.hpp"


namespace dnostool {

static std::string Lower(const std::string& s) {
	std::string ret(s);
	for (size_t i = 0; i < ret.length(); ++i)
		ret[i] = static_cast< char >(tolower(static_cast< unsigned char >(ret[i])));
	return ret;
}

static long long ParseCount(const std::string& s, const char* what) {
	char* end = 0;
	errno = 0;
	long long v = strtoll(s.c_str(), &end, 10);
	if (s.empty() || errno != 0 || *end != '\0' || v < 0)
		throw ParseException(fmt("Invalid %s: '%s'", what, s.c_str()));
	return v;
}


std::vector< MacTableEntry > ParseMacAddressTable(const std::string& text) {
	std::vector< MacTableEntry > entries;
	std::vector< std::string > rows = TableRows(text, "MAC address table");
	for (size_t i = 0; i < rows.size(); ++i) {
		std::vector< std::string > f = SplitFields(rows[i]);
		if (f.size() != 4)
			throw ParseException(fmt("Malformed MAC address table row: '%s'",
			rows[i].c_str()));
		MacTableEntry e;
		e.vlan = ParseVlan(f[0]);
		e.mac = f[1];
		std::string type = Lower(f[2]);
		e.is_static = (type == "management" || type == "static");
		e.active = (type == "dynamic");
		e.interface = f[3];
		entries.push_back(e);
	}
	return entries;
}

std::vector< ArpEntry > ParseArpTable(const std::string& text) {
	std::vector< ArpEntry > entries;
	std::vector< std::string > rows = TableRows(text, "ARP table");
	for (size_t i = 0; i < rows.size(); ++i) {
		std::vector< std::string > f = SplitFields(rows[i]);
		// The age is either "n/a" or up to three "<n>h <n>m <n>s" tokens.
		if (f.size() < 5 || f.size() > 7)
			throw ParseException(fmt("Malformed ARP table row: '%s'",
			rows[i].c_str()));
		ArpEntry e;
		e.ip = f[0];
		e.mac = f[1];
		e.interface = f[2];
		std::string age;
		for (size_t j = 4; j < f.size(); ++j)
			age += f[j];
		e.age = ParseArpAge(age);
		entries.push_back(e);
	}
	return entries;
}


InterfaceConfigMap ParseInterfaceConfigs(const std::string& running_config) {
	static const pcrecpp::RE iface1("interface\\s+(.+?)\\s*");
	static const pcrecpp::RE descr1("description:?\\s+(?:\"(.*?)\"|(\\S.*?))\\s*");
	InterfaceConfigMap configs;
	std::vector< std::string > lines = SplitLines(running_config);
	std::string name;
	bool in_block = false;
	bool admin_seen = false;
	InterfaceConfig cur;
	for (size_t i = 0; i < lines.size(); ++i) {
		std::string line = Trim(lines[i]);
		if (!in_block) {
			if (iface1.FullMatch(line, &name)) {
				in_block = true;
				admin_seen = false;
				cur = InterfaceConfig();
			}
			continue;
		}
		if (line == "exit") {
			configs[name] = cur;
			in_block = false;
			continue;
		}
		std::string quoted;
		std::string bare;
		if (cur.description.empty() && descr1.FullMatch(line, &quoted, &bare))
			cur.description = quoted.empty() ? bare : quoted;
		// The first admin-state statement in the block decides.
		if (!admin_seen && line == "shutdown") {
			cur.enabled = false;
			admin_seen = true;
		} else if (!admin_seen && line == "no shutdown") {
			admin_seen = true;
		}
	}
	return configs;
}

static std::string RequiredField(const std::string& block,
const std::string& label) {
	std::string value;
	if (!FieldValue(block, label, &value) || value.empty())
		throw ParseException(fmt("Interface output lacks '%s':\n%s",
		label.c_str(), block.c_str()));
	return value;
}

std::vector< InterfaceRecord > ParseInterfaces(const std::string& text,
const std::string& running_config) {
	InterfaceConfigMap configs = ParseInterfaceConfigs(running_config);
	std::vector< InterfaceRecord > ifaces;
	std::set< std::string > seen;
	std::vector< std::string > blocks = SplitBlocks(text);
	for (size_t i = 0; i < blocks.size(); ++i) {
		InterfaceRecord r;
		r.name = RequiredField(blocks[i], "Interface Name");
		if (!seen.insert(r.name).second)
			throw ParseException(fmt("Interface %s listed twice", r.name.c_str()));
		r.is_up = (RequiredField(blocks[i], "Link Status") == "Up");
		r.speed = ParseSpeed(RequiredField(blocks[i], "Port Speed"));
		r.mac_address = RequiredField(blocks[i], "L3 MAC Address");
		InterfaceConfigMap::const_iterator fd = configs.find(r.name);
		if (fd != configs.end()) {
			r.description = fd->second.description;
			r.is_enabled = fd->second.enabled;
		}
		ifaces.push_back(r);
	}
	return ifaces;
}

std::vector< std::string > ParseInterfaceNames(const std::string& text) {
	std::vector< std::string > names;
	std::vector< std::string > blocks = SplitBlocks(text);
	for (size_t i = 0; i < blocks.size(); ++i)
		names.push_back(RequiredField(blocks[i], "Interface Name"));
	return names;
}


// Column offsets of show lldp remote-device all
static const size_t LLDP_COL_IFACE = 0;
static const size_t LLDP_COL_REMID = 10;
static const size_t LLDP_COL_PORT = 38;
static const size_t LLDP_COL_PORT_END = 55;
static const size_t LLDP_COL_NAME = 57;

LldpNeighborMap ParseLldpNeighbors(const std::string& text) {
	LldpNeighborMap result;
	std::vector< std::string > rows = TableRows(text, "LLDP remote device");
	for (size_t i = 0; i < rows.size(); ++i) {
		std::string iface = Column(rows[i], LLDP_COL_IFACE, LLDP_COL_REMID);
		if (iface.empty())
			throw ParseException(fmt("LLDP row without a local interface: '%s'",
			rows[i].c_str()));
		// A local port with nothing learned on it.
		if (Column(rows[i], LLDP_COL_REMID).empty())
			continue;
		LldpNeighbor n;
		n.port = Column(rows[i], LLDP_COL_PORT, LLDP_COL_PORT_END);
		n.hostname = Column(rows[i], LLDP_COL_NAME);
		result[iface].push_back(n);
	}
	return result;
}

LldpCapabilitySet ParseLldpCapabilities(const std::string& list) {
	LldpCapabilitySet caps;
	std::string::size_type start = 0;
	while (start <= list.length()) {
		std::string::size_type comma = list.find(',', start);
		if (comma == std::string::npos)
			comma = list.length();
		std::string name = Lower(Trim(list.substr(start, comma - start)));
		start = comma + 1;
		if (name.empty() || name == "not advertised" || name == "none")
			continue;
		if (name == "bridge")
			caps.insert(CAP_BRIDGE);
		else if (name == "router")
			caps.insert(CAP_ROUTER);
		else if (name == "wlan access point" || name == "wlan-ap")
			caps.insert(CAP_WLAN_AP);
		else if (name == "station only" || name == "station-only")
			caps.insert(CAP_STATION_ONLY);
		else
			Log()->warn("Skipping unknown LLDP capability '{}'", name);
	}
	return caps;
}

struct LldpOptionalField {
	const char* label;
	std::string LldpNeighborDetail::* member;
};

/* Everything but the chassis ID may be missing from a neighbor's
 * advertisement; these default to the empty string.
 */
static const LldpOptionalField s_lldp_optional[] = {
	{"Local Interface", &LldpNeighborDetail::local_interface},
	{"System Name", &LldpNeighborDetail::remote_system_name},
	{"Port ID", &LldpNeighborDetail::remote_port},
	{"Port Description", &LldpNeighborDetail::remote_port_description},
	{"System Description", &LldpNeighborDetail::remote_system_description},
	{0, 0}
};

LldpNeighborDetail ParseLldpNeighborDetail(const std::string& text) {
	LldpNeighborDetail d;
	if (!FieldValue(text, "Chassis ID", &d.remote_chassis_id)
	|| d.remote_chassis_id.empty())
		throw ParseException("LLDP neighbor detail lacks a Chassis ID");
	for (const LldpOptionalField* f = s_lldp_optional; f->label; ++f) {
		std::string value;
		d.*(f->member) = FieldValue(text, f->label, &value) ? value
		: std::string();
	}
	std::string caps;
	if (FieldValue(text, "System Capabilities Supported", &caps))
		d.remote_system_capabilities = ParseLldpCapabilities(caps);
	caps.clear();
	if (FieldValue(text, "System Capabilities Enabled", &caps))
		d.remote_system_enabled_capabilities = ParseLldpCapabilities(caps);
	return d;
}


// Token index of the 60 second column in "Total CPU Utilization 5s 60s 300s".
static const size_t CPU_ONE_MINUTE_FIELD = 4;

EnvironmentFacts ParseEnvironment(const std::string& text) {
	EnvironmentFacts env;
	env.cpu[0].usage = 0.0;

	bool have_alloc = false;
	bool have_free = false;
	long long used = 0;
	long long avail = 0;
	std::vector< std::string > lines = SplitLines(text);
	for (size_t i = 0; i < lines.size(); ++i) {
		std::vector< std::string > f = SplitFields(lines[i]);
		if (lines[i].find("Total CPU Utilization") != std::string::npos) {
			if (f.size() <= CPU_ONE_MINUTE_FIELD)
				throw ParseException(fmt("Malformed CPU utilization line: '%s'",
				lines[i].c_str()));
			std::string pct = f[CPU_ONE_MINUTE_FIELD];
			if (!pct.empty() && pct[pct.length() - 1] == '%')
				pct.erase(pct.length() - 1);
			char* end = 0;
			double usage = strtod(pct.c_str(), &end);
			if (pct.empty() || *end != '\0')
				throw ParseException(fmt("Invalid CPU utilization: '%s'",
				f[CPU_ONE_MINUTE_FIELD].c_str()));
			env.cpu[0].usage = usage;
		} else if (f.size() >= 2 && f[0] == "alloc") {
			used += ParseCount(f[1], "allocated memory");
			have_alloc = true;
		} else if (f.size() >= 2 && f[0] == "free") {
			avail += ParseCount(f[1], "free memory");
			have_free = true;
		}
	}
	if (!have_alloc || !have_free)
		throw ParseException("Memory utilization report not found");
	env.memory.used_ram = used;
	env.memory.available_ram = used + avail;

	// The OS exposes no sensor, PSU or fan telemetry through this command.
	env.temperature[EnvironmentFacts::PLACEHOLDER_KEY] = TemperatureSensor();
	env.power[EnvironmentFacts::PLACEHOLDER_KEY] = PowerSupply();
	env.fans[EnvironmentFacts::PLACEHOLDER_KEY] = Fan();
	return env;
}


NtpPeerMap ParseNtpPeers(const std::string& text) {
	static const pcrecpp::RE host1("Host Address:\\s+(\\S+)");
	NtpPeerMap peers;
	pcrecpp::StringPiece input(text);
	std::string host;
	while (host1.FindAndConsume(&input, &host))
		peers[host] = NtpPeer();
	return peers;
}


DeviceFacts ParseFacts(const std::string& version, const std::string& system,
const std::string& running_config, const std::string& interfaces) {
	static const pcrecpp::RE hostname1("hostname\\s+\"?([^\"\\s]+)\"?\\s*");
	static const pcrecpp::RE domain1("ip domain[- ]name\\s+(\\S+)\\s*");
	DeviceFacts facts;
	facts.vendor = "Dell";

	FieldValue(version, "System Model ID", &facts.model);
	if (facts.model.empty())
		FieldValue(system, "System Model ID", &facts.model);
	FieldValue(version, "Serial Number", &facts.serial_number);

	// unit  active  backup  current-active  next-active
	std::vector< std::string > rows;
	try {
		rows = TableRows(version, "version");
	} catch (const ParseException&) {
		// Single-image units print no image table.
	}
	if (!rows.empty()) {
		std::vector< std::string > f = SplitFields(rows[0]);
		if (f.size() >= 4)
			facts.os_version = f[3];
		else if (f.size() >= 2)
			facts.os_version = f[1];
	}
	if (facts.os_version.empty())
		FieldValue(version, "Software Version", &facts.os_version);

	std::string uptime;
	if (FieldValue(system, "System Up Time", &uptime))
		facts.uptime = ParseUptime(uptime);

	FieldValue(system, "System Name", &facts.hostname);
	std::string domain;
	std::vector< std::string > lines = SplitLines(running_config);
	for (size_t i = 0; i < lines.size(); ++i) {
		std::string line = Trim(lines[i]);
		std::string v;
		if (facts.hostname.empty() && hostname1.FullMatch(line, &v))
			facts.hostname = v;
		else if (domain.empty() && domain1.FullMatch(line, &v))
			domain = v;
	}
	facts.fqdn = facts.hostname;
	if (!facts.hostname.empty() && !domain.empty())
		facts.fqdn = facts.hostname + "." + domain;

	facts.interface_list = ParseInterfaceNames(interfaces);
	return facts;
}


std::string ParseFileSystem(const std::string& text) {
	static const pcrecpp::RE dir1("Directory of (\\S+?)/");
	std::string fs;
	if (!dir1.PartialMatch(text, &fs))
		return std::string();
	return fs;
}

} // namespace dnostool
