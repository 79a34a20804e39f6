#include "dnos6.hpp"
#include "canonical.hpp"
#include "common.hpp"
#include "dispatcher.hpp"
#include "log.hpp"
#include "parsers.hpp"
#include "terminal.hpp"


namespace dnostool {

static DriverFactoryRegistrant< Dnos6Driver > r("dnos6");


Dnos6Driver* Dnos6Driver::FromPropTree(const PropTree& phost) {
	std::string hostname = phost.GetString("hostname");
	if (hostname.empty())
		throw DriverError("Must supply a hostname or IP address for a DNOS6 switch");
	return new Dnos6Driver(
		hostname,
		phost.GetString("username"),
		phost.GetString("password"),
		phost.GetInt("timeout", 60),
		DriverOptions::FromPropTree(phost["optional-args"])
	);
}

Dnos6Driver::Dnos6Driver(const std::string& hostname,
const std::string& username, const std::string& password, int timeout,
const DriverOptions& opts)
	: m_hostname(hostname),
	m_username(username),
	m_password(password),
	m_timeout(timeout),
	m_opts(opts),
	m_term(0),
	m_dispatcher(0)
{
	if (m_opts.transport == PROTO_TELNET)
		m_opts.inline_transfer = true;
}

Dnos6Driver::~Dnos6Driver() {
	Close();
}

Terminal* Dnos6Driver::CreateTerminal() {
	SessionParams params;
	params.host = m_hostname;
	params.username = m_username;
	params.password = m_password;
	params.timeout = m_timeout;
	params.opts = m_opts.transport_opts;
	params.opts.port = m_opts.Port();
	return Terminal::Create(m_opts.transport, params);
}

void Dnos6Driver::Open() {
	Close();
	Terminal* term = CreateTerminal();
	try {
		term->Open();
	} catch (...) {
		delete term;
		throw;
	}
	m_term = term;
	m_dispatcher = new CommandDispatcher(*m_term, m_opts.strict_command_variants);
}

void Dnos6Driver::Close() {
	delete m_dispatcher;
	m_dispatcher = 0;
	if (m_term) {
		m_term->Close();
		delete m_term;
		m_term = 0;
	}
}

bool Dnos6Driver::IsAlive() {
	if (!m_term)
		return false;
	return m_term->IsAlive();
}

void Dnos6Driver::DropSession(const ConnectionClosedException& e) {
	Log()->error("{}: session lost, closing it: {}", m_hostname, e.what());
	Close();
}

std::string Dnos6Driver::Run(const std::string& cmd) {
	return Run(std::vector< std::string >(1, cmd));
}

std::string Dnos6Driver::Run(const std::vector< std::string >& variants) {
	if (!m_dispatcher)
		throw ConnectionClosedException(fmt("No open session to %s",
		m_hostname.c_str()));
	try {
		return m_dispatcher->Send(variants);
	} catch (const ConnectionClosedException& e) {
		DropSession(e);
		throw;
	}
}

std::string Dnos6Driver::Canon(const std::string& iface) const {
	if (!m_opts.canonical_int)
		return iface;
	return CanonicalInterfaceName(iface);
}

std::string Dnos6Driver::SendCommand(const std::string& cmd) {
	if (!m_term)
		throw ConnectionClosedException(fmt("No open session to %s",
		m_hostname.c_str()));
	try {
		return m_term->SendCommand(cmd);
	} catch (const ConnectionClosedException& e) {
		DropSession(e);
		throw;
	}
}


ConfigBundle Dnos6Driver::GetConfig(ConfigSelector which) {
	ConfigBundle configs;
	if (which == CONFIG_ALL || which == CONFIG_STARTUP)
		configs.startup = Run("show startup-config");
	if (which == CONFIG_ALL || which == CONFIG_RUNNING)
		configs.running = Run("show running-config");
	return configs;
}

EnvironmentFacts Dnos6Driver::GetEnvironment() {
	std::vector< std::string > cpu_cmds;
	cpu_cmds.push_back("show process cpu");
	cpu_cmds.push_back("show proc cpu");
	return ParseEnvironment(Run(cpu_cmds));
}

std::vector< MacTableEntry > Dnos6Driver::GetMacAddressTable() {
	std::vector< MacTableEntry > entries
	= ParseMacAddressTable(Run("show mac address-table"));
	for (size_t i = 0; i < entries.size(); ++i) {
		entries[i].mac = CanonicalMac(entries[i].mac);
		entries[i].interface = Canon(entries[i].interface);
	}
	return entries;
}

std::vector< ArpEntry > Dnos6Driver::GetArpTable() {
	std::vector< ArpEntry > entries = ParseArpTable(Run("show arp"));
	for (size_t i = 0; i < entries.size(); ++i) {
		entries[i].mac = CanonicalMac(entries[i].mac);
		entries[i].interface = Canon(entries[i].interface);
	}
	return entries;
}

std::vector< InterfaceRecord > Dnos6Driver::GetInterfaces() {
	std::string config = Run("show running-config");
	std::vector< InterfaceRecord > ifaces
	= ParseInterfaces(Run("show interfaces"), config);
	for (size_t i = 0; i < ifaces.size(); ++i) {
		ifaces[i].name = Canon(ifaces[i].name);
		ifaces[i].mac_address = CanonicalMac(ifaces[i].mac_address);
	}
	return ifaces;
}

LldpNeighborMap Dnos6Driver::GetLldpNeighbors() {
	LldpNeighborMap raw
	= ParseLldpNeighbors(Run("show lldp remote-device all"));
	if (!m_opts.canonical_int)
		return raw;
	LldpNeighborMap result;
	for (LldpNeighborMap::const_iterator it = raw.begin(); it != raw.end(); ++it) {
		std::vector< LldpNeighbor >& dest = result[Canon(it->first)];
		dest.insert(dest.end(), it->second.begin(), it->second.end());
	}
	return result;
}

LldpNeighborDetail Dnos6Driver::GetLldpNeighborDetailIface(
const std::string& iface) {
	LldpNeighborDetail d = ParseLldpNeighborDetail(
		Run("show lldp remote-device detail " + iface));
	if (d.local_interface.empty())
		d.local_interface = iface;
	d.local_interface = Canon(d.local_interface);
	return d;
}

std::vector< LldpNeighborDetail > Dnos6Driver::GetLldpNeighborDetail(
const std::string& interface) {
	std::vector< LldpNeighborDetail > details;
	if (!interface.empty()) {
		details.push_back(GetLldpNeighborDetailIface(interface));
		return details;
	}
	// The device's own names are needed for the detail command.
	LldpNeighborMap neighs
	= ParseLldpNeighbors(Run("show lldp remote-device all"));
	for (LldpNeighborMap::const_iterator it = neighs.begin();
	it != neighs.end();
	++it)
		details.push_back(GetLldpNeighborDetailIface(it->first));
	return details;
}

NtpPeerMap Dnos6Driver::GetNtpPeers() {
	return ParseNtpPeers(Run("show sntp server"));
}

DeviceFacts Dnos6Driver::GetFacts() {
	std::string version = Run("show version");
	std::string system = Run("show system");
	std::string config = Run("show running-config");
	std::string ifaces = Run("show interfaces");
	DeviceFacts facts = ParseFacts(version, system, config, ifaces);
	for (size_t i = 0; i < facts.interface_list.size(); ++i)
		facts.interface_list[i] = Canon(facts.interface_list[i]);
	return facts;
}

std::string Dnos6Driver::GetDestFileSystem() {
	if (!m_opts.dest_file_system.empty())
		return m_opts.dest_file_system;
	std::string fs = ParseFileSystem(Run("dir"));
	if (fs.empty())
		throw CommandErrorException(
			"File system autodetection failed, set dest_file_system");
	Log()->debug("{}: destination file system is {}", m_hostname, fs);
	return fs;
}

} // namespace dnostool
