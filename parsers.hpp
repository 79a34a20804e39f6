/* File: parsers.hpp
 *
 * One parser per fact type. Each takes the raw text of a show command and
 * returns typed records, or throws ParseException when output it depends on
 * is missing or malformed. Optional fields that are absent are left at
 * their defaults. Parsers never touch the network; MAC and interface name
 * canonicalization is applied by the driver afterwards.
 */
#ifndef DNOSTOOL_PARSERS_HPP_INC
#define DNOSTOOL_PARSERS_HPP_INC

#include <map>
#include <string>
#include <vector>

#include "records.hpp"


namespace dnostool {

// show mac address-table: Vlan, Mac Address, Type, Port
std::vector< MacTableEntry > ParseMacAddressTable(const std::string& text);

// show arp: IP Address, MAC Address, Interface, Type, Age
std::vector< ArpEntry > ParseArpTable(const std::string& text);

struct InterfaceConfig {
	std::string description;
	bool enabled;
	InterfaceConfig() : enabled(true) {}
};
typedef std::map< std::string, InterfaceConfig > InterfaceConfigMap;

// interface ... exit blocks of show running-config
InterfaceConfigMap ParseInterfaceConfigs(const std::string& running_config);

/* show interfaces, one paragraph per interface, merged with the running
 * configuration for description and admin state. Interfaces without a
 * config block are enabled with an empty description.
 */
std::vector< InterfaceRecord > ParseInterfaces(const std::string& text,
const std::string& running_config);
std::vector< std::string > ParseInterfaceNames(const std::string& text);

// show lldp remote-device all (fixed columns)
LldpNeighborMap ParseLldpNeighbors(const std::string& text);

// show lldp remote-device detail <interface>
LldpNeighborDetail ParseLldpNeighborDetail(const std::string& text);
LldpCapabilitySet ParseLldpCapabilities(const std::string& list);

// show process cpu: CPU utilization and memory report
EnvironmentFacts ParseEnvironment(const std::string& text);

// show sntp server
NtpPeerMap ParseNtpPeers(const std::string& text);

DeviceFacts ParseFacts(const std::string& version, const std::string& system,
const std::string& running_config, const std::string& interfaces);

// dir: the "Directory of <fs>/" header, or empty
std::string ParseFileSystem(const std::string& text);

} // namespace dnostool

#endif // DNOSTOOL_PARSERS_HPP_INC
