/* File: records.hpp
 *
 * Typed facts returned by a driver. Every retrieval builds fresh records and
 * hands them to the caller; nothing here is cached by the driver. Numeric
 * fields the device does not report carry a sentinel (-1 or -1.0), never an
 * uninitialized value.
 */
#ifndef DNOSTOOL_RECORDS_HPP_INC
#define DNOSTOOL_RECORDS_HPP_INC

#include <map>
#include <set>
#include <string>
#include <vector>


namespace dnostool {

struct InterfaceRecord {
	std::string name;
	bool is_up;
	bool is_enabled;
	std::string description;
	double last_flapped;
	long speed; // Mbps, 0 when unknown
	std::string mac_address;

	InterfaceRecord() :
	is_up(false),
	is_enabled(true),
	last_flapped(-1.0),
	speed(0)
	{}
};

struct MacTableEntry {
	std::string mac;
	std::string interface;
	int vlan;
	bool is_static;
	bool active;
	int moves;
	double last_move;

	MacTableEntry() :
	vlan(0),
	is_static(false),
	active(false),
	moves(-1),
	last_move(-1.0)
	{}
};

struct ArpEntry {
	std::string interface;
	std::string mac;
	std::string ip;
	double age; // seconds, -1.0 for "n/a"

	ArpEntry() : age(-1.0) {}
};

struct LldpNeighbor {
	std::string hostname; // empty when the neighbor advertises no name
	std::string port;
};
typedef std::map< std::string, std::vector< LldpNeighbor > > LldpNeighborMap;

enum LldpCapability {
	CAP_BRIDGE = 0,
	CAP_ROUTER,
	CAP_WLAN_AP,
	CAP_STATION_ONLY
};
typedef std::set< LldpCapability > LldpCapabilitySet;

const char* CapabilityName(LldpCapability cap);

struct LldpNeighborDetail {
	std::string local_interface;
	std::string remote_chassis_id;
	std::string remote_system_name;
	std::string remote_port;
	std::string remote_port_description;
	std::string remote_system_description;
	LldpCapabilitySet remote_system_capabilities;
	LldpCapabilitySet remote_system_enabled_capabilities;
};

struct CpuUsage {
	double usage; // percent
	CpuUsage() : usage(0.0) {}
};

struct MemoryUsage {
	long long used_ram;
	// Reported as used + free, i.e. the device's total memory.
	long long available_ram;
	MemoryUsage() : used_ram(0), available_ram(0) {}
};

struct TemperatureSensor {
	bool is_alert;
	bool is_critical;
	double temperature;
	TemperatureSensor() : is_alert(false), is_critical(false), temperature(-1.0) {}
};

struct PowerSupply {
	bool status;
	double output;
	double capacity;
	PowerSupply() : status(true), output(-1.0), capacity(-1.0) {}
};

struct Fan {
	bool status;
	Fan() : status(true) {}
};

/* Subsystems the device does not expose are reported under the key
 * PLACEHOLDER_KEY with default-constructed (sentinel) values.
 */
struct EnvironmentFacts {
	static const char* PLACEHOLDER_KEY;

	std::map< int, CpuUsage > cpu;
	MemoryUsage memory;
	std::map< std::string, TemperatureSensor > temperature;
	std::map< std::string, PowerSupply > power;
	std::map< std::string, Fan > fans;
};

struct NtpPeer {
};
typedef std::map< std::string, NtpPeer > NtpPeerMap;

enum ConfigSelector {
	CONFIG_ALL = 0,
	CONFIG_RUNNING,
	CONFIG_STARTUP
};

ConfigSelector ParseConfigSelector(const std::string& name);

struct ConfigBundle {
	std::string startup;
	std::string running;
	std::string candidate; // the device has no candidate configuration
};

struct DeviceFacts {
	double uptime;
	std::string vendor;
	std::string model;
	std::string hostname;
	std::string fqdn;
	std::string os_version;
	std::string serial_number;
	std::vector< std::string > interface_list;

	DeviceFacts() : uptime(-1.0) {}
};

} // namespace dnostool

#endif // DNOSTOOL_RECORDS_HPP_INC
