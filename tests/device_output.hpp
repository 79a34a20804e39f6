/* File: device_output.hpp
 *
 * Captured-style output of an N2048 running 6.3, shared by the parser and
 * driver tests.
 */
#ifndef DNOSTOOL_TESTS_DEVICE_OUTPUT_HPP_INC
#define DNOSTOOL_TESTS_DEVICE_OUTPUT_HPP_INC


#include <string>


namespace dnostool {
namespace testdata {

inline std::string Pad(const std::string& s, size_t width) {
	std::string ret(s);
	if (ret.length() < width)
		ret.append(width - ret.length(), ' ');
	return ret;
}

// One row of "show lldp remote-device all", laid out on the device's columns.
inline std::string LldpRow(const std::string& iface, const std::string& remid,
const std::string& chassis, const std::string& port, const std::string& name) {
	return Pad(iface, 10) + Pad(remid, 8) + Pad(chassis, 20) + Pad(port, 19)
	+ name;
}

inline std::string LldpSummary() {
	return
		"LLDP Remote Device Summary\n"
		"\n"
		"Local\n"
		"Interface RemID   Chassis ID          Port ID           System Name\n"
		"--------- ------- ------------------- ----------------- -----------------\n"
		+ LldpRow("Gi1/0/1", "1", "F8:B1:56:65:6A:4B", "Gi1/0/48", "core sw 1") + "\n"
		+ LldpRow("Gi1/0/2", "", "", "", "") + "\n"
		+ LldpRow("Gi1/0/3", "2", "00:11:22:33:44:55", "eth0", "") + "\n"
		+ LldpRow("Gi1/0/3", "3", "00:11:22:33:44:66", "eth1", "host-b") + "\n";
}

inline std::string LldpDetailGi1() {
	return
		"LLDP Remote Device Detail\n"
		"\n"
		"Local Interface: Gi1/0/1\n"
		"\n"
		"Remote Identifier: 1\n"
		"Chassis ID Subtype: MAC Address\n"
		"Chassis ID: F8:B1:56:65:6A:4B\n"
		"Port ID Subtype: Interface Name\n"
		"Port ID: Gi1/0/48\n"
		"System Name: core-sw-1\n"
		"System Description: Dell Networking N3048, 6.3.0.16\n"
		"Port Description: Uplink to access\n"
		"System Capabilities Supported: bridge, router\n"
		"System Capabilities Enabled: bridge\n"
		"Time to Live: 110 seconds\n";
}

inline std::string LldpDetailGi3() {
	return
		"LLDP Remote Device Detail\n"
		"\n"
		"Local Interface: Gi1/0/3\n"
		"\n"
		"Remote Identifier: 2\n"
		"Chassis ID Subtype: MAC Address\n"
		"Chassis ID: 00:11:22:33:44:55\n"
		"Port ID Subtype: MAC Address\n"
		"Port ID: 00:11:22:33:44:55\n"
		"System Capabilities Supported: station only\n"
		"System Capabilities Enabled: station only\n";
}

inline std::string MacTable() {
	return
		"Aging time is 300 Sec\n"
		"\n"
		"Vlan     Mac Address           Type        Port\n"
		"-------- --------------------- ----------- ---------------------\n"
		"1        0025.90C2.88ED        Dynamic     Gi1/0/48\n"
		"1        F48E.3841.9628        Management  Vl1\n"
		"20       0050.5687.1A2B        Static      Gi1/0/3\n"
		"\n"
		"Total MAC Addresses in use: 3\n";
}

inline std::string ArpTable() {
	return
		"Age Time (seconds)............................. 1200\n"
		"Response Time (seconds)........................ 1\n"
		"Retries........................................ 4\n"
		"Cache Size..................................... 2048\n"
		"Total Entry Count Current / Peak .............. 2 / 7\n"
		"\n"
		"IP Address      MAC Address        Interface         Type     Age\n"
		"--------------- ------------------ ----------------- -------- -----------\n"
		"10.0.0.1        0025.90C2.88ED     Vl1               Dynamic  0h 1m 2s\n"
		"10.0.0.2        F48E.3841.9628     Vl1               Local    n/a\n";
}

inline std::string Interfaces() {
	return
		"Interface Name : .............................. Gi1/0/1\n"
		"SOC Hardware Info : ........................... BCM56340_A0\n"
		"Link Status : ................................. Up\n"
		"Keepalive Enabled ............................. FALSE\n"
		"Port Speed : .................................. 1000\n"
		"Burned In MAC Address ......................... F8B1.5665.6A4C\n"
		"L3 MAC Address................................. F8B1.5665.6A4B\n"
		"\n"
		"Interface Name : .............................. Gi1/0/2\n"
		"SOC Hardware Info : ........................... BCM56340_A0\n"
		"Link Status : ................................. Down\n"
		"Port Speed : .................................. Unknown\n"
		"L3 MAC Address................................. F8B1.5665.6A4B\n"
		"\n"
		"Interface Name : .............................. Gi1/0/3\n"
		"Link Status : ................................. Up\n"
		"Port Speed : .................................. 10000\n"
		"L3 MAC Address................................. F8B1.5665.6A4B\n";
}

inline std::string RunningConfig() {
	return
		"!Current Configuration:\n"
		"!System Description \"Dell Networking N2048, 6.3.0.16, Linux 3.6.5\"\n"
		"!System Software Version 6.3.0.16\n"
		"!\n"
		"configure\n"
		"hostname \"sw1\"\n"
		"ip domain-name example.net\n"
		"!\n"
		"interface Gi1/0/1\n"
		"description \"Uplink to core\"\n"
		"no shutdown\n"
		"exit\n"
		"!\n"
		"interface Gi1/0/2\n"
		"description spare\n"
		"shutdown\n"
		"exit\n"
		"!\n"
		"exit\n";
}

inline std::string ProcessCpu() {
	return
		"Memory Utilization Report\n"
		"\n"
		"status      bytes\n"
		"------ ----------\n"
		" free   170642432\n"
		" alloc  298144768\n"
		"\n"
		"CPU Utilization:\n"
		"\n"
		"  PID      Name                    5 Secs     60 Secs   300 Secs\n"
		"-----------------------------------------------------------------\n"
		" 3a8a68   tNet0                    0.00%      0.01%      0.02%\n"
		"------------------------------\n"
		"Total CPU Utilization              9.26%      9.75%      9.72%\n";
}

inline std::string Version() {
	return
		"Machine Description............... Dell Networking Switch\n"
		"System Model ID................... N2048\n"
		"Machine Type...................... Dell Networking N2048\n"
		"Serial Number..................... CN0ABCDE282984AB1234\n"
		"Burned In MAC Address............. F8B1.5665.6A4B\n"
		"\n"
		"unit active      backup      current-active next-active\n"
		"---- ----------- ----------- -------------- --------------\n"
		"1    6.3.0.16    6.3.0.15    6.3.0.16       6.3.0.16\n";
}

inline std::string System() {
	return
		"System Description: Dell Networking Switch\n"
		"System Up Time: 12 days, 04h:15m:23s\n"
		"System Contact:\n"
		"System Name: sw1\n"
		"System Location:\n"
		"Burned In MAC Address: F8B1.5665.6A4B\n"
		"System Model ID: N2048\n";
}

inline std::string SntpServers() {
	return
		"Server Host Address:           10.1.1.1\n"
		"Server Type:                   IPv4\n"
		"Server Stratum:                2\n"
		"\n"
		"Server Host Address:           ntp.example.net\n"
		"Server Type:                   DNS\n";
}

} // namespace testdata
} // namespace dnostool

#endif // DNOSTOOL_TESTS_DEVICE_OUTPUT_HPP_INC
