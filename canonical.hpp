#ifndef DNOSTOOL_CANONICAL_HPP_INC
#define DNOSTOOL_CANONICAL_HPP_INC


#include <string>


namespace dnostool {

/* "0025.90c2.88ed", "00-25-90-C2-88-ED", "0:25:90:c2:88:ed" and
 * "002590c288ed" all become "00:25:90:C2:88:ED". Input that is not a MAC
 * address is returned unchanged.
 */
std::string CanonicalMac(const std::string& mac);

/* Expands a known abbreviation ("Gi1/0/48", "te1/0/1", "Po 3") to the long
 * form ("GigabitEthernet1/0/48"). Unknown names are returned unchanged.
 */
std::string CanonicalInterfaceName(const std::string& name);

// "Unknown" is 0; anything else must be a plain integer (Mbps).
long ParseSpeed(const std::string& speed);

/* "n/a" is -1.0; otherwise hour/minute/second components such as
 * "2h30m15s" or "0h 4m 18s", summed to seconds.
 */
double ParseArpAge(const std::string& age);

int ParseVlan(const std::string& vlan);

/* "12 days, 04h:17m:23s" to seconds. */
double ParseUptime(const std::string& uptime);

std::string Trim(const std::string& s);

} // namespace dnostool

#endif // DNOSTOOL_CANONICAL_HPP_INC
