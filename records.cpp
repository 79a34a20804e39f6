#include "records.hpp"
#include "common.hpp"


namespace dnostool {

const char* EnvironmentFacts::PLACEHOLDER_KEY = "invalid";

const char* CapabilityName(LldpCapability cap) {
	switch (cap) {
		case CAP_BRIDGE:
			return "Bridge";
		case CAP_ROUTER:
			return "Router";
		case CAP_WLAN_AP:
			return "WLAN-AP";
		case CAP_STATION_ONLY:
			return "Station-only";
	}
	return "";
}

ConfigSelector ParseConfigSelector(const std::string& name) {
	if (name.empty() || name == "all")
		return CONFIG_ALL;
	if (name == "running")
		return CONFIG_RUNNING;
	if (name == "startup")
		return CONFIG_STARTUP;
	throw DriverError(fmt("Invalid config selector: '%s'", name.c_str()));
}

} // namespace dnostool
