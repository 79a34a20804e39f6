#include "driver.hpp"
#include "common.hpp"


namespace dnostool {

std::map< std::string, DriverFactory* >* NetworkDriver::GetFactories() {
	static std::map< std::string, DriverFactory* > factories;
	return &factories;
}

NetworkDriver* NetworkDriver::Construct(const PropTree& phost) {
	std::string type = phost.GetString("type");
	std::map< std::string, DriverFactory* >::const_iterator fd
	= GetFactories()->find(type);
	if (fd == GetFactories()->end())
		throw DriverError(fmt("No driver for device type '%s'", type.c_str()));
	return fd->second->Construct(phost);
}

} // namespace dnostool
