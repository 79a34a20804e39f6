/* File: driver.hpp
 *
 * The fact-retrieval contract every device family implements. Drivers
 * register themselves under a type name with a static
 * DriverFactoryRegistrant and are constructed from the "host" object of the
 * control channel.
 */
#ifndef DNOSTOOL_DRIVER_HPP_INC
#define DNOSTOOL_DRIVER_HPP_INC


#include <map>
#include <string>
#include <vector>

#include "records.hpp"
#include "proptree.hpp"


namespace dnostool {

struct DriverFactory;


class NetworkDriver {
public:
	static NetworkDriver* Construct(const PropTree& phost);

	static std::map< std::string, DriverFactory* >* GetFactories();

	virtual ~NetworkDriver() {}

	virtual void Open() = 0;
	virtual void Close() = 0;
	// False before Open() and after the session is lost.
	virtual bool IsAlive() = 0;

	virtual ConfigBundle GetConfig(ConfigSelector which) = 0;
	virtual EnvironmentFacts GetEnvironment() = 0;
	virtual std::vector< MacTableEntry > GetMacAddressTable() = 0;
	virtual std::vector< ArpEntry > GetArpTable() = 0;
	virtual std::vector< InterfaceRecord > GetInterfaces() = 0;
	virtual LldpNeighborMap GetLldpNeighbors() = 0;
	/* An empty interface fans out over every interface with a neighbor;
	 * otherwise exactly one record is returned, for that interface.
	 */
	virtual std::vector< LldpNeighborDetail > GetLldpNeighborDetail(
		const std::string& interface = std::string()) = 0;
	virtual NtpPeerMap GetNtpPeers() = 0;
	virtual DeviceFacts GetFacts() = 0;

	// Raw output of an arbitrary CLI command.
	virtual std::string SendCommand(const std::string& cmd) = 0;
};


struct DriverFactory {
	virtual ~DriverFactory() {}
	virtual NetworkDriver* Construct(const PropTree& phost) = 0;
};

template< class T >
struct DriverFactoryRegistrant : public DriverFactory {
	DriverFactoryRegistrant(const std::string& type) {
		NetworkDriver::GetFactories()->insert(
			std::pair< std::string, DriverFactory* >(type, this)
		);
	}
	virtual NetworkDriver* Construct(const PropTree& phost) {
		return T::FromPropTree(phost);
	}
};

} // namespace dnostool

#endif // DNOSTOOL_DRIVER_HPP_INC
