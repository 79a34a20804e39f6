#ifndef DNOSTOOL_DNOS6_HPP_INC
#define DNOSTOOL_DNOS6_HPP_INC


#include <string>
#include <vector>

#include "common.hpp"
#include "driver.hpp"
#include "options.hpp"


namespace dnostool {

class Terminal;
class CommandDispatcher;

/* Dell Networking OS 6 (N-series and PowerConnect) switches. */
class Dnos6Driver : public NetworkDriver {
public:
	static Dnos6Driver* FromPropTree(const PropTree& phost);

	Dnos6Driver(const std::string& hostname, const std::string& username,
	const std::string& password, int timeout, const DriverOptions& opts);
	virtual ~Dnos6Driver();

	virtual void Open();
	virtual void Close();
	virtual bool IsAlive();

	virtual ConfigBundle GetConfig(ConfigSelector which);
	virtual EnvironmentFacts GetEnvironment();
	virtual std::vector< MacTableEntry > GetMacAddressTable();
	virtual std::vector< ArpEntry > GetArpTable();
	virtual std::vector< InterfaceRecord > GetInterfaces();
	virtual LldpNeighborMap GetLldpNeighbors();
	virtual std::vector< LldpNeighborDetail > GetLldpNeighborDetail(
		const std::string& interface = std::string());
	virtual NtpPeerMap GetNtpPeers();
	virtual DeviceFacts GetFacts();

	virtual std::string SendCommand(const std::string& cmd);

	/* Where config files are staged. The dest_file_system option wins;
	 * otherwise it is read from the header of "dir", and a device that does
	 * not print one is a CommandErrorException.
	 */
	std::string GetDestFileSystem();

	const DriverOptions& GetOptions() const {
		return m_opts;
	}

protected:
	// Overridden by tests to run against a scripted session.
	virtual Terminal* CreateTerminal();

private:
	Dnos6Driver(const Dnos6Driver&);
	Dnos6Driver& operator = (const Dnos6Driver&);

	/* Sends through the dispatcher. A lost session is closed before the
	 * ConnectionClosedException propagates, so late output from it can
	 * never be read as the reply to a later command.
	 */
	std::string Run(const std::string& cmd);
	std::string Run(const std::vector< std::string >& variants);
	void DropSession(const ConnectionClosedException& e);
	std::string Canon(const std::string& iface) const;
	LldpNeighborDetail GetLldpNeighborDetailIface(const std::string& iface);

	std::string m_hostname;
	std::string m_username;
	std::string m_password;
	int m_timeout;
	DriverOptions m_opts;

	Terminal* m_term;
	CommandDispatcher* m_dispatcher;
};

} // namespace dnostool

#endif // DNOSTOOL_DNOS6_HPP_INC
