#include <vector>

#include "control.hpp"
#include "boss.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "factstree.hpp"
#include "log.hpp"
#include "table.hpp"


namespace dnostool {

void ExecuteCommand(const Boss& boss, NetworkDriver& driver,
const std::string& cmd, const std::string& args) {
	if (cmd == "open") {
		driver.Open();
		boss.SendPropTree("result", PropTree("1"));
	} else if (cmd == "close") {
		driver.Close();
		boss.SendPropTree("result", PropTree("1"));
	} else if (cmd == "is-alive") {
		PropTree alive;
		alive["is_alive"] = driver.IsAlive() ? "1" : "0";
		boss.SendPropTree("result", alive);
	} else if (cmd == "get-config") {
		boss.SendPropTree("config",
		ToPropTree(driver.GetConfig(ParseConfigSelector(args))));
	} else if (cmd == "get-environment") {
		boss.SendPropTree("environment", ToPropTree(driver.GetEnvironment()));
	} else if (cmd == "get-mac-address-table") {
		boss.SendPropTree("mac_address_table",
		ToPropTree(driver.GetMacAddressTable()));
	} else if (cmd == "get-arp-table") {
		boss.SendPropTree("arp_table", ToPropTree(driver.GetArpTable()));
	} else if (cmd == "get-interfaces") {
		boss.SendPropTree("interfaces", ToPropTree(driver.GetInterfaces()));
	} else if (cmd == "get-lldp-neighbors") {
		boss.SendPropTree("lldp_neighbors", ToPropTree(driver.GetLldpNeighbors()));
	} else if (cmd == "get-lldp-neighbor-detail") {
		boss.SendPropTree("lldp_neighbors_detail",
		ToPropTree(driver.GetLldpNeighborDetail(args)));
	} else if (cmd == "get-ntp-peers") {
		boss.SendPropTree("ntp_peers", ToPropTree(driver.GetNtpPeers()));
	} else if (cmd == "get-facts") {
		boss.SendPropTree("facts", ToPropTree(driver.GetFacts()));
	} else if (cmd == "passthru") {
		if (args.empty())
			throw DriverError("Must provide a command to pass through");
		std::vector< std::string > lines = SplitLines(driver.SendCommand(args));
		for (size_t i = 0; i < lines.size(); ++i)
			boss.SendLine(lines[i]);
		boss.SendOutputFinished();
	} else
		throw DriverError(fmt("Not implemented: %s", cmd.c_str()));
}

void ServeCommands(Boss& boss, NetworkDriver& driver) {
	PropTree op;
	while (true) {
		op = boss.GetOp();
		if (op.ChildExists("end"))
			return;
		if (!op.ChildExists("command"))
			throw DriverError("Command expected");
		try {
			ExecuteCommand(boss, driver, op["command"], op["args"]);
		} catch (const DriverError& e) {
			Log()->error("{}: {}", op["command"].GetData(), e.what());
			boss.SendError(e.what());
		}
	}
}

} // namespace dnostool
