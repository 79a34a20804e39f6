#include <catch2/catch.hpp>

#include "factstree.hpp"
#include "parsers.hpp"
#include "device_output.hpp"

using namespace dnostool;


TEST_CASE("Environment reports placeholders for missing telemetry", "[factstree]") {
	PropTree t = ToPropTree(ParseEnvironment(testdata::ProcessCpu()));
	REQUIRE(t["memory"].GetString("used_ram") == "298144768");
	REQUIRE(t["memory"].GetString("available_ram") == "468787200");
	REQUIRE(t["cpu"].ChildExists("0"));

	const PropTree& temp = t["temperature"]["invalid"];
	REQUIRE(temp.GetString("is_alert") == "0");
	REQUIRE(temp.GetString("is_critical") == "0");
	REQUIRE(temp.GetString("temperature") == "-1");
	const PropTree& psu = t["power"]["invalid"];
	REQUIRE(psu.GetString("status") == "1");
	REQUIRE(psu.GetString("output") == "-1");
	REQUIRE(psu.GetString("capacity") == "-1");
	REQUIRE(t["fans"]["invalid"].GetString("status") == "1");
}

TEST_CASE("Facts not read from the device keep their sentinels", "[factstree]") {
	DeviceFacts facts;
	REQUIRE(ToPropTree(facts).ToJson() ==
		"{\"uptime\":\"-1\",\"vendor\":\"\",\"model\":\"\",\"hostname\":\"\","
		"\"fqdn\":\"\",\"os_version\":\"\",\"serial_number\":\"\","
		"\"interface_list\":[]}");

	facts.interface_list.push_back("Gi1/0/1");
	REQUIRE(ToPropTree(facts)["interface_list"].at(0).GetData() == "Gi1/0/1");
}

TEST_CASE("Empty collections keep their JSON type", "[factstree]") {
	REQUIRE(ToPropTree(std::vector< MacTableEntry >()).ToJson() == "[]");
	REQUIRE(ToPropTree(std::vector< ArpEntry >()).ToJson() == "[]");
	REQUIRE(ToPropTree(std::vector< InterfaceRecord >()).ToJson() == "{}");
	REQUIRE(ToPropTree(LldpNeighborMap()).ToJson() == "{}");
	REQUIRE(ToPropTree(NtpPeerMap()).ToJson() == "{}");

	NtpPeerMap peers;
	peers["10.1.1.1"];
	REQUIRE(ToPropTree(peers).ToJson() == "{\"10.1.1.1\":{}}");
}

TEST_CASE("An unnamed LLDP neighbor has a null hostname", "[factstree]") {
	LldpNeighborMap neighbors;
	LldpNeighbor n;
	n.port = "gi0/1";
	neighbors["Gi1/0/1"].push_back(n);
	n.hostname = "core-1";
	neighbors["Gi1/0/2"].push_back(n);
	REQUIRE(ToPropTree(neighbors).ToJson() ==
		"{\"Gi1/0/1\":[{\"hostname\":null,\"port\":\"gi0/1\"}],"
		"\"Gi1/0/2\":[{\"hostname\":\"core-1\",\"port\":\"gi0/1\"}]}");
}

TEST_CASE("LLDP detail capability lists are arrays even when empty", "[factstree]") {
	std::vector< LldpNeighborDetail > details(1);
	details[0].local_interface = "Gi1/0/1";
	details[0].remote_chassis_id = "00:11:22:33:44:55";
	details[0].remote_system_capabilities.insert(CAP_BRIDGE);
	PropTree t = ToPropTree(details);
	const PropTree& d = t["Gi1/0/1"].at(0);
	REQUIRE(d["remote_system_capab"].at(0).GetData() == "Bridge");
	REQUIRE(d["remote_system_enable_capab"].ToJson() == "[]");
}
