#include <catch2/catch.hpp>

#include "canonical.hpp"
#include "common.hpp"

using namespace dnostool;


TEST_CASE("MAC addresses in every separator style canonicalize alike", "[canonical][mac]") {
	REQUIRE(CanonicalMac("0025.90C2.88ED") == "00:25:90:C2:88:ED");
	REQUIRE(CanonicalMac("00:25:90:c2:88:ed") == "00:25:90:C2:88:ED");
	REQUIRE(CanonicalMac("00-25-90-C2-88-ED") == "00:25:90:C2:88:ED");
	REQUIRE(CanonicalMac("002590c288ed") == "00:25:90:C2:88:ED");
	REQUIRE(CanonicalMac("25.90C2.88ED") == "00:25:90:C2:88:ED");
	REQUIRE(CanonicalMac("0:25:90:c2:88:ed") == "00:25:90:C2:88:ED");
}

TEST_CASE("MAC canonicalization is idempotent", "[canonical][mac]") {
	const char* inputs[] = {
		"0025.90C2.88ED", "f4:8e:38:41:96:28", "F48E-3841-9628", "garbage", ""
	};
	for (size_t i = 0; i < sizeof(inputs) / sizeof(inputs[0]); ++i) {
		std::string once = CanonicalMac(inputs[i]);
		REQUIRE(CanonicalMac(once) == once);
	}
}

TEST_CASE("Unrecognized MAC text passes through unchanged", "[canonical][mac]") {
	REQUIRE(CanonicalMac("n/a") == "n/a");
	REQUIRE(CanonicalMac("0025.90C2") == "0025.90C2");
	REQUIRE(CanonicalMac("00:25:90:C2:88:GG") == "00:25:90:C2:88:GG");
}

TEST_CASE("Abbreviated interface names expand to the long form", "[canonical][interface]") {
	REQUIRE(CanonicalInterfaceName("Gi1/0/48") == "GigabitEthernet1/0/48");
	REQUIRE(CanonicalInterfaceName("Te1/0/1") == "TenGigabitEthernet1/0/1");
	REQUIRE(CanonicalInterfaceName("Po1") == "Port-Channel1");
	REQUIRE(CanonicalInterfaceName("Vl1") == "Vlan1");
	REQUIRE(CanonicalInterfaceName("Fo2/0/1") == "FortyGigabitEthernet2/0/1");
	REQUIRE(CanonicalInterfaceName("GigabitEthernet1/0/48") == "GigabitEthernet1/0/48");
}

TEST_CASE("Unknown interface names pass through unchanged", "[canonical][interface]") {
	REQUIRE(CanonicalInterfaceName("oob") == "oob");
	REQUIRE(CanonicalInterfaceName("Xy1/0/1") == "Xy1/0/1");
	REQUIRE(CanonicalInterfaceName("") == "");
}

TEST_CASE("Interface speed", "[canonical][numeric]") {
	REQUIRE(ParseSpeed("Unknown") == 0);
	REQUIRE(ParseSpeed("1000") == 1000);
	REQUIRE(ParseSpeed(" 10000 ") == 10000);
	REQUIRE_THROWS_AS(ParseSpeed("fast"), ParseException);
	REQUIRE_THROWS_AS(ParseSpeed(""), ParseException);
}

TEST_CASE("ARP age", "[canonical][numeric]") {
	REQUIRE(ParseArpAge("n/a") == -1.0);
	REQUIRE(ParseArpAge("2h30m15s") == 9015.0);
	REQUIRE(ParseArpAge("0h 1m 2s") == 62.0);
	REQUIRE(ParseArpAge("45s") == 45.0);
	REQUIRE_THROWS_AS(ParseArpAge("soon"), ParseException);
	REQUIRE_THROWS_AS(ParseArpAge(""), ParseException);
}

TEST_CASE("VLAN IDs are range checked", "[canonical][numeric]") {
	REQUIRE(ParseVlan("1") == 1);
	REQUIRE(ParseVlan("4095") == 4095);
	REQUIRE_THROWS_AS(ParseVlan("4096"), ParseException);
	REQUIRE_THROWS_AS(ParseVlan("-1"), ParseException);
	REQUIRE_THROWS_AS(ParseVlan("vl1"), ParseException);
}

TEST_CASE("Uptime in both renderings", "[canonical][numeric]") {
	REQUIRE(ParseUptime("12 days, 04h:15m:23s") == 1052123.0);
	REQUIRE(ParseUptime("0 days 1 hours 2 minutes 3 seconds") == 3723.0);
	REQUIRE(ParseUptime("00h:00m:09s") == 9.0);
	REQUIRE_THROWS_AS(ParseUptime("a while"), ParseException);
}
