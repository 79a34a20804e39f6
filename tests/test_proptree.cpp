#include <catch2/catch.hpp>

#include "common.hpp"
#include "proptree.hpp"

using namespace dnostool;


TEST_CASE("JSON objects, arrays and scalars", "[proptree]") {
	PropTree t = PropTree::FromJson(
		"{\"host\": {\"type\": \"dnos6\", \"timeout\": 30, \"strict\": false,"
		" \"peers\": [\"a\", \"b\"], \"none\": null}}");
	const PropTree& host = t["host"];
	REQUIRE(host.GetString("type") == "dnos6");
	REQUIRE(host.GetInt("timeout", 0) == 30);
	REQUIRE_FALSE(host.GetBool("strict", true));
	REQUIRE(host["peers"].IsArray());
	REQUIRE(host["peers"].Size() == 2);
	REQUIRE(host["peers"].at(1).GetData() == "b");
	REQUIRE(host.GetString("none", "x") == "");
	REQUIRE(host.GetString("missing", "dflt") == "dflt");
}

TEST_CASE("Malformed JSON", "[proptree]") {
	REQUIRE_THROWS_AS(PropTree::FromJson("{\"a\": "), DriverError);
}

TEST_CASE("Typed reads reject junk", "[proptree]") {
	PropTree t;
	t["n"] = "twelve";
	REQUIRE_THROWS_AS(t.GetInt("n", 0), DriverError);
	REQUIRE_THROWS_AS(t.GetDouble("n", 0.0), DriverError);
	REQUIRE_THROWS_AS(t.GetBool("n", false), DriverError);
}

TEST_CASE("Trees serialize in insertion order", "[proptree]") {
	PropTree t;
	t["b"] = "1";
	t["a"]["x"] = "y";
	t["list"].ArrayPushBack(PropTree("p"));
	t["list"].ArrayPushBack(PropTree("q\"r"));
	REQUIRE(t.ToJson() == "{\"b\":\"1\",\"a\":{\"x\":\"y\"},\"list\":[\"p\",\"q\\\"r\"]}");

	PropTree back = PropTree::FromJson(t.ToJson());
	REQUIRE(back["a"]["x"].GetData() == "y");
	REQUIRE(back["list"].at(1).GetData() == "q\"r");
}

TEST_CASE("Null and empty containers survive a round trip", "[proptree]") {
	std::string json = "{\"a\":null,\"b\":{},\"c\":[],\"d\":\"\"}";
	PropTree t = PropTree::FromJson(json);
	REQUIRE(t["a"].GetKind() == PropTree::KIND_NULL);
	REQUIRE(t["b"].GetKind() == PropTree::KIND_OBJECT);
	REQUIRE(t["c"].GetKind() == PropTree::KIND_ARRAY);
	REQUIRE(t.ToJson() == json);

	t["a"] = "set";
	REQUIRE(t["a"].GetKind() == PropTree::KIND_STRING);
	REQUIRE(t["a"].ToJson() == "\"set\"");
}
