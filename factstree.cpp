#include <sstream>

#include "factstree.hpp"


namespace dnostool {

static std::string Num(long long v) {
	std::ostringstream ss;
	ss << v;
	return ss.str();
}

static std::string Num(double v) {
	std::ostringstream ss;
	ss << v;
	return ss.str();
}

static std::string Bool(bool b) {
	return b ? "1" : "0";
}

static PropTree CapabilityList(const LldpCapabilitySet& caps) {
	PropTree list;
	list.SetArray();
	for (LldpCapabilitySet::const_iterator it = caps.begin();
	it != caps.end();
	++it)
		list.ArrayPushBack(CapabilityName(*it));
	return list;
}


PropTree ToPropTree(const ConfigBundle& configs) {
	PropTree t;
	t["startup"] = configs.startup;
	t["running"] = configs.running;
	t["candidate"] = configs.candidate;
	return t;
}

PropTree ToPropTree(const EnvironmentFacts& env) {
	PropTree t;
	t["cpu"].SetObject();
	for (std::map< int, CpuUsage >::const_iterator it = env.cpu.begin();
	it != env.cpu.end();
	++it)
		t["cpu"][Num(static_cast< long long >(it->first))]["%usage"]
		= Num(it->second.usage);
	t["memory"]["used_ram"] = Num(env.memory.used_ram);
	t["memory"]["available_ram"] = Num(env.memory.available_ram);
	t["temperature"].SetObject();
	t["power"].SetObject();
	t["fans"].SetObject();
	for (std::map< std::string, TemperatureSensor >::const_iterator it
	= env.temperature.begin();
	it != env.temperature.end();
	++it) {
		PropTree& s = t["temperature"][it->first];
		s["is_alert"] = Bool(it->second.is_alert);
		s["is_critical"] = Bool(it->second.is_critical);
		s["temperature"] = Num(it->second.temperature);
	}
	for (std::map< std::string, PowerSupply >::const_iterator it
	= env.power.begin();
	it != env.power.end();
	++it) {
		PropTree& p = t["power"][it->first];
		p["status"] = Bool(it->second.status);
		p["output"] = Num(it->second.output);
		p["capacity"] = Num(it->second.capacity);
	}
	for (std::map< std::string, Fan >::const_iterator it = env.fans.begin();
	it != env.fans.end();
	++it)
		t["fans"][it->first]["status"] = Bool(it->second.status);
	return t;
}

PropTree ToPropTree(const std::vector< MacTableEntry >& entries) {
	PropTree t;
	t.SetArray();
	for (size_t i = 0; i < entries.size(); ++i) {
		PropTree e;
		e["mac"] = entries[i].mac;
		e["interface"] = entries[i].interface;
		e["vlan"] = Num(static_cast< long long >(entries[i].vlan));
		e["static"] = Bool(entries[i].is_static);
		e["active"] = Bool(entries[i].active);
		e["moves"] = Num(static_cast< long long >(entries[i].moves));
		e["last_move"] = Num(entries[i].last_move);
		t.ArrayPushBack(e);
	}
	return t;
}

PropTree ToPropTree(const std::vector< ArpEntry >& entries) {
	PropTree t;
	t.SetArray();
	for (size_t i = 0; i < entries.size(); ++i) {
		PropTree e;
		e["interface"] = entries[i].interface;
		e["mac"] = entries[i].mac;
		e["ip"] = entries[i].ip;
		e["age"] = Num(entries[i].age);
		t.ArrayPushBack(e);
	}
	return t;
}

PropTree ToPropTree(const std::vector< InterfaceRecord >& ifaces) {
	PropTree t;
	t.SetObject();
	for (size_t i = 0; i < ifaces.size(); ++i) {
		PropTree& r = t[ifaces[i].name];
		r["is_up"] = Bool(ifaces[i].is_up);
		r["is_enabled"] = Bool(ifaces[i].is_enabled);
		r["description"] = ifaces[i].description;
		r["last_flapped"] = Num(ifaces[i].last_flapped);
		r["speed"] = Num(static_cast< long long >(ifaces[i].speed));
		r["mac_address"] = ifaces[i].mac_address;
	}
	return t;
}

PropTree ToPropTree(const LldpNeighborMap& neighbors) {
	PropTree t;
	t.SetObject();
	for (LldpNeighborMap::const_iterator it = neighbors.begin();
	it != neighbors.end();
	++it) {
		PropTree& list = t[it->first];
		list.SetArray();
		for (size_t i = 0; i < it->second.size(); ++i) {
			PropTree n;
			if (it->second[i].hostname.empty())
				n["hostname"].SetNull();
			else
				n["hostname"] = it->second[i].hostname;
			n["port"] = it->second[i].port;
			list.ArrayPushBack(n);
		}
	}
	return t;
}

PropTree ToPropTree(const std::vector< LldpNeighborDetail >& details) {
	PropTree t;
	t.SetObject();
	for (size_t i = 0; i < details.size(); ++i) {
		const LldpNeighborDetail& d = details[i];
		PropTree n;
		n["remote_chassis_id"] = d.remote_chassis_id;
		n["remote_system_name"] = d.remote_system_name;
		n["remote_port"] = d.remote_port;
		n["remote_port_description"] = d.remote_port_description;
		n["remote_system_description"] = d.remote_system_description;
		n["remote_system_capab"] = CapabilityList(d.remote_system_capabilities);
		n["remote_system_enable_capab"]
		= CapabilityList(d.remote_system_enabled_capabilities);
		t[d.local_interface].ArrayPushBack(n);
	}
	return t;
}

PropTree ToPropTree(const NtpPeerMap& peers) {
	PropTree t;
	t.SetObject();
	for (NtpPeerMap::const_iterator it = peers.begin(); it != peers.end(); ++it)
		t[it->first].SetObject();
	return t;
}

PropTree ToPropTree(const DeviceFacts& facts) {
	PropTree t;
	t["uptime"] = Num(facts.uptime);
	t["vendor"] = facts.vendor;
	t["model"] = facts.model;
	t["hostname"] = facts.hostname;
	t["fqdn"] = facts.fqdn;
	t["os_version"] = facts.os_version;
	t["serial_number"] = facts.serial_number;
	PropTree& list = t["interface_list"];
	list.SetArray();
	for (size_t i = 0; i < facts.interface_list.size(); ++i)
		list.ArrayPushBack(facts.interface_list[i]);
	return t;
}

} // namespace dnostool
