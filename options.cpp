#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

extern "C" {
#include <fnmatch.h>
}
#include <pcrecpp.h>

#include "options.hpp"
#include "proptree.hpp"


namespace dnostool {

Protocol ParseProtocol(const std::string& name) {
	if (name == "ssh")
		return PROTO_SSH;
	if (name == "telnet")
		return PROTO_TELNET;
	throw DriverError(fmt("Invalid transport: '%s' (expected ssh or telnet)",
	name.c_str()));
}

DriverOptions DriverOptions::FromPropTree(const PropTree& args) {
	DriverOptions o;
	o.transport = ParseProtocol(args.GetString("transport", "ssh"));
	o.candidate_cfg = args.GetString("candidate_cfg", o.candidate_cfg);
	o.merge_cfg = args.GetString("merge_cfg", o.merge_cfg);
	o.rollback_cfg = args.GetString("rollback_cfg", o.rollback_cfg);
	o.inline_transfer = args.GetBool("inline_transfer", o.inline_transfer);
	if (o.transport == PROTO_TELNET)
		o.inline_transfer = true;
	o.dest_file_system = args.GetString("dest_file_system");
	o.auto_rollback_on_error = args.GetBool("auto_rollback_on_error",
	o.auto_rollback_on_error);
	o.auto_file_prompt = args.GetBool("auto_file_prompt", o.auto_file_prompt);
	o.canonical_int = args.GetBool("canonical_int", o.canonical_int);
	o.strict_command_variants = args.GetBool("strict_command_variants",
	o.strict_command_variants);

	TransportOptions& t = o.transport_opts;
	t.port = args.GetInt("port", t.port);
	if (t.port < 0 || t.port > 65535)
		throw DriverError(fmt("Invalid port: %d", t.port));
	t.secret = args.GetString("secret");
	t.verbose = args.GetBool("verbose", t.verbose);
	t.keepalive = args.GetInt("keepalive", t.keepalive);
	t.global_delay_factor = args.GetDouble("global_delay_factor",
	t.global_delay_factor);
	if (t.global_delay_factor <= 0)
		throw DriverError("global_delay_factor must be positive");
	t.use_keys = args.GetBool("use_keys", t.use_keys);
	t.key_file = args.GetString("key_file");
	t.ssh_strict = args.GetBool("ssh_strict", t.ssh_strict);
	t.system_host_keys = args.GetBool("system_host_keys", t.system_host_keys);
	t.alt_host_keys = args.GetBool("alt_host_keys", t.alt_host_keys);
	t.alt_key_file = args.GetString("alt_key_file");
	t.ssh_config_file = args.GetString("ssh_config_file");
	t.allow_agent = args.GetBool("allow_agent", t.allow_agent);
	return o;
}


static std::string Lower(std::string s) {
	for (size_t i = 0; i < s.length(); ++i)
		s[i] = static_cast< char >(tolower(static_cast< unsigned char >(s[i])));
	return s;
}

std::string ExpandHome(const std::string& path) {
	if (path.substr(0, 2) != "~/")
		return path;
	const char* home = getenv("HOME");
	if (!home)
		return path;
	return std::string(home) + path.substr(1);
}

SshConfigEntry ParseSshConfig(const std::string& text, const std::string& host) {
	SshConfigEntry entry;
	pcrecpp::RE kv1("\\s*([A-Za-z]+)\\s*(?:=|\\s)\\s*(.*?)\\s*");
	std::istringstream in(text);
	std::string line;
	// Options before the first Host line apply to every host.
	bool applies = true;
	while (std::getline(in, line)) {
		size_t hash = line.find('#');
		if (hash != std::string::npos)
			line.erase(hash);
		std::string key;
		std::string val;
		if (!kv1.FullMatch(line, &key, &val))
			continue;
		key = Lower(key);
		if (key == "host") {
			applies = false;
			std::istringstream pats(val);
			std::string pat;
			while (pats >> pat) {
				bool negate = (pat[0] == '!');
				if (negate)
					pat.erase(0, 1);
				if (fnmatch(pat.c_str(), host.c_str(), 0) == 0) {
					if (negate) {
						applies = false;
						break;
					}
					applies = true;
				}
			}
			continue;
		}
		if (!applies)
			continue;
		// First obtained value wins, as with the OpenSSH client.
		if (key == "hostname" && entry.hostname.empty())
			entry.hostname = val;
		else if (key == "user" && entry.user.empty())
			entry.user = val;
		else if (key == "identityfile" && entry.identity_file.empty())
			entry.identity_file = ExpandHome(val);
		else if (key == "port" && entry.port == 0)
			entry.port = atoi(val.c_str());
	}
	return entry;
}

SshConfigEntry LoadSshConfig(const std::string& path, const std::string& host) {
	std::ifstream f(ExpandHome(path).c_str());
	if (!f)
		throw ConnectionException(fmt("Unable to read ssh config file '%s'",
		path.c_str()));
	std::ostringstream ss;
	ss << f.rdbuf();
	return ParseSshConfig(ss.str(), host);
}

} // namespace dnostool
