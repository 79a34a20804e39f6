#ifndef DNOSTOOL_OPTIONS_HPP_INC
#define DNOSTOOL_OPTIONS_HPP_INC


#include <string>

#include "common.hpp"


namespace dnostool {

class PropTree;

/* Knobs handed to the SSH/Telnet session. */
struct TransportOptions {
	int port;                   // 0: 22 for SSH, 23 for Telnet
	std::string secret;         // enable password
	bool verbose;
	int keepalive;              // seconds between SSH keepalives, 0 disables
	double global_delay_factor; // scales the read timeout
	bool use_keys;
	std::string key_file;
	bool ssh_strict;            // reject unknown or mismatched host keys
	bool system_host_keys;      // check against ~/.ssh/known_hosts
	bool alt_host_keys;         // check against alt_key_file
	std::string alt_key_file;
	std::string ssh_config_file;
	bool allow_agent;

	TransportOptions() :
	port(0),
	verbose(false),
	keepalive(30),
	global_delay_factor(1.0),
	use_keys(false),
	ssh_strict(false),
	system_host_keys(false),
	alt_host_keys(false),
	allow_agent(false)
	{}
};

struct DriverOptions {
	Protocol transport;
	std::string candidate_cfg;
	std::string merge_cfg;
	std::string rollback_cfg;
	bool inline_transfer;
	std::string dest_file_system; // empty: autodetect
	bool auto_rollback_on_error;
	bool auto_file_prompt;
	bool canonical_int;
	// Throw instead of returning the last rejection text when no variant works.
	bool strict_command_variants;
	TransportOptions transport_opts;

	DriverOptions() :
	transport(PROTO_SSH),
	candidate_cfg("candidate_config.txt"),
	merge_cfg("merge_config.txt"),
	rollback_cfg("rollback_config.txt"),
	inline_transfer(false),
	auto_rollback_on_error(true),
	auto_file_prompt(true),
	canonical_int(false),
	strict_command_variants(false)
	{}

	/* Reads the "optional-args" object of a host description. Telnet has no
	 * out-of-band copy, so it always forces inline_transfer on.
	 */
	static DriverOptions FromPropTree(const PropTree& args);

	int Port() const {
		return transport_opts.port > 0 ? transport_opts.port
		: DefaultPort(transport);
	}
};

Protocol ParseProtocol(const std::string& name);


/* The subset of an OpenSSH client config that applies to one host. Empty
 * strings and a zero port mean "not set".
 */
struct SshConfigEntry {
	std::string hostname;
	std::string user;
	std::string identity_file;
	int port;

	SshConfigEntry() : port(0) {}
};

// "~/x" becomes "$HOME/x"; anything else is returned as is.
std::string ExpandHome(const std::string& path);

SshConfigEntry ParseSshConfig(const std::string& text, const std::string& host);
SshConfigEntry LoadSshConfig(const std::string& path, const std::string& host);

} // namespace dnostool

#endif // DNOSTOOL_OPTIONS_HPP_INC
