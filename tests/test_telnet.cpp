extern "C" {
#include <unistd.h>
}
#include <stdexcept>
#include <thread>

#include <catch2/catch.hpp>

#include "common.hpp"
#include "loopback.hpp"
#include "telnet_terminal.hpp"

using namespace dnostool;


/* The device end of a Telnet login, run on its own thread. Results are
 * checked on the test thread after join().
 */
struct TelnetDevice {
	LoopbackListener& listener;
	bool accept_login;
	std::string user;
	std::string password;
	std::string command;
	std::string logout;
	std::string error;

	TelnetDevice(LoopbackListener& l, bool accept)
	 : listener(l),
	 accept_login(accept)
	{}

	void Run() {
		int sock = -1;
		try {
			sock = listener.Accept();
			WriteAll(sock, "User:");
			user = ReadUntil(sock, "\r");
			WriteAll(sock, "\r\nPassword:");
			password = ReadUntil(sock, "\r");
			if (!accept_login) {
				WriteAll(sock, "\r\nUser:");
			} else {
				WriteAll(sock, "\r\nswitch#");
				command = ReadUntil(sock, "\r");
				WriteAll(sock, command + "\r\nswitch#");
				ReadUntil(sock, "\xff\xf1"); // liveness probe: IAC NOP
				logout = ReadUntil(sock, "\r");
			}
		} catch (const std::exception& e) {
			error = e.what();
		}
		if (sock >= 0)
			close(sock);
	}
};

struct JoinOnExit {
	std::thread& th;
	explicit JoinOnExit(std::thread& t) : th(t) {}
	~JoinOnExit() {
		if (th.joinable())
			th.join();
	}
};

static SessionParams LoopbackParams(const LoopbackListener& listener) {
	SessionParams params;
	params.host = "127.0.0.1";
	params.username = "admin";
	params.password = "pw";
	params.timeout = 5;
	params.opts.port = listener.Port();
	return params;
}


TEST_CASE("Telnet logs in and notices the device hanging up", "[telnet]") {
	LoopbackListener listener;
	TelnetDevice device(listener, true);
	std::thread th(&TelnetDevice::Run, &device);
	JoinOnExit joiner(th);

	TelnetTerminal term(LoopbackParams(listener));
	term.Open();
	REQUIRE(term.IsAlive());
	// The device hangs up once it sees this line.
	term.WriteRaw("logout\r");
	th.join();
	REQUIRE(device.logout == "logout");
	REQUIRE(device.error.empty());
	REQUIRE(device.user == "admin");
	REQUIRE(device.password == "pw");
	REQUIRE(device.command == "terminal length 0");

	REQUIRE_FALSE(term.IsAlive());
	term.Close();
	REQUIRE_FALSE(term.IsAlive());
}

TEST_CASE("A rejected Telnet login is a connection failure", "[telnet]") {
	LoopbackListener listener;
	TelnetDevice device(listener, false);
	std::thread th(&TelnetDevice::Run, &device);
	JoinOnExit joiner(th);

	TelnetTerminal term(LoopbackParams(listener));
	REQUIRE_THROWS_AS(term.Open(), ConnectionException);
	th.join();
	REQUIRE(device.error.empty());
	REQUIRE(device.user == "admin");
	REQUIRE_FALSE(term.IsAlive());
}
