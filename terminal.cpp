extern "C" {
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
}
#include <cstring>

#include "terminal.hpp"
#include "ssh_terminal.hpp"
#include "telnet_terminal.hpp"
#include "log.hpp"


namespace dnostool {

const char* Terminal::REGEX_USER = "[a-zA-Z0-9_.-]+> ?";
const char* Terminal::REGEX_ROOT = "[a-zA-Z0-9_.-]+(\\([a-zA-Z0-9_-]+\\))?# ?";
const char* Terminal::REGEX_MORE = ".*--More--.*";


Terminal* Terminal::Create(Protocol proto, const SessionParams& params) {
	if (proto == PROTO_TELNET)
		return new TelnetTerminal(params);
	return new SshTerminal(params);
}

Terminal::Terminal(const SessionParams& params)
	: m_params(params),
	m_prompt_regex(std::string("(?:") + REGEX_USER + ")|(?:" + REGEX_ROOT + ")"),
	m_cont_regex(REGEX_MORE)
{
}

void Terminal::Open() {
	Log()->info("Connecting to {} via {}", m_params.host,
	ProtocolName(GetProtocol()));
	try {
		std::string prompt = Connect();
		Enable(prompt);
		Execute("terminal length 0");
	} catch (const ConnectionClosedException& e) {
		Close();
		throw ConnectionException(e.what());
	} catch (...) {
		Close();
		throw;
	}
	Log()->info("Session to {} is at the privileged prompt", m_params.host);
}

void Terminal::Enable(const std::string& prompt) {
	pcrecpp::RE root1(REGEX_ROOT);
	if (root1.FullMatch(prompt)) {
		SetPromptRegex(REGEX_ROOT);
		return;
	}
	pcrecpp::RE password1("Password: ?");
	SetPromptRegex(std::string("(?:Password: ?)|(?:") + REGEX_ROOT + ")|(?:"
	+ REGEX_USER + ")");
	std::string line = Execute("enable");
	if (password1.FullMatch(line)) {
		try {
			line = Execute(m_params.opts.secret);
		} catch (const ConnectionClosedException&) {
			throw ConnectionException("Timeout or invalid enable secret");
		}
	}
	if (!root1.FullMatch(line))
		throw ConnectionException("Failed to enter privileged mode, check the enable secret");
	SetPromptRegex(REGEX_ROOT);
}

void Terminal::SetPromptRegex(const std::string& reg) {
	m_prompt_regex = pcrecpp::RE(reg);
}

void Terminal::SetContinuationRegex(const std::string& reg) {
	m_cont_regex = pcrecpp::RE(reg);
}

std::string Terminal::Execute(const std::string& cmd, DataCallback* dcb) {
	WriteRaw(cmd + "\r");
	// Skip the echo of the command itself.
	while (GetChar() != '\n')
		;
	return WaitForPrompt(dcb);
}

std::string Terminal::WaitForPrompt(DataCallback* dcb) {
	std::string buf;
	char c;
	while (true) {
		c = GetChar();
		if (c == 8) {
			if (buf.length() > 0)
				buf.erase(buf.length() - 1);
			continue;
		}
		if (c == 0) {
			buf.clear();
			continue;
		}
		if (c == '\n') {
			if (dcb)
				dcb->OnData(buf);
			buf.clear();
			continue;
		}
		if (c == '\r')
			continue;
		buf += c;
		if (m_prompt_regex.FullMatch(buf))
			return buf;
		if (m_cont_regex.FullMatch(buf)) {
			WriteRaw(" ");
			buf.clear();
		}
	}
}

struct CollectCB : public DataCallback {
	std::string text;
	bool first;
	CollectCB() : first(true) {}
	virtual void OnData(const std::string& data) {
		if (!first)
			text += '\n';
		text += data;
		first = false;
	}
};

std::string Terminal::SendCommand(const std::string& cmd) {
	Log()->debug("{}: {}", m_params.host, cmd);
	CollectCB ccb;
	Execute(cmd, &ccb);
	return ccb.text;
}

int Terminal::ReadTimeout() const {
	int secs = static_cast< int >(m_params.timeout
	* m_params.opts.global_delay_factor);
	return secs > 0 ? secs : 1;
}

int Terminal::ConnectTcp(const std::string& host, int port) {
	struct addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	struct addrinfo* res = 0;
	std::string portstr = fmt("%d", port);
	int rc = getaddrinfo(host.c_str(), portstr.c_str(), &hints, &res);
	if (rc != 0)
		throw ConnectionException(fmt("Failed to resolve %s: %s",
		host.c_str(), gai_strerror(rc)));
	int sock = -1;
	for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
		sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
		if (sock < 0)
			continue;
		if (connect(sock, ai->ai_addr, ai->ai_addrlen) == 0)
			break;
		close(sock);
		sock = -1;
	}
	freeaddrinfo(res);
	if (sock < 0)
		throw ConnectionException(fmt("Failed to connect to %s on port %d",
		host.c_str(), port));
	return sock;
}

} // namespace dnostool
