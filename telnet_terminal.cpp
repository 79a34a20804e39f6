extern "C" {
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <errno.h>
}
#include <cstring>

#include "telnet_terminal.hpp"
#include "log.hpp"


namespace dnostool {

static const telnet_telopt_t my_telopts[] = {
	{TELNET_TELOPT_ECHO, TELNET_WONT, TELNET_DO},
	{-1, 0, 0}
};


void TelnetTerminal::TelnetEventHandler(telnet_t* telnet, telnet_event_t* ev,
void* ud) {
	(void)telnet;
	TelnetTerminal* t = static_cast< TelnetTerminal* >(ud);
	switch (ev->type) {
		case TELNET_EV_DATA:
			for (size_t i = 0; i < ev->data.size; ++i)
				t->m_telbuffer.push(ev->data.buffer[i]);
			break;
		case TELNET_EV_SEND:
			t->SendSocket(ev->data.buffer, ev->data.size);
			break;
		case TELNET_EV_ERROR:
			if (t->m_error.empty())
				t->m_error = fmt("TELNET error: %s", ev->error.msg);
			break;
		default:
			break;
	}
}


TelnetTerminal::TelnetTerminal(const SessionParams& params)
	: Terminal(params),
	m_sock(-1),
	m_tel(0)
{
}
TelnetTerminal::~TelnetTerminal() {
	Close();
}

std::string TelnetTerminal::Connect() {
	int port = m_params.opts.port > 0 ? m_params.opts.port : 23;
	m_sock = ConnectTcp(m_params.host, port);
	m_tel = telnet_init(my_telopts, TelnetEventHandler, 0, this);
	if (!m_tel)
		throw ConnectionException("Failed to allocate libtelnet handler");

	pcrecpp::RE cli1(std::string("(?:") + REGEX_USER + ")|(?:" + REGEX_ROOT + ")");
	pcrecpp::RE user1("(User|Username|login): ?");
	SetPromptRegex(std::string("(?:(User|Username|login|Password): ?)|(?:")
	+ REGEX_USER + ")|(?:" + REGEX_ROOT + ")");
	std::string line = WaitForPrompt();
	bool sent_password = false;
	while (!cli1.FullMatch(line)) {
		if (sent_password)
			throw ConnectionException(fmt("Telnet login to %s failed",
			m_params.host.c_str()));
		if (user1.FullMatch(line)) {
			WriteRaw(m_params.username + "\r");
		} else {
			WriteRaw(m_params.password + "\r");
			sent_password = true;
		}
		line = WaitForPrompt();
	}
	return line;
}

void TelnetTerminal::Close() {
	if (m_tel) {
		telnet_free(m_tel);
		m_tel = 0;
	}
	if (m_sock >= 0) {
		close(m_sock);
		m_sock = -1;
	}
	while (!m_telbuffer.empty())
		m_telbuffer.pop();
	m_error.clear();
}

bool TelnetTerminal::IsAlive() {
	if (!m_tel)
		return false;
	// IAC NOP is a no-op for the device but fails on a dead socket.
	telnet_iac(m_tel, TELNET_NOP);
	if (!m_error.empty()) {
		Log()->debug("Liveness probe failed: {}", m_error);
		m_error.clear();
		return false;
	}
	// The first send after the peer's FIN still succeeds; EOF shows up on read.
	char c;
	ssize_t rc = recv(m_sock, &c, 1, MSG_PEEK | MSG_DONTWAIT);
	if (rc == 0) {
		Log()->debug("Liveness probe failed: peer closed the connection");
		return false;
	}
	if (rc < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
		Log()->debug("Liveness probe failed: {}", strerror(errno));
		return false;
	}
	return true;
}

void TelnetTerminal::WriteRaw(const std::string& bytes) {
	if (!m_tel)
		throw ConnectionClosedException("Telnet session is not open");
	telnet_send(m_tel, bytes.data(), bytes.length());
	CheckError();
}

void TelnetTerminal::SendSocket(const char* data, size_t len) {
	size_t sent = 0;
	while (sent < len) {
		ssize_t rc = send(m_sock, data + sent, len - sent, MSG_NOSIGNAL);
		if (rc < 0) {
			if (errno == EINTR)
				continue;
			if (m_error.empty())
				m_error = fmt("Telnet send failed: %s", strerror(errno));
			return;
		}
		sent += rc;
	}
}

void TelnetTerminal::CheckError() {
	if (m_error.empty())
		return;
	std::string err = m_error;
	m_error.clear();
	throw ConnectionClosedException(err);
}

char TelnetTerminal::GetChar() {
	if (!m_tel)
		throw ConnectionClosedException("Telnet session is not open");
	char buf[4096];
	while (m_telbuffer.empty()) {
		struct timeval timeout;
		timeout.tv_sec = ReadTimeout();
		timeout.tv_usec = 0;
		fd_set fd;
		FD_ZERO(&fd);
		FD_SET(m_sock, &fd);
		int rc = select(m_sock + 1, &fd, NULL, NULL, &timeout);
		if (rc < 0 && errno == EINTR)
			continue;
		if (rc <= 0)
			throw ConnectionClosedException("Timeout or error waiting for data (telnet)");
		ssize_t ret = recv(m_sock, buf, sizeof(buf), 0);
		if (ret == 0)
			throw ConnectionClosedException("No more chars to read (telnet)");
		if (ret < 0) {
			if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
				continue;
			throw ConnectionClosedException(fmt("Telnet read failed: %s",
			strerror(errno)));
		}
		telnet_recv(m_tel, buf, ret);
		CheckError();
	}
	char c = m_telbuffer.front();
	m_telbuffer.pop();
	return c;
}

} // namespace dnostool
