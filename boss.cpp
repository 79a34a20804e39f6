#include <cerrno>
#include <cstdio>
#include <cstring>

extern "C" {
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
}

#include "boss.hpp"
#include "common.hpp"


namespace dnostool {

const char* Boss::FRAME_END = "}}:}}:";


Boss::Boss() :
	m_sock(-1)
{}
Boss::~Boss() {
	if (m_sock >= 0)
		close(m_sock);
}

void Boss::SetTCP(int port) {
	if (port <= 0 || port > 65535)
		throw DriverError(fmt("Invalid control port: %d", port));
	int sock = socket(AF_INET, SOCK_STREAM, 0);
	if (sock < 0)
		throw DriverError(fmt("socket(): %s", strerror(errno)));
	struct sockaddr_in sin;
	memset(&sin, 0, sizeof(sin));
	sin.sin_family = AF_INET;
	sin.sin_port = htons(port);
	sin.sin_addr.s_addr = inet_addr("127.0.0.1");
	if (connect(sock, (struct sockaddr*)&sin, sizeof(struct sockaddr_in)) != 0) {
		close(sock);
		throw DriverError(fmt("Failed to connect to 127.0.0.1:%d", port));
	}
	m_sock = sock;
}

PropTree Boss::GetOp() {
	const size_t endlen = strlen(FRAME_END);
	std::string buf;
	char ch;
	while (true) {
		if (m_sock >= 0) {
			if (recv(m_sock, &ch, 1, 0) <= 0)
				throw DriverError("EOF or error on control TCP input");
		} else {
			if (fread(&ch, 1, 1, stdin) != 1)
				throw DriverError("EOF or error on control stdin input");
		}
		buf += ch;
		if (buf.length() >= endlen
		&& buf.compare(buf.length() - endlen, endlen, FRAME_END) == 0)
			break;
	}
	buf.erase(buf.length() - endlen);
	return PropTree::FromJson(buf);
}

void Boss::Send(const std::string& snd) const {
	if (m_sock >= 0) {
		size_t done = 0;
		while (done < snd.length()) {
			ssize_t n = send(m_sock, snd.data() + done, snd.length() - done,
			MSG_NOSIGNAL);
			if (n < 0 && errno == EINTR)
				continue;
			if (n <= 0)
				throw DriverError(fmt("Error on control TCP output: %s",
				strerror(errno)));
			done += n;
		}
	} else {
		if (fwrite(snd.data(), 1, snd.length(), stdout) != snd.length()
		|| fflush(stdout) != 0)
			throw DriverError("Error on control stdout output");
	}
}

void Boss::SendFrame(const PropTree& frame) const {
	Send(frame.ToJson() + "\n" + FRAME_END + "\n");
}

void Boss::SendError(std::string const& error) const {
	PropTree frame;
	frame["error"] = error;
	SendFrame(frame);
}
void Boss::SendLine(std::string const& data) const {
	PropTree frame;
	frame["line"] = data;
	SendFrame(frame);
}
void Boss::SendOutputFinished() const {
	PropTree frame;
	frame["output-finished"] = "1";
	SendFrame(frame);
}
void Boss::SendReady() const {
	PropTree frame;
	frame["ready"] = "1";
	SendFrame(frame);
}
void Boss::SendGoodbye() const {
	PropTree frame;
	frame["goodbye"] = "1";
	SendFrame(frame);
}

void Boss::SendPropTree(std::string const& name,
PropTree const& proptree) const {
	PropTree frame;
	frame[name] = proptree;
	Send(frame.ToJson(true) + FRAME_END + "\n");
}

} // namespace dnostool
