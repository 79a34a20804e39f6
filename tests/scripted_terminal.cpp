#include "scripted_terminal.hpp"
#include "table.hpp"


namespace dnostool {

const char* DeviceScript::INVALID_REPLY
= "                                         ^\n"
"% Invalid input detected at '^' marker.";


ScriptedTerminal::ScriptedTerminal(const SessionParams& params,
DeviceScript& script, Protocol proto)
	: Terminal(params),
	m_script(script),
	m_proto(proto),
	m_open(false),
	m_privileged(false),
	m_await_secret(false),
	m_paused(false)
{
}

std::string ScriptedTerminal::Connect() {
	m_open = true;
	m_privileged = !m_script.user_mode;
	return m_script.hostname + (m_privileged ? "#" : ">");
}

void ScriptedTerminal::Close() {
	m_open = false;
	m_paused = false;
	m_out.clear();
	m_held.clear();
}

bool ScriptedTerminal::IsAlive() {
	return m_open && m_script.alive;
}

void ScriptedTerminal::WriteRaw(const std::string& bytes) {
	if (!m_open || !m_script.alive)
		throw ConnectionClosedException("Scripted device is gone");
	for (size_t i = 0; i < bytes.length(); ++i) {
		if (m_paused) {
			if (bytes[i] == ' ') {
				m_paused = false;
				++m_script.pages_answered;
				QueuePage();
			}
			continue;
		}
		if (bytes[i] == '\r') {
			Respond(m_line);
			m_line.clear();
		} else
			m_line += bytes[i];
	}
}

char ScriptedTerminal::GetChar() {
	if (m_out.empty())
		throw ConnectionClosedException("Timed out waiting for scripted output");
	char c = m_out.front();
	m_out.pop_front();
	return c;
}

void ScriptedTerminal::Queue(const std::string& text) {
	m_out.insert(m_out.end(), text.begin(), text.end());
}

void ScriptedTerminal::QueuePage() {
	size_t n = 0;
	while (!m_held.empty()
	&& (m_script.page_lines == 0 || n < m_script.page_lines)) {
		Queue(m_held.front() + "\r\n");
		m_held.pop_front();
		++n;
	}
	if (!m_held.empty()) {
		Queue("--More--");
		m_paused = true;
		return;
	}
	Queue(m_tail);
}

void ScriptedTerminal::Respond(const std::string& cmd) {
	std::string prompt_tail = m_privileged ? "#" : ">";
	if (m_await_secret) {
		// The secret is not echoed.
		m_await_secret = false;
		Queue("\r\n");
		if (cmd == m_script.secret)
			m_privileged = true;
		else
			Queue("% Access denied\r\n");
		Queue(m_script.hostname + (m_privileged ? "#" : ">"));
		return;
	}
	m_script.sent.push_back(cmd);
	Queue(cmd + "\r\n");
	if (cmd == "enable" && !m_privileged) {
		m_await_secret = true;
		Queue("Password:");
		return;
	}
	std::map< std::string, std::string >::const_iterator fd
	= m_script.replies.find(cmd);
	std::string reply = (fd != m_script.replies.end()) ? fd->second
	: std::string(DeviceScript::INVALID_REPLY);
	if (cmd == "terminal length 0" && fd == m_script.replies.end())
		reply.clear();
	if (!reply.empty()) {
		std::vector< std::string > lines = SplitLines(reply);
		m_held.assign(lines.begin(), lines.end());
	}
	// A stalled command never gets back to the prompt.
	if (m_script.stalls.count(cmd))
		m_tail.clear();
	else
		m_tail = m_script.hostname + prompt_tail;
	QueuePage();
}


ScriptedDnos6Driver::ScriptedDnos6Driver(DeviceScript& script,
const DriverOptions& opts)
	: Dnos6Driver("192.0.2.10", "admin", "admin", 5, opts),
	m_script(script)
{
}

Terminal* ScriptedDnos6Driver::CreateTerminal() {
	SessionParams params;
	params.host = "192.0.2.10";
	params.username = "admin";
	params.password = "admin";
	params.timeout = 5;
	params.opts = GetOptions().transport_opts;
	return new ScriptedTerminal(params, m_script, GetOptions().transport);
}

} // namespace dnostool
