/* File: scripted_terminal.hpp
 *
 * A Terminal whose "device" is a table of canned replies. Bytes written are
 * collected until a carriage return, then the echo, the reply and the next
 * prompt are queued for GetChar(), so the real prompt-detection loop runs
 * unchanged. Commands without a canned reply get the device's rejection.
 * With page_lines set, long replies pause at "--More--" until a space is
 * written; a stalled command's output ends without a prompt.
 */
#ifndef DNOSTOOL_TESTS_SCRIPTED_TERMINAL_HPP_INC
#define DNOSTOOL_TESTS_SCRIPTED_TERMINAL_HPP_INC


#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "dnos6.hpp"
#include "terminal.hpp"


namespace dnostool {

struct DeviceScript {
	std::map< std::string, std::string > replies;
	std::vector< std::string > sent;
	std::string hostname;
	bool user_mode;     // log in at "host>" and require enable
	std::string secret; // accepted enable secret
	bool alive;
	std::set< std::string > stalls;
	size_t page_lines;  // 0 disables the pager
	int pages_answered;

	DeviceScript()
	 : hostname("switch"),
	 user_mode(false),
	 alive(true),
	 page_lines(0),
	 pages_answered(0)
	{}

	static const char* INVALID_REPLY;
};

class ScriptedTerminal : public Terminal {
public:
	ScriptedTerminal(const SessionParams& params, DeviceScript& script,
	Protocol proto);

	virtual void Close();
	virtual bool IsAlive();
	virtual void WriteRaw(const std::string& bytes);
	virtual Protocol GetProtocol() const {
		return m_proto;
	}

protected:
	virtual std::string Connect();
	virtual char GetChar();

private:
	void Respond(const std::string& cmd);
	void Queue(const std::string& text);
	void QueuePage();

	DeviceScript& m_script;
	Protocol m_proto;
	bool m_open;
	bool m_privileged;
	bool m_await_secret;
	bool m_paused;
	std::string m_line;
	std::deque< char > m_out;
	std::deque< std::string > m_held;
	std::string m_tail;
};

/* Dnos6Driver talking to a DeviceScript instead of a switch. */
class ScriptedDnos6Driver : public Dnos6Driver {
public:
	ScriptedDnos6Driver(DeviceScript& script,
	const DriverOptions& opts = DriverOptions());

protected:
	virtual Terminal* CreateTerminal();

private:
	DeviceScript& m_script;
};

} // namespace dnostool

#endif // DNOSTOOL_TESTS_SCRIPTED_TERMINAL_HPP_INC
