#ifndef DNOSTOOL_TERMINAL_HPP_INC
#define DNOSTOOL_TERMINAL_HPP_INC


#include <string>
#include <pcrecpp.h>

#include "common.hpp"
#include "options.hpp"


namespace dnostool {

struct DataCallback {
	virtual ~DataCallback() {}
	virtual void OnData(const std::string& data) = 0;
};

struct SessionParams {
	std::string host;
	std::string username;
	std::string password;
	int timeout; // seconds, before global_delay_factor
	TransportOptions opts;

	SessionParams() : timeout(60) {}
};


/* An interactive CLI session with one device. Subclasses supply the byte
 * stream (SSH channel or Telnet); this class drives the prompt dialogue on
 * top of it: wait for the prompt, enter privileged mode, run commands and
 * hand back their output line by line.
 *
 * Only one command may be in flight at a time; a Terminal is not safe for
 * concurrent use.
 */
class Terminal {
public:
	static const char* REGEX_USER;
	static const char* REGEX_ROOT;
	static const char* REGEX_MORE;

	static Terminal* Create(Protocol proto, const SessionParams& params);

	explicit Terminal(const SessionParams& params);
	virtual ~Terminal() {}

	/* Connects, logs in and leaves the session at the privileged prompt with
	 * paging disabled. Failure leaves nothing open and is reported as a
	 * ConnectionException.
	 */
	void Open();
	// Safe to call at any time, including after a failed Open().
	virtual void Close() = 0;
	virtual bool IsAlive() = 0;
	virtual void WriteRaw(const std::string& bytes) = 0;
	virtual Protocol GetProtocol() const = 0;

	void SetPromptRegex(const std::string& reg);
	void SetContinuationRegex(const std::string& reg);

	/* Sends one command line and delivers each output line to dcb until the
	 * prompt regex matches. Returns the prompt line that ended the output.
	 * Transport failures raise ConnectionClosedException.
	 */
	std::string Execute(const std::string& cmd, DataCallback* dcb = 0);
	std::string SendCommand(const std::string& cmd);

protected:
	/* Transport-specific connect and login; returns the first CLI prompt. */
	virtual std::string Connect() = 0;
	virtual char GetChar() = 0;

	std::string WaitForPrompt(DataCallback* dcb = 0);
	int ReadTimeout() const;

	static int ConnectTcp(const std::string& host, int port);

	SessionParams m_params;

private:
	void Enable(const std::string& prompt);

	pcrecpp::RE m_prompt_regex;
	pcrecpp::RE m_cont_regex;
};

} // namespace dnostool

#endif // DNOSTOOL_TERMINAL_HPP_INC
