#ifndef DNOSTOOL_TELNET_TERMINAL_HPP_INC
#define DNOSTOOL_TELNET_TERMINAL_HPP_INC


#include <queue>
extern "C" {
#include <libtelnet.h>
}

#include "terminal.hpp"


namespace dnostool {

class TelnetTerminal : public Terminal {
public:
	static void TelnetEventHandler(telnet_t* telnet, telnet_event_t* ev, void* ud);

	explicit TelnetTerminal(const SessionParams& params);
	virtual ~TelnetTerminal();

	virtual void Close();
	virtual bool IsAlive();
	virtual void WriteRaw(const std::string& bytes);
	virtual Protocol GetProtocol() const {
		return PROTO_TELNET;
	}

protected:
	virtual std::string Connect();
	virtual char GetChar();

private:
	void SendSocket(const char* data, size_t len);
	void CheckError();

	int m_sock;
	telnet_t* m_tel;
	std::queue< char > m_telbuffer;
	// libtelnet calls back through C frames, so failures are parked here.
	std::string m_error;
};

} // namespace dnostool

#endif // DNOSTOOL_TELNET_TERMINAL_HPP_INC
