#ifndef DNOSTOOL_SSH_TERMINAL_HPP_INC
#define DNOSTOOL_SSH_TERMINAL_HPP_INC


extern "C" {
#include <libssh2.h>
}

#include "terminal.hpp"


namespace dnostool {

class SshTerminal : public Terminal {
public:
	static void KbdIntCallback(const char* name, int name_len,
	const char* instruction, int instruction_len, int num_prompts,
	const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
	LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract);

	explicit SshTerminal(const SessionParams& params);
	virtual ~SshTerminal();

	virtual void Close();
	virtual bool IsAlive();
	virtual void WriteRaw(const std::string& bytes);
	virtual Protocol GetProtocol() const {
		return PROTO_SSH;
	}

protected:
	virtual std::string Connect();
	virtual char GetChar();

private:
	static void AcquireLibrary();
	static void ReleaseLibrary();

	void CheckHostKey(const std::string& host, int port);
	void Authenticate(const std::string& username, const std::string& key_file);
	bool AuthenticateAgent(const std::string& username);
	bool IsChannelActive();

	int m_sock;
	bool m_lib_acquired;
	LIBSSH2_SESSION* m_ssh_session;
	LIBSSH2_CHANNEL* m_ssh_channel;
	std::string m_readbuf;
	size_t m_readpos;
};

} // namespace dnostool

#endif // DNOSTOOL_SSH_TERMINAL_HPP_INC
