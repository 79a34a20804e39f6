extern "C" {
#include <sys/select.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
}
#include <cstdlib>
#include <cstring>
#include <mutex>

#include "ssh_terminal.hpp"
#include "log.hpp"


namespace dnostool {

static std::mutex s_libssh_mutex;
static int s_libssh_init_ct = 0;


void SshTerminal::AcquireLibrary() {
	std::lock_guard< std::mutex > lock(s_libssh_mutex);
	if (s_libssh_init_ct <= 0) {
		int rc = libssh2_init(0);
		if (rc != 0)
			throw ConnectionException(fmt("Failed to initialize libssh2: %d", rc));
	}
	++s_libssh_init_ct;
}

void SshTerminal::ReleaseLibrary() {
	std::lock_guard< std::mutex > lock(s_libssh_mutex);
	--s_libssh_init_ct;
	if (s_libssh_init_ct <= 0) {
		s_libssh_init_ct = 0;
		libssh2_exit();
	}
}

void SshTerminal::KbdIntCallback(const char* name, int name_len,
const char* instruction, int instruction_len, int num_prompts,
const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract) {
	(void)name;
	(void)name_len;
	(void)instruction;
	(void)instruction_len;
	(void)prompts;
	SshTerminal* t = static_cast< SshTerminal* >(*abstract);
	// Switches ask a single "Password:" question here.
	for (int i = 0; i < num_prompts; ++i) {
		responses[i].text = strdup(t->m_params.password.c_str());
		responses[i].length = static_cast< unsigned int >(
			t->m_params.password.length());
	}
}


SshTerminal::SshTerminal(const SessionParams& params)
	: Terminal(params),
	m_sock(-1),
	m_lib_acquired(false),
	m_ssh_session(0),
	m_ssh_channel(0),
	m_readpos(0)
{
}
SshTerminal::~SshTerminal() {
	Close();
}

std::string SshTerminal::Connect() {
	const TransportOptions& opts = m_params.opts;
	SshConfigEntry cfg;
	if (!opts.ssh_config_file.empty())
		cfg = LoadSshConfig(opts.ssh_config_file, m_params.host);
	std::string host = cfg.hostname.empty() ? m_params.host : cfg.hostname;
	int port = 22;
	if (opts.port > 0)
		port = opts.port;
	else if (cfg.port > 0)
		port = cfg.port;
	std::string username = m_params.username.empty() ? cfg.user
	: m_params.username;
	std::string key_file = opts.key_file.empty() ? cfg.identity_file
	: opts.key_file;

	AcquireLibrary();
	m_lib_acquired = true;
	m_sock = ConnectTcp(host, port);

	m_ssh_session = libssh2_session_init_ex(0, 0, 0, this);
	if (!m_ssh_session)
		throw ConnectionException("Failed to allocate SSH session");
	libssh2_session_set_blocking(m_ssh_session, 1);
	libssh2_session_set_timeout(m_ssh_session, ReadTimeout() * 1000L);
	if (libssh2_session_handshake(m_ssh_session, m_sock) != 0)
		throw ConnectionException(fmt("Failed to establish SSH session with %s",
		host.c_str()));
	if (opts.keepalive > 0)
		libssh2_keepalive_config(m_ssh_session, 1, opts.keepalive);

	CheckHostKey(host, port);
	Authenticate(username, key_file);

	if (!(m_ssh_channel = libssh2_channel_open_session(m_ssh_session)))
		throw ConnectionException("Unable to open a channel");
	if (libssh2_channel_request_pty(m_ssh_channel, "vanilla") != 0)
		throw ConnectionException("Failed requesting pty on channel");
	if (libssh2_channel_shell(m_ssh_channel) != 0)
		throw ConnectionException("Unable to request shell on allocated pty");
	libssh2_channel_set_blocking(m_ssh_channel, 0);

	return WaitForPrompt();
}

void SshTerminal::CheckHostKey(const std::string& host, int port) {
	const TransportOptions& opts = m_params.opts;
	if (!opts.ssh_strict)
		return;
	LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(m_ssh_session);
	if (!nh)
		throw ConnectionException("Failed to initialize known hosts");
	if (opts.system_host_keys) {
		std::string path = ExpandHome("~/.ssh/known_hosts");
		if (libssh2_knownhost_readfile(nh, path.c_str(),
		LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0)
			Log()->warn("Unable to read known hosts from {}", path);
	}
	if (opts.alt_host_keys && !opts.alt_key_file.empty()) {
		std::string path = ExpandHome(opts.alt_key_file);
		if (libssh2_knownhost_readfile(nh, path.c_str(),
		LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0)
			Log()->warn("Unable to read known hosts from {}", path);
	}
	size_t len = 0;
	int type = 0;
	const char* key = libssh2_session_hostkey(m_ssh_session, &len, &type);
	if (!key) {
		libssh2_knownhost_free(nh);
		throw ConnectionException("Server did not present a host key");
	}
	struct libssh2_knownhost* found = 0;
	int check = libssh2_knownhost_checkp(nh, host.c_str(), port, key, len,
	LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW, &found);
	libssh2_knownhost_free(nh);
	if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
		throw ConnectionException(fmt("Host key for %s does not match known hosts",
		host.c_str()));
	if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH)
		throw ConnectionException(fmt("Host key for %s is not known",
		host.c_str()));
}

bool SshTerminal::AuthenticateAgent(const std::string& username) {
	LIBSSH2_AGENT* agent = libssh2_agent_init(m_ssh_session);
	if (!agent)
		return false;
	bool ok = false;
	if (libssh2_agent_connect(agent) == 0
	&& libssh2_agent_list_identities(agent) == 0) {
		struct libssh2_agent_publickey* identity = 0;
		struct libssh2_agent_publickey* prev = 0;
		while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
			if (libssh2_agent_userauth(agent, username.c_str(), identity) == 0) {
				ok = true;
				break;
			}
			prev = identity;
		}
		libssh2_agent_disconnect(agent);
	}
	libssh2_agent_free(agent);
	return ok;
}

void SshTerminal::Authenticate(const std::string& username,
const std::string& key_file) {
	const TransportOptions& opts = m_params.opts;
	const char* methods = libssh2_userauth_list(m_ssh_session,
	username.c_str(), static_cast< unsigned int >(username.length()));
	if (!methods) {
		if (libssh2_userauth_authenticated(m_ssh_session))
			return;
		throw ConnectionException("Unable to query SSH authentication methods");
	}
	std::string allowed(methods);

	if (opts.allow_agent && allowed.find("publickey") != std::string::npos
	&& AuthenticateAgent(username))
		return;
	if (opts.use_keys && !key_file.empty()
	&& allowed.find("publickey") != std::string::npos) {
		std::string path = ExpandHome(key_file);
		if (libssh2_userauth_publickey_fromfile(m_ssh_session,
		username.c_str(), 0, path.c_str(), 0) == 0)
			return;
		Log()->warn("Key authentication with {} failed", path);
	}
	if (allowed.find("password") != std::string::npos) {
		if (libssh2_userauth_password(m_ssh_session, username.c_str(),
		m_params.password.c_str()) == 0)
			return;
	} else if (allowed.find("keyboard-interactive") != std::string::npos) {
		if (libssh2_userauth_keyboard_interactive(m_ssh_session,
		username.c_str(), &SshTerminal::KbdIntCallback) == 0)
			return;
	}
	throw ConnectionException(fmt("Authentication failed for user '%s'",
	username.c_str()));
}

void SshTerminal::Close() {
	if (m_ssh_channel) {
		libssh2_channel_free(m_ssh_channel);
		m_ssh_channel = 0;
	}
	if (m_ssh_session) {
		libssh2_session_disconnect(m_ssh_session,
		"Normal Shutdown, Thank you for playing");
		libssh2_session_free(m_ssh_session);
		m_ssh_session = 0;
	}
	if (m_sock >= 0) {
		close(m_sock);
		m_sock = -1;
	}
	if (m_lib_acquired) {
		ReleaseLibrary();
		m_lib_acquired = false;
	}
	m_readbuf.clear();
	m_readpos = 0;
}

bool SshTerminal::IsChannelActive() {
	if (!m_ssh_channel || libssh2_channel_eof(m_ssh_channel))
		return false;
	struct pollfd pfd;
	pfd.fd = m_sock;
	pfd.events = POLLOUT;
	pfd.revents = 0;
	if (poll(&pfd, 1, 0) < 0)
		return false;
	return !(pfd.revents & (POLLERR | POLLHUP | POLLNVAL));
}

bool SshTerminal::IsAlive() {
	if (!m_ssh_channel)
		return false;
	try {
		WriteRaw(std::string(1, '\0'));
	} catch (const ConnectionClosedException& e) {
		Log()->debug("Liveness probe failed: {}", e.what());
		return false;
	}
	return IsChannelActive();
}

void SshTerminal::WriteRaw(const std::string& bytes) {
	if (!m_ssh_channel)
		throw ConnectionClosedException("SSH session is not open");
	libssh2_channel_set_blocking(m_ssh_channel, 1);
	size_t sent = 0;
	while (sent < bytes.length()) {
		ssize_t rc = libssh2_channel_write(m_ssh_channel,
		bytes.data() + sent, bytes.length() - sent);
		if (rc < 0) {
			libssh2_channel_set_blocking(m_ssh_channel, 0);
			throw ConnectionClosedException(fmt("SSH write failed: %d",
			static_cast< int >(rc)));
		}
		sent += rc;
	}
	libssh2_channel_set_blocking(m_ssh_channel, 0);
}

char SshTerminal::GetChar() {
	if (m_readpos < m_readbuf.length())
		return m_readbuf[m_readpos++];
	if (!m_ssh_channel)
		throw ConnectionClosedException("SSH session is not open");
	char buf[4096];
	int tmp;
	while (true) {
		ssize_t ret = libssh2_channel_read(m_ssh_channel, buf, sizeof(buf));
		if (ret > 0) {
			m_readbuf.assign(buf, ret);
			m_readpos = 1;
			return m_readbuf[0];
		}
		if (ret < 0 && ret != LIBSSH2_ERROR_EAGAIN)
			throw ConnectionClosedException(fmt("No more chars to read (SSH): %d",
			static_cast< int >(ret)));
		if (libssh2_channel_eof(m_ssh_channel))
			throw ConnectionClosedException("SSH channel closed by the device");
		libssh2_keepalive_send(m_ssh_session, &tmp);
		struct timeval timeout;
		timeout.tv_sec = ReadTimeout();
		timeout.tv_usec = 0;
		fd_set fd;
		FD_ZERO(&fd);
		FD_SET(m_sock, &fd);
		fd_set *writefd = NULL;
		fd_set *readfd = NULL;
		int dir = libssh2_session_block_directions(m_ssh_session);
		if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
			readfd = &fd;
		if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
			writefd = &fd;
		if (!readfd && !writefd)
			readfd = &fd;
		int rc = select(m_sock + 1, readfd, writefd, NULL, &timeout);
		if (rc <= 0)
			throw ConnectionClosedException("Timeout or error waiting for data (SSH)");
	}
}

} // namespace dnostool
