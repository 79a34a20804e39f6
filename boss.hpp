/* File: boss.hpp
 *
 * The control channel to whatever is driving this process: JSON frames
 * terminated by "}}:}}:", read from stdin or a local TCP port and answered
 * the same way.
 */
#ifndef DNOSTOOL_BOSS_HPP_INC
#define DNOSTOOL_BOSS_HPP_INC


#include <string>

#include "proptree.hpp"


namespace dnostool {

class Boss {
public:
	static const char* FRAME_END;

	Boss();
	~Boss();

	// Talk over 127.0.0.1:port instead of stdin/stdout.
	void SetTCP(int port);
	PropTree GetOp();
	void SendReady() const;
	void SendGoodbye() const;
	void SendError(std::string const& error) const;
	void SendLine(std::string const& data) const;
	void SendOutputFinished() const;
	void SendPropTree(std::string const& name, const PropTree& proptree) const;

private:
	void SendFrame(const PropTree& frame) const;
	void Send(const std::string& snd) const;

	int m_sock;
};

} // namespace dnostool

#endif // DNOSTOOL_BOSS_HPP_INC
