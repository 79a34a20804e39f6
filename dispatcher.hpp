#ifndef DNOSTOOL_DISPATCHER_HPP_INC
#define DNOSTOOL_DISPATCHER_HPP_INC


#include <string>
#include <vector>


namespace dnostool {

class Terminal;

/* Sends commands over an open Terminal and recognizes the device's
 * "% Invalid" rejection. When a command's syntax depends on the OS version,
 * the caller passes every known spelling and the first one the device
 * accepts wins.
 */
class CommandDispatcher {
public:
	static const char* INVALID_MARKER;

	CommandDispatcher(Terminal& term, bool strict);

	std::string Send(const std::string& cmd);

	/* If every variant is rejected, the last rejection text is returned and
	 * a warning logged; in strict mode a CommandErrorException is thrown
	 * instead.
	 */
	std::string Send(const std::vector< std::string >& variants);

	static bool IsInvalid(const std::string& output);

private:
	Terminal& m_term;
	bool m_strict;
};

} // namespace dnostool

#endif // DNOSTOOL_DISPATCHER_HPP_INC
