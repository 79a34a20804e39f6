/* File: control.hpp
 *
 * The command loop behind the control channel: each frame names one driver
 * operation, and its result or error goes back as one frame.
 */
#ifndef DNOSTOOL_CONTROL_HPP_INC
#define DNOSTOOL_CONTROL_HPP_INC


#include <string>


namespace dnostool {

class Boss;
class NetworkDriver;

void ExecuteCommand(const Boss& boss, NetworkDriver& driver,
const std::string& cmd, const std::string& args);

/* Runs commands until an "end" frame arrives. A DriverError fails only the
 * command that raised it and is reported as an error frame; a frame without
 * a command, or a broken control channel, ends the loop with an exception.
 */
void ServeCommands(Boss& boss, NetworkDriver& driver);

} // namespace dnostool

#endif // DNOSTOOL_CONTROL_HPP_INC
