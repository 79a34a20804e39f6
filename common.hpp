#ifndef DNOSTOOL_COMMON_HPP_INC
#define DNOSTOOL_COMMON_HPP_INC


#include <string>
#include <stdexcept>


namespace dnostool {

enum Protocol {
	PROTO_SSH = 0,
	PROTO_TELNET
};

int DefaultPort(Protocol proto);
const char* ProtocolName(Protocol proto);


/* Everything the driver throws derives from DriverError, so a caller can
 * catch the whole family at once and still tell the cases apart.
 */
class DriverError : public std::runtime_error {
public:
	explicit DriverError(const std::string& msg) : std::runtime_error(msg) {}
};

// The session could not be established in the first place.
class ConnectionException : public DriverError {
public:
	explicit ConnectionException(const std::string& msg) : DriverError(msg) {}
};

// An established session was lost: read/write failure, EOF or read timeout.
class ConnectionClosedException : public DriverError {
public:
	explicit ConnectionClosedException(const std::string& msg)
	 : DriverError(msg) {}
};

class CommandErrorException : public DriverError {
public:
	explicit CommandErrorException(const std::string& msg)
	 : DriverError(msg) {}
};

// A structurally required element of device output did not match.
class ParseException : public DriverError {
public:
	explicit ParseException(const std::string& msg) : DriverError(msg) {}
};


std::string fmt(const char* msg, ...);

} // namespace dnostool

#endif // DNOSTOOL_COMMON_HPP_INC
