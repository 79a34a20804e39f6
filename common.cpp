#include <cstdarg>
#include <cstdio>
#include <vector>

#include "common.hpp"


namespace dnostool {

int DefaultPort(Protocol proto) {
	return (proto == PROTO_TELNET) ? 23 : 22;
}

const char* ProtocolName(Protocol proto) {
	return (proto == PROTO_TELNET) ? "telnet" : "ssh";
}

std::string fmt(const char* msg, ...) {
	char buf[1024];
	va_list args;
	va_start(args, msg);
	int len = vsnprintf(buf, sizeof(buf), msg, args);
	va_end(args);
	if (len < 0)
		return std::string(msg);
	if (static_cast< size_t >(len) < sizeof(buf))
		return std::string(buf, len);

	// Device output quoted into a message can exceed the stack buffer.
	std::vector< char > big(len + 1);
	va_start(args, msg);
	vsnprintf(&big[0], big.size(), msg, args);
	va_end(args);
	return std::string(&big[0], len);
}

} // namespace dnostool
