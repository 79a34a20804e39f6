#include <pcrecpp.h>

#include "dispatcher.hpp"
#include "common.hpp"
#include "log.hpp"
#include "terminal.hpp"


namespace dnostool {

const char* CommandDispatcher::INVALID_MARKER = "% Invalid";


CommandDispatcher::CommandDispatcher(Terminal& term, bool strict)
	: m_term(term),
	m_strict(strict)
{
}

// The marker must start a line; config text may quote it elsewhere.
bool CommandDispatcher::IsInvalid(const std::string& output) {
	static const pcrecpp::RE invalid1(std::string("^[ \\t]*")
	+ pcrecpp::RE::QuoteMeta(INVALID_MARKER),
	pcrecpp::RE_Options().set_multiline(true));
	return invalid1.PartialMatch(output);
}

std::string CommandDispatcher::Send(const std::string& cmd) {
	return Send(std::vector< std::string >(1, cmd));
}

std::string CommandDispatcher::Send(const std::vector< std::string >& variants) {
	if (variants.empty())
		throw DriverError("No command given");
	std::string output;
	for (size_t i = 0; i < variants.size(); ++i) {
		output = m_term.SendCommand(variants[i]);
		if (!IsInvalid(output))
			return output;
		Log()->debug("Device rejected '{}'", variants[i]);
	}
	if (m_strict)
		throw CommandErrorException(fmt("Device rejected every variant of '%s'",
		variants[0].c_str()));
	Log()->warn("Device rejected every variant of '{}', using the last response",
	variants[0]);
	return output;
}

} // namespace dnostool
