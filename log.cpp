#include <spdlog/sinks/stdout_color_sinks.h>

#include "log.hpp"


namespace dnostool {

std::shared_ptr< spdlog::logger > Log() {
	std::shared_ptr< spdlog::logger > logger = spdlog::get("dnostool");
	if (logger)
		return logger;
	try {
		logger = spdlog::stderr_color_mt("dnostool");
		logger->set_level(spdlog::level::info);
	} catch (const spdlog::spdlog_ex&) {
		// Another thread registered it first.
		logger = spdlog::get("dnostool");
	}
	return logger;
}

void InitLogging(bool verbose) {
	Log()->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

} // namespace dnostool
