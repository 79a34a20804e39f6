#ifndef DNOSTOOL_LOG_HPP_INC
#define DNOSTOOL_LOG_HPP_INC


#include <memory>
#include <spdlog/spdlog.h>


namespace dnostool {

/* Creates (or returns) the "dnostool" logger on stderr. stdout is reserved
 * for the control channel.
 */
std::shared_ptr< spdlog::logger > Log();

void InitLogging(bool verbose);

} // namespace dnostool

#endif // DNOSTOOL_LOG_HPP_INC
