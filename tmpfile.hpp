#ifndef DNOSTOOL_TMPFILE_HPP_INC
#define DNOSTOOL_TMPFILE_HPP_INC


#include <string>


namespace dnostool {

/* Writes config text to a new file in the system temp directory and returns
 * its path. The caller deletes it. Nothing is left behind on failure.
 */
std::string CreateTmpFile(const std::string& config);

} // namespace dnostool

#endif // DNOSTOOL_TMPFILE_HPP_INC
