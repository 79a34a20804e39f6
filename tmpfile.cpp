#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

extern "C" {
#include <unistd.h>
}

#include "tmpfile.hpp"
#include "common.hpp"
#include "log.hpp"


namespace dnostool {

std::string CreateTmpFile(const std::string& config) {
	const char* dir = getenv("TMPDIR");
	if (!dir || !*dir)
		dir = "/tmp";
	std::string tmpl = std::string(dir) + "/dnostool-XXXXXX";
	std::vector< char > path(tmpl.begin(), tmpl.end());
	path.push_back('\0');

	int fd = mkstemp(&path[0]);
	if (fd < 0)
		throw DriverError(fmt("Failed to create a temp file in %s: %s", dir,
		strerror(errno)));

	size_t done = 0;
	while (done < config.length()) {
		ssize_t n = write(fd, config.data() + done, config.length() - done);
		if (n < 0 && errno == EINTR)
			continue;
		if (n <= 0) {
			int err = errno;
			close(fd);
			unlink(&path[0]);
			throw DriverError(fmt("Failed to write %s: %s", &path[0],
			strerror(err)));
		}
		done += n;
	}
	if (close(fd) != 0) {
		int err = errno;
		unlink(&path[0]);
		throw DriverError(fmt("Failed to write %s: %s", &path[0], strerror(err)));
	}
	Log()->debug("Staged {} bytes of config in {}", config.length(), &path[0]);
	return std::string(&path[0]);
}

} // namespace dnostool
