#include <cstdlib>
#include <exception>

#include "boss.hpp"
#include "control.hpp"
#include "driver.hpp"
#include "log.hpp"


int main(int argc, char* argv[]) {
	using dnostool::Boss;
	using dnostool::Log;
	using dnostool::NetworkDriver;
	using dnostool::PropTree;

	Boss boss;

	try {
		if (argc > 1)
			boss.SetTCP(atoi(argv[1]));
		boss.SendReady();
	} catch (const std::exception& e) {
		Log()->critical("{}", e.what());
		return -1;
	}

	NetworkDriver* driver = 0;
	try {
		PropTree phost = boss.GetOp()["host"];
		dnostool::InitLogging(phost["optional-args"].GetBool("verbose", false));
		driver = NetworkDriver::Construct(phost);
		dnostool::ServeCommands(boss, *driver);
		delete driver;
		driver = 0;
		boss.SendGoodbye();
		return 0;
	} catch (const std::exception& e) {
		delete driver;
		Log()->error("{}", e.what());
		try {
			boss.SendError(e.what());
		} catch (const std::exception& e2) {
			Log()->critical("Cannot report error to the controller: {}", e2.what());
		}
	}
	return -1;
}
