#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include "Utils/Logger.hpp"

int main(int argc, char* argv[])
{
	// keep the expected warnings of failure-path tests off the console
	QEMUKIT::BoostLogger::Config config;
	config.console_level = QEMUKIT::BoostLogger::Level::Fatal;
	QEMUKIT::BoostLogger::Init(config);

	return Catch::Session().run(argc, argv);
}
