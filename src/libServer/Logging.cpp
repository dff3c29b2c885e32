#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace fishbowl::server {

static Logging::LogConfig config;

//! Log every level to the console and to the server log file.
static void InitializeLogger() {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(Logging::LogLevel::Any);
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());

	const auto logPath = Logging::GetDefaultLogDir("Fishbowl/Server");

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (ec) {
		std::cerr << std::format("[Logger] Could not create directory: {}\nServer will only log to the console.\n", logPath.string());
		return;
	}
	config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "server.txt"));
}

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, InitializeLogger);

	return Logging::Logger(config);
}

} // namespace fishbowl::server
