#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace fishbowl::network {

static Logging::LogConfig config;

//! Per connection traffic is only logged in debug builds, where it also goes to the console.
static void InitializeLogger() {
	config.SetLogEnabled(true);
#ifdef NDEBUG
	config.SetMinLogLevel(Logging::LogLevel::Info);
#else
	config.SetMinLogLevel(Logging::LogLevel::Any);
#endif

	const auto logPath = Logging::GetDefaultLogDir("Fishbowl/Network");

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (!ec) {
		config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "transport.txt"));
	} else {
		std::cerr << std::format("[Logger] Could not create directory: {}\nNetwork will not log to file.\n", logPath.string());
	}

#ifndef NDEBUG
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif
}

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, InitializeLogger);

	return Logging::Logger(config);
}

} // namespace fishbowl::network
