#include "server/gameServer.hpp"
#include "server/serverConfig.hpp"

#include <iostream>
#include <string>
#include <variant>
#include <vector>

int main(int argc, char** argv) {
	const std::vector<std::string> arguments(argv + 1, argv + argc);

	const auto parsed = fishbowl::server::parseArguments(arguments);
	if (const auto* error = std::get_if<std::string>(&parsed)) {
		std::cerr << *error << "\nUsage: fishbowl_server [--port <port>] [--seed <seed>] [--session-ttl <seconds>]\n";
		return 1;
	}

	fishbowl::server::GameServer server(std::get<fishbowl::server::ServerConfig>(parsed));
	server.start();

	// Keep the server process alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	server.stop();
	return 0;
}
