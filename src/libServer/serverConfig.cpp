#include "server/serverConfig.hpp"

#include <charconv>
#include <format>

namespace fishbowl::server {

template <class T>
static std::optional<T> parseNumber(const std::string& text) {
	T value{};
	const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || end != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

std::variant<ServerConfig, std::string> parseArguments(const std::vector<std::string>& arguments) {
	ServerConfig config;

	for (std::size_t i = 0; i < arguments.size(); ++i) {
		const auto& flag = arguments[i];
		if (flag != "--port" && flag != "--seed" && flag != "--session-ttl") {
			return std::format("Unknown argument '{}'", flag);
		}
		if (i + 1 == arguments.size()) {
			return std::format("Missing value for '{}'", flag);
		}
		const auto& value = arguments[++i];

		if (flag == "--port") {
			const auto port = parseNumber<std::uint16_t>(value);
			if (!port) {
				return std::format("Invalid port '{}'", value);
			}
			config.port = *port;
		} else if (flag == "--seed") {
			const auto seed = parseNumber<std::uint64_t>(value);
			if (!seed) {
				return std::format("Invalid seed '{}'", value);
			}
			config.seed = *seed;
		} else {
			const auto ttl = parseNumber<unsigned>(value);
			if (!ttl || *ttl == 0u) {
				return std::format("Invalid session ttl '{}'", value);
			}
			config.sessionTtl = std::chrono::seconds{*ttl};
		}
	}
	return config;
}

} // namespace fishbowl::server
