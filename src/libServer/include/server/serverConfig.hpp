#pragma once

#include "core/presenceRegistry.hpp"
#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fishbowl::server {

//! How often the server loop wakes up to expire stale sessions when idle.
inline constexpr std::chrono::milliseconds HOUSEKEEPING_INTERVAL{1000};

struct ServerConfig {
	std::uint16_t port{network::DEFAULT_PORT};
	std::chrono::seconds sessionTtl{DEFAULT_SESSION_TTL};
	std::optional<std::uint64_t> seed; //!< Fixed seed for reproducible drafts. Random if unset.
};

//! Parse "--port <n>", "--seed <n>" and "--session-ttl <seconds>".
//! Returns the error message for unknown flags, missing or malformed values.
std::variant<ServerConfig, std::string> parseArguments(const std::vector<std::string>& arguments);

} // namespace fishbowl::server
