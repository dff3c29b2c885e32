#pragma once

#include "network/protocol.hpp"

namespace fishbowl::server {

// Events flowing from the network thread into the server thread.
enum class ServerEventType { ClientConnected, ClientDisconnected, ClientMessage, Shutdown };

struct ServerEvent {
	ServerEventType type{};
	network::ConnectionId connectionId{}; //!< Network connection id.
	network::Message payload{};           //!< Command text, e.g. "GUESS:<phraseId>".
};

} // namespace fishbowl::server
