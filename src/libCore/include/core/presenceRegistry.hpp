#pragma once

#include "core/IEntityStore.hpp"
#include "core/errors.hpp"
#include "core/gameRules.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace fishbowl {

//! Transport handle a player is reachable through.
using ConnectionId = std::uint64_t;

inline constexpr std::chrono::seconds DEFAULT_SESSION_TTL{300};

struct PresenceEntry {
	GameId gameId;
	PlayerId playerId;
	ConnectionId connectionId;
	bool connected{true};
	TimePoint lastSeen{}; //!< Join time, or the moment the connection dropped.
};

//! Tracks which players are reachable and mirrors it into Player.isConnected.
//!
//! Each flag change is written in its own short transaction on the player's game.
//! Entries of dropped connections are kept for the session TTL so a reconnect restores them.
class PresenceRegistry {
public:
	PresenceRegistry(IEntityStore& store, std::chrono::seconds ttl = DEFAULT_SESSION_TTL, NowFunction now = [] { return Clock::now(); });

	//! Bind a player to a connection and mark them connected.
	//! A player already known to the registry is moved to the new connection.
	Outcome<Player> join(const GameId& gameId, const PlayerId& playerId, ConnectionId connection);

	//! Restore a dropped player on a new connection. Rejected if the registry has no entry for the player.
	Outcome<Player> reconnect(const PlayerId& playerId, ConnectionId connection);

	//! Forget the player and mark them disconnected.
	Outcome<Player> leave(const PlayerId& playerId);

	//! Connection dropped. Marks its player disconnected but keeps the entry. Nullopt if the connection joined nobody.
	std::optional<PresenceEntry> disconnect(ConnectionId connection);

	//! Remove entries disconnected for longer than the TTL. Returns the removed entries.
	std::vector<PresenceEntry> expire();

	bool isConnected(const PlayerId& playerId) const;

	std::optional<PresenceEntry> entry(const PlayerId& playerId) const;
	std::optional<PresenceEntry> entryOf(ConnectionId connection) const;

	//! Connections of every connected player of a game.
	std::vector<ConnectionId> connections(const GameId& gameId) const;

private:
	void markDisconnected(const PresenceEntry& entry);
	Outcome<Player> writeConnected(const GameId& gameId, const PlayerId& playerId, bool connected);

private:
	IEntityStore& m_store;
	std::chrono::seconds m_ttl;
	NowFunction m_now;

	mutable std::mutex m_mutex; //!< Also held while writing the flag so store writes keep the registry's order.
	std::unordered_map<PlayerId, PresenceEntry> m_entries;
	std::unordered_map<ConnectionId, PlayerId> m_byConnection;
};

} // namespace fishbowl
