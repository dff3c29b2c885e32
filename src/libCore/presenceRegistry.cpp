#include "core/presenceRegistry.hpp"

#include "Logging.hpp"
#include "transactionRunner.hpp"

#include <format>

namespace fishbowl {

static constexpr std::string_view COMPONENT = "Presence";

PresenceRegistry::PresenceRegistry(IEntityStore& store, std::chrono::seconds ttl, NowFunction now)
    : m_store(store), m_ttl(ttl), m_now(std::move(now)) {
}

Outcome<Player> PresenceRegistry::join(const GameId& gameId, const PlayerId& playerId, ConnectionId connection) {
	std::lock_guard<std::mutex> lock(m_mutex);

	auto outcome = writeConnected(gameId, playerId, true);
	if (!succeeded(outcome)) {
		return outcome;
	}

	if (const auto it = m_entries.find(playerId); it != m_entries.end()) {
		m_byConnection.erase(it->second.connectionId);
	}
	if (const auto it = m_byConnection.find(connection); it != m_byConnection.end() && it->second != playerId) {
		// Connection switches player: the previous one stays joined but unreachable.
		auto& previous     = m_entries.at(it->second);
		previous.connected = false;
		previous.lastSeen  = m_now();
		markDisconnected(previous);
	}

	m_entries[playerId]        = PresenceEntry{.gameId = gameId, .playerId = playerId, .connectionId = connection, .lastSeen = m_now()};
	m_byConnection[connection] = playerId;

	Logger().Log(Logging::LogLevel::Info, std::format("[{}] Player '{}' joined game '{}' on connection {}.", COMPONENT, playerId, gameId, connection));
	return outcome;
}

Outcome<Player> PresenceRegistry::reconnect(const PlayerId& playerId, ConnectionId connection) {
	std::optional<GameId> gameId;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (const auto it = m_entries.find(playerId); it != m_entries.end()) {
			gameId = it->second.gameId;
		}
	}
	if (!gameId) {
		return notFoundError(std::format("No session for player '{}'", playerId));
	}
	return join(*gameId, playerId, connection);
}

Outcome<Player> PresenceRegistry::leave(const PlayerId& playerId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_entries.find(playerId);
	if (it == m_entries.end()) {
		return notFoundError(std::format("No session for player '{}'", playerId));
	}

	const auto entry = it->second;
	m_byConnection.erase(entry.connectionId);
	m_entries.erase(it);

	Logger().Log(Logging::LogLevel::Info, std::format("[{}] Player '{}' left game '{}'.", COMPONENT, playerId, entry.gameId));
	return writeConnected(entry.gameId, playerId, false);
}

std::optional<PresenceEntry> PresenceRegistry::disconnect(ConnectionId connection) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_byConnection.find(connection);
	if (it == m_byConnection.end()) {
		return std::nullopt;
	}

	auto& entry     = m_entries.at(it->second);
	entry.connected = false;
	entry.lastSeen  = m_now();
	m_byConnection.erase(it);

	markDisconnected(entry);
	return entry;
}

std::vector<PresenceEntry> PresenceRegistry::expire() {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto now = m_now();
	std::vector<PresenceEntry> expired;
	for (auto it = m_entries.begin(); it != m_entries.end();) {
		if (!it->second.connected && now - it->second.lastSeen > m_ttl) {
			expired.push_back(it->second);
			it = m_entries.erase(it);
		} else {
			++it;
		}
	}

	if (!expired.empty()) {
		Logger().Log(Logging::LogLevel::Info, std::format("[{}] Expired {} stale sessions.", COMPONENT, expired.size()));
	}
	return expired;
}

bool PresenceRegistry::isConnected(const PlayerId& playerId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	const auto it = m_entries.find(playerId);
	return it != m_entries.end() && it->second.connected;
}

std::optional<PresenceEntry> PresenceRegistry::entry(const PlayerId& playerId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (const auto it = m_entries.find(playerId); it != m_entries.end()) {
		return it->second;
	}
	return std::nullopt;
}

std::optional<PresenceEntry> PresenceRegistry::entryOf(ConnectionId connection) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (const auto it = m_byConnection.find(connection); it != m_byConnection.end()) {
		return m_entries.at(it->second);
	}
	return std::nullopt;
}

std::vector<ConnectionId> PresenceRegistry::connections(const GameId& gameId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	std::vector<ConnectionId> result;
	for (const auto& [playerId, entry]: m_entries) {
		if (entry.gameId == gameId && entry.connected) {
			result.push_back(entry.connectionId);
		}
	}
	return result;
}

void PresenceRegistry::markDisconnected(const PresenceEntry& entry) {
	// A game removed meanwhile leaves nothing to update.
	if (const auto outcome = writeConnected(entry.gameId, entry.playerId, false); !succeeded(outcome)) {
		Logger().Log(Logging::LogLevel::Warning,
		             std::format("[{}] Could not mark player '{}' disconnected: {}", COMPONENT, entry.playerId, std::get<Error>(outcome).message));
	}
}

Outcome<Player> PresenceRegistry::writeConnected(const GameId& gameId, const PlayerId& playerId, bool connected) {
	return runTransaction<Player>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		requireGame(tx);
		auto player        = requirePlayer(tx, playerId);
		player.isConnected = connected;
		player.lastSeenAt  = m_now();
		tx.update(player);
		return player;
	});
}

} // namespace fishbowl
