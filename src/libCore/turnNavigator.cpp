#include "core/turnNavigator.hpp"

#include "Logging.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <format>

namespace fishbowl {

TurnNavigator::TurnNavigator(Random& random) : m_random(random) {
}

std::optional<PlayerId> TurnNavigator::nextPlayer(const ITransaction& transaction, const PlayerId& currentPlayerId) const {
	const auto start    = requireNode(transaction, currentPlayerId);
	const auto ringSize = transaction.turnOrder().size();

	// At most ringSize hops: every other node once, then back to the start.
	auto candidate = start.nextPlayerId;
	for (std::size_t hop = 0; hop != ringSize; ++hop) {
		if (candidate == currentPlayerId) {
			if (isPlayerActive(transaction, currentPlayerId)) {
				return currentPlayerId;
			}
			return std::nullopt;
		}
		if (isPlayerActive(transaction, candidate)) {
			return candidate;
		}
		candidate = requireNode(transaction, candidate).nextPlayerId;
	}

	// Only reachable when the next links form a cycle that does not pass through the start.
	const auto message = std::format("Turn order of game '{}' does not lead back to player '{}'.", transaction.gameId(), currentPlayerId);
	Logger().Log(Logging::LogLevel::Error, std::format("[TurnNavigator] {}", message));
	throw GameError(integrityError(message));
}

std::optional<PlayerId> TurnNavigator::currentPlayer(const ITransaction& transaction) const {
	const auto game = transaction.game();
	if (!game || !game->currentTurnId) {
		return std::nullopt;
	}

	const auto turn = transaction.turn(*game->currentTurnId);
	if (!turn) {
		return std::nullopt;
	}
	return turn->playerId;
}

std::optional<PlayerId> TurnNavigator::randomStartPlayer(const ITransaction& transaction) const {
	std::vector<PlayerId> connected;
	for (const auto& node: transaction.turnOrder()) {
		if (isPlayerActive(transaction, node.playerId)) {
			connected.push_back(node.playerId);
		}
	}

	if (connected.empty()) {
		return std::nullopt;
	}
	return connected[m_random.index(connected.size())];
}

std::vector<PlayerId> TurnNavigator::activePlayers(const ITransaction& transaction) const {
	auto nodes = transaction.turnOrder();
	std::sort(nodes.begin(), nodes.end(), [](const TurnOrderNode& lhs, const TurnOrderNode& rhs) { return lhs.position < rhs.position; });

	std::vector<PlayerId> result;
	for (const auto& node: nodes) {
		if (isPlayerActive(transaction, node.playerId)) {
			result.push_back(node.playerId);
		}
	}
	return result;
}

bool TurnNavigator::isPlayerActive(const ITransaction& transaction, const PlayerId& playerId) const {
	const auto player = transaction.player(playerId);
	return player && player->isConnected;
}

TurnOrderNode TurnNavigator::requireNode(const ITransaction& transaction, const PlayerId& playerId) const {
	auto node = transaction.turnOrderNode(playerId);
	if (!node) {
		const auto message = std::format("Turn order entry not found for player '{}' in game '{}'.", playerId, transaction.gameId());
		Logger().Log(Logging::LogLevel::Error, std::format("[TurnNavigator] {}", message));
		throw GameError(integrityError(message));
	}
	return *node;
}

} // namespace fishbowl
