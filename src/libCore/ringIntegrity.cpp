#include "core/ringIntegrity.hpp"

#include "Logging.hpp"

#include <format>
#include <unordered_map>
#include <unordered_set>

namespace fishbowl {

static RingReport defect(RingDefect kind, const PlayerId& playerId, std::string message) {
	return RingReport{.defect = kind, .playerId = playerId, .message = std::move(message)};
}

RingReport checkRing(const std::vector<TurnOrderNode>& nodes) {
	if (nodes.empty()) {
		return {};
	}

	std::unordered_map<PlayerId, const TurnOrderNode*> byPlayer;
	byPlayer.reserve(nodes.size());
	for (const auto& node: nodes) {
		if (!byPlayer.emplace(node.playerId, &node).second) {
			return defect(RingDefect::DuplicatePlayer, node.playerId, std::format("Player '{}' has more than one node.", node.playerId));
		}
	}

	for (const auto& node: nodes) {
		const auto next = byPlayer.find(node.nextPlayerId);
		if (next == byPlayer.end()) {
			return defect(RingDefect::DanglingNext, node.playerId, std::format("Next of '{}' references unknown player '{}'.", node.playerId, node.nextPlayerId));
		}
		if (!byPlayer.contains(node.prevPlayerId)) {
			return defect(RingDefect::DanglingPrev, node.playerId, std::format("Prev of '{}' references unknown player '{}'.", node.playerId, node.prevPlayerId));
		}
		if (next->second->prevPlayerId != node.playerId) {
			return defect(RingDefect::PrevMismatch, node.playerId,
			              std::format("Successor '{}' of '{}' points back to '{}'.", node.nextPlayerId, node.playerId, next->second->prevPlayerId));
		}
	}

	// Every next reference resolves, so the walk either closes at the start after n steps or runs into a sub-cycle.
	const auto& start = nodes.front();
	std::unordered_set<PlayerId> visited{start.playerId};
	auto current = start.nextPlayerId;
	while (current != start.playerId) {
		if (!visited.insert(current).second) {
			return defect(RingDefect::NotSingleCycle, current, std::format("Walk from '{}' loops at '{}' without returning.", start.playerId, current));
		}
		current = byPlayer.at(current)->nextPlayerId;
	}

	if (visited.size() != nodes.size()) {
		return defect(RingDefect::NotSingleCycle, start.playerId,
		              std::format("Cycle through '{}' covers {} of {} nodes.", start.playerId, visited.size(), nodes.size()));
	}
	return {};
}

RingReport checkRing(const ITransaction& transaction) {
	auto report = checkRing(transaction.turnOrder());
	if (!report.valid()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[RingIntegrity] Game '{}': {}", transaction.gameId(), report.message));
	}
	return report;
}

} // namespace fishbowl
