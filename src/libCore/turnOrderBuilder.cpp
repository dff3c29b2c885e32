#include "core/turnOrderBuilder.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace fishbowl {

TurnOrderBuilder::TurnOrderBuilder(Random& random) : m_random(random) {
}

std::vector<PlayerId> TurnOrderBuilder::draft(const std::vector<Player>& players, const std::vector<Team>& teams) {
	std::unordered_map<TeamId, std::vector<PlayerId>> teamPlayers;
	for (const auto& team: teams) {
		teamPlayers.emplace(team.id, std::vector<PlayerId>{});
	}
	for (const auto& player: players) {
		if (!player.teamId || !teamPlayers.contains(*player.teamId)) {
			throw GameError(validationError(std::format("Player '{}' is not assigned to a team of this game.", player.name)));
		}
		teamPlayers.at(*player.teamId).push_back(player.id);
	}

	// Draft position within each team, then the team that picks first.
	std::vector<TeamId> teamOrder;
	std::size_t maxTeamSize = 0u;
	for (const auto& team: teams) {
		auto& members = teamPlayers.at(team.id);
		if (members.empty()) {
			continue;
		}
		m_random.shuffle(members.begin(), members.end());
		maxTeamSize = std::max(maxTeamSize, members.size());
		teamOrder.push_back(team.id);
	}
	m_random.shuffle(teamOrder.begin(), teamOrder.end());

	std::vector<TeamId> reversedOrder(teamOrder.rbegin(), teamOrder.rend());

	std::vector<PlayerId> sequence;
	sequence.reserve(players.size());
	for (std::size_t position = 0; position != maxTeamSize; ++position) {
		const auto& rowOrder = position % 2u == 0u ? teamOrder : reversedOrder;
		for (const auto& teamId: rowOrder) {
			const auto& members = teamPlayers.at(teamId);
			if (position < members.size()) {
				sequence.push_back(members[position]);
			}
		}
	}
	return sequence;
}

std::vector<TurnOrderNode> TurnOrderBuilder::link(const GameId& gameId, const std::vector<PlayerId>& sequence, const std::vector<Player>& players) {
	std::unordered_map<PlayerId, TeamId> teamOf;
	for (const auto& player: players) {
		teamOf.emplace(player.id, player.teamId.value_or(TeamId{}));
	}

	const auto count = sequence.size();

	std::vector<TurnOrderNode> nodes;
	nodes.reserve(count);
	for (std::size_t i = 0; i != count; ++i) {
		const auto& playerId = sequence[i];
		nodes.push_back(TurnOrderNode{
		        .id           = m_random.uuid(),
		        .gameId       = gameId,
		        .playerId     = playerId,
		        .teamId       = teamOf.contains(playerId) ? teamOf.at(playerId) : TeamId{},
		        .nextPlayerId = sequence[(i + 1u) % count],
		        .prevPlayerId = sequence[(i + count - 1u) % count],
		        .position     = static_cast<unsigned>(i),
		});
	}
	return nodes;
}

std::vector<PlayerId> TurnOrderBuilder::build(ITransaction& transaction) {
	const auto players = transaction.players();
	const auto teams   = transaction.teams();

	auto sequence = draft(players, teams);
	for (const auto& node: link(transaction.gameId(), sequence, players)) {
		transaction.insert(node);
	}
	return sequence;
}

} // namespace fishbowl
