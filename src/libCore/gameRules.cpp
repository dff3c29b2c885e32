#include "core/gameRules.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace fishbowl {

std::vector<std::string> validateConfig(const ConfigUpdate& config) {
	std::vector<std::string> errors;

	if (config.teamCount && (*config.teamCount < MIN_TEAMS || *config.teamCount > MAX_TEAMS)) {
		errors.push_back(std::format("Team count must be an integer between {} and {}", MIN_TEAMS, MAX_TEAMS));
	}
	if (config.phrasesPerPlayer && (*config.phrasesPerPlayer < MIN_PHRASES || *config.phrasesPerPlayer > MAX_PHRASES)) {
		errors.push_back(std::format("Phrases per player must be an integer between {} and {}", MIN_PHRASES, MAX_PHRASES));
	}
	if (config.timerDuration && (*config.timerDuration < MIN_TIMER_SECONDS || *config.timerDuration > MAX_TIMER_SECONDS)) {
		errors.push_back(std::format("Timer duration must be an integer between {} and {} seconds", MIN_TIMER_SECONDS, MAX_TIMER_SECONDS));
	}
	return errors;
}

std::optional<std::string> validatePlayerName(std::string_view name) {
	if (name.empty() || name.size() > MAX_PLAYER_NAME) {
		return std::format("Player name must be between 1 and {} characters", MAX_PLAYER_NAME);
	}

	const auto allowed = [](unsigned char c) { return std::isalnum(c) || c == ' ' || c == '-' || c == '_' || c == '\'' || c == '.'; };
	if (!std::all_of(name.begin(), name.end(), allowed)) {
		return "Player name contains invalid characters";
	}
	return std::nullopt;
}

std::optional<std::string> validateGameName(std::string_view name) {
	if (name.empty()) {
		return "Game name is required";
	}
	if (name.size() > MAX_GAME_NAME) {
		return std::format("Game name must be {} characters or less", MAX_GAME_NAME);
	}
	return std::nullopt;
}

std::optional<std::string> validatePhrase(std::string_view text) {
	if (text.empty() || text.size() > MAX_PHRASE_LENGTH) {
		return std::format("Phrase must be between 1 and {} characters", MAX_PHRASE_LENGTH);
	}
	return std::nullopt;
}

std::string trim(std::string_view text) {
	const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

	const auto first = std::find_if_not(text.begin(), text.end(), isSpace);
	const auto last  = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
	return first < last ? std::string(first, last) : std::string{};
}

std::vector<std::string> startBlockers(const ITransaction& transaction, const Game& game) {
	std::vector<std::string> blockers;

	const auto teams   = transaction.teams();
	const auto players = transaction.players();
	const auto phrases = transaction.phrases();

	if (teams.size() != game.teamCount) {
		blockers.push_back(std::format("Game has {} teams, expected {}", teams.size(), game.teamCount));
	}

	const auto minimumPlayers = PLAYERS_PER_TEAM_MIN * game.teamCount;
	if (players.size() < minimumPlayers) {
		blockers.push_back(std::format("At least {} players are required, {} joined", minimumPlayers, players.size()));
	}

	std::unordered_set<TeamId> teamIds;
	std::unordered_map<TeamId, std::size_t> teamSizes;
	for (const auto& team: teams) {
		teamIds.insert(team.id);
		teamSizes.emplace(team.id, 0u);
	}

	for (const auto& player: players) {
		if (!player.teamId || !teamIds.contains(*player.teamId)) {
			blockers.push_back(std::format("Player '{}' is not assigned to a team", player.name));
			continue;
		}
		++teamSizes[*player.teamId];
	}
	for (const auto& team: teams) {
		if (teamSizes[team.id] == 0u) {
			blockers.push_back(std::format("{} has no players", team.name));
		}
	}

	const auto requiredPhrases = players.size() * game.phrasesPerPlayer;
	if (phrases.size() < requiredPhrases) {
		blockers.push_back(std::format("{} phrases submitted, {} required", phrases.size(), requiredPhrases));
	}

	std::unordered_map<PlayerId, unsigned> submitted;
	for (const auto& phrase: phrases) {
		++submitted[phrase.playerId];
	}
	for (const auto& player: players) {
		if (submitted[player.id] < game.phrasesPerPlayer) {
			blockers.push_back(std::format("Player '{}' submitted {} of {} phrases", player.name, submitted[player.id], game.phrasesPerPlayer));
		}
	}

	return blockers;
}

} // namespace fishbowl
