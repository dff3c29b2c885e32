#pragma once

#include "core/IEntityStore.hpp"
#include "core/errors.hpp"
#include "core/gameRules.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <format>
#include <stdexcept>
#include <string>
#include <vector>

namespace fishbowl::gtest {

//! Clock the test advances by hand.
struct ManualClock {
	TimePoint now{std::chrono::sys_days{std::chrono::year{2024} / 1 / 1}};

	NowFunction function() {
		return [this] { return now; };
	}
	void advance(std::chrono::seconds seconds) {
		now += seconds;
	}
};

//! Result value of a successful outcome. Records a failure and throws otherwise.
template <class T>
T unwrap(const Outcome<T>& outcome) {
	if (const auto* error = std::get_if<Error>(&outcome)) {
		ADD_FAILURE() << "Unexpected error (" << toString(error->kind) << "): " << error->message;
		throw std::runtime_error(error->message);
	}
	return std::get<T>(outcome);
}

//! Error of a rejected outcome. Records a failure and throws if the operation succeeded.
template <class T>
Error errorOf(const Outcome<T>& outcome) {
	if (const auto* error = std::get_if<Error>(&outcome)) {
		return *error;
	}
	ADD_FAILURE() << "Operation succeeded unexpectedly";
	throw std::runtime_error("operation succeeded");
}

struct Roster {
	GameId gameId;
	std::vector<TeamId> teams;
	std::vector<PlayerId> players; //!< Ordered by team, then by index within the team.
	std::vector<PhraseId> phrases;
};

//! Insert a game in setup with one team per entry of teamSizes. Player ids are "p<n>", team ids "team<n>",
//! phrase ids "<playerId>-phrase<n>". Every player submitted phrasesPerPlayer phrases.
inline Roster seedGame(IEntityStore& store, const GameId& gameId, const std::vector<unsigned>& teamSizes, unsigned phrasesPerPlayer = 3u) {
	Roster roster{.gameId = gameId};

	auto tx = store.begin(gameId);
	tx->insert(Game{
	        .id               = gameId,
	        .name             = "Test game",
	        .hostPlayerId     = "p0",
	        .subStatus        = SubStatus::ReadyToStart,
	        .teamCount        = static_cast<unsigned>(teamSizes.size()),
	        .phrasesPerPlayer = phrasesPerPlayer,
	});

	unsigned playerIndex = 0u;
	for (std::size_t t = 0; t != teamSizes.size(); ++t) {
		const auto teamId = std::format("team{}", t);
		tx->insert(Team{.id = teamId, .gameId = gameId, .name = std::format("Team {}", t), .color = "#FFFFFF"});
		roster.teams.push_back(teamId);

		for (unsigned i = 0u; i != teamSizes[t]; ++i, ++playerIndex) {
			const auto playerId = std::format("p{}", playerIndex);
			tx->insert(Player{.id = playerId, .gameId = gameId, .teamId = teamId, .name = std::format("Player {}", playerIndex)});
			roster.players.push_back(playerId);

			for (unsigned n = 0u; n != phrasesPerPlayer; ++n) {
				const auto phraseId = std::format("{}-phrase{}", playerId, n);
				tx->insert(Phrase{.id = phraseId, .gameId = gameId, .playerId = playerId, .text = std::format("phrase {} of {}", n, playerId)});
				roster.phrases.push_back(phraseId);
			}
		}
	}
	tx->commit();
	return roster;
}

inline void setConnected(IEntityStore& store, const GameId& gameId, const PlayerId& playerId, bool connected) {
	auto tx     = store.begin(gameId);
	auto player = tx->player(playerId);
	ASSERT_TRUE(player.has_value());
	player->isConnected = connected;
	tx->update(*player);
	tx->commit();
}

// Read helpers. The transaction is dropped without commit.
inline Game loadGame(IEntityStore& store, const GameId& gameId) {
	return store.begin(gameId)->game().value();
}

inline Turn loadCurrentTurn(IEntityStore& store, const GameId& gameId) {
	auto tx = store.begin(gameId);
	return tx->turn(tx->game().value().currentTurnId.value()).value();
}

inline std::vector<Phrase> loadPhrases(IEntityStore& store, const GameId& gameId) {
	return store.begin(gameId)->phrases();
}

inline Team loadTeam(IEntityStore& store, const GameId& gameId, const TeamId& teamId) {
	return store.begin(gameId)->team(teamId).value();
}

inline std::vector<Turn> loadTurns(IEntityStore& store, const GameId& gameId) {
	return store.begin(gameId)->turns();
}

} // namespace fishbowl::gtest
