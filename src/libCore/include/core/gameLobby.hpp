#pragma once

#include "core/IEntityStore.hpp"
#include "core/errors.hpp"
#include "core/gameRules.hpp"
#include "core/random.hpp"

#include <string>
#include <vector>

namespace fishbowl {

struct CreateGameRequest {
	std::string name;
	std::string hostName;
	GameConfig config{};
};

struct CreateGameResult {
	Game game;
	Player host;
	std::vector<Team> teams;
};

struct JoinGameResult {
	Player player;
	std::size_t playerCount;
};

struct SubmitPhrasesResult {
	std::vector<Phrase> phrases; //!< Rows created by this submission.
	std::size_t submittedCount;  //!< Phrases of the player after the submission.
	unsigned requiredCount;
};

//! Phrase with the name of its author, as shown to the host.
struct PhraseListing {
	Phrase phrase;
	std::string authorName;
};

//! Per player phrase submission state during setup.
struct PhraseProgress {
	PlayerId playerId;
	std::string playerName;
	std::size_t submitted;
	unsigned required;
};

//! Setup phase operations: creating a game, building the roster and collecting phrases.
//! Keeps the game's sub status between waiting_for_players and ready_to_start in sync with the roster.
//! Every operation runs in its own transaction and is rejected once the game left setup.
class GameLobby {
public:
	GameLobby(IEntityStore& store, Random& random, NowFunction now = [] { return Clock::now(); });

	//! Create a game with a fresh join code, its default teams and the host player.
	//! The host is placed on the first team.
	Outcome<CreateGameResult> createGame(const CreateGameRequest& request);

	//! Add a player. New players go to the team with the fewest members.
	Outcome<JoinGameResult> joinGame(const GameId& gameId, const std::string& playerName);

	Outcome<Player> assignTeam(const GameId& gameId, const PlayerId& playerId, const TeamId& teamId);

	//! Change game settings. The team count may only grow: missing default teams are created.
	Outcome<Game> updateConfig(const GameId& gameId, const ConfigUpdate& update);

	//! Add phrases for a player. A player can never hold more than phrases_per_player.
	//! A phrase already in the game, from any player and in any case, is rejected.
	Outcome<SubmitPhrasesResult> submitPhrases(const GameId& gameId, const PlayerId& playerId, const std::vector<std::string>& texts);

	//! Replace the text of a phrase. Only its author may edit it.
	Outcome<Phrase> updatePhrase(const GameId& gameId, const PlayerId& playerId, const PhraseId& phraseId, const std::string& text);

	//! Remove a phrase. Allowed for its author and for the host.
	Outcome<Game> deletePhrase(const GameId& gameId, const PlayerId& playerId, const PhraseId& phraseId);

	//! Every phrase of the game in submission order. Host only.
	Outcome<std::vector<PhraseListing>> listPhrases(const GameId& gameId, const PlayerId& requesterId);

	Outcome<std::vector<PhraseProgress>> phraseProgress(const GameId& gameId);

	//! Reasons the game can not start yet. Empty if startable.
	Outcome<std::vector<std::string>> readiness(const GameId& gameId);

private:
	//! Game in setup. Throws GameError otherwise.
	Game requireSetup(const ITransaction& transaction) const;

	//! Phrase row. Throws GameError(NotFound) if the phrase does not exist.
	Phrase requirePhrase(const ITransaction& transaction, const PhraseId& phraseId) const;

	//! Throws GameError(Validation) if another phrase of the game has the same text ignoring case.
	void requireUniqueText(const ITransaction& transaction, const std::string& text, const PhraseId& ignored = {}) const;

	//! Move between waiting_for_players and ready_to_start to reflect the roster.
	void refreshReadiness(ITransaction& transaction, Game& game) const;

	Team makeTeam(const GameId& gameId, std::size_t index) const;

private:
	IEntityStore& m_store;
	Random& m_random;
	NowFunction m_now;
};

} // namespace fishbowl
