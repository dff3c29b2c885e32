#pragma once

#include "core/IEntityStore.hpp"
#include "core/errors.hpp"
#include "core/eventHub.hpp"
#include "core/gameRules.hpp"
#include "core/random.hpp"
#include "core/ringIntegrity.hpp"
#include "core/turnNavigator.hpp"
#include "core/turnOrderBuilder.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fishbowl {

//! Acting player of a turn together with the name clients display.
struct PlayerInfo {
	PlayerId id;
	std::string name;
	TeamId teamId;
};

struct StartGameResult {
	Game game;
	std::vector<PlayerId> turnOrder; //!< Draft sequence the ring was built from.
	Turn firstTurn;                  //!< Pending opening turn of round 1.
	PlayerInfo firstPlayer;
};

struct StartRoundResult {
	unsigned round;
	std::string roundName;
	Turn currentTurn;
	PlayerInfo currentPlayer;
	TimePoint startedAt;
	std::size_t resetPhrases; //!< Skipped phrases returned to play.
};

struct RecordPhraseResult {
	Phrase phrase;
	Turn turn;
	std::size_t remainingPhrases;
	bool roundComplete;
	bool gameComplete;
};

struct EndTurnResult {
	Turn completedTurn;
	Turn nextTurn;
	PlayerInfo nextPlayer;
	Game game;
};

//! Read only view of a game for clients joining late or refreshing.
struct GameSnapshot {
	Game game;
	std::vector<Team> teams;
	std::vector<Player> players;
	std::optional<Turn> currentTurn;
	std::size_t activePhrases;       //!< Phrases left in the bowl this round.
	std::vector<PlayerId> turnOrder; //!< Ring order starting at the first drafted player.
};

//! Drives a game from setup to completion.
//!
//! Every operation runs in a single transaction on the game: either all its writes commit or none do.
//! Operations are rejected with a structured Error when the game is not in a status they are allowed in,
//! when somebody other than the acting player acts, or when nobody is connected to take a turn.
//! Events are published on the hub only after the transaction committed.
class GameStateMachine {
public:
	GameStateMachine(IEntityStore& store, Random& random, EventHub& events, NowFunction now = [] { return Clock::now(); });

	//! setup -> playing/round_intro. Validates the roster, builds the turn order and creates the
	//! pending round 1 turn for a random connected player.
	Outcome<StartGameResult> startGame(const GameId& gameId);

	//! round_intro or round_complete -> turn_starting. Returns skipped phrases to play.
	//! From round_complete the round counter advances first.
	Outcome<StartRoundResult> startRound(const GameId& gameId);

	//! turn_starting -> turn_active. Only the acting player may start the clock.
	Outcome<Turn> startTurn(const GameId& gameId, const PlayerId& playerId);

	//! Mark the phrase in hand guessed or skipped. Guessed phrases score one point for the acting team.
	//! When no active phrase is left the turn and the round complete; after the last round the game finishes.
	Outcome<RecordPhraseResult> recordPhrase(const GameId& gameId, const PlayerId& playerId, const PhraseId& phraseId, PhraseAction action);

	//! turn_active -> turn_paused.
	Outcome<Game> pauseTurn(const GameId& gameId, PauseReason reason);

	//! turn_paused -> turn_active.
	Outcome<Game> resumeTurn(const GameId& gameId);

	//! Complete the current turn, credit its points and hand the next turn to the following connected player.
	//! If expectedTurnId is given the call is rejected unless it still names the current turn.
	Outcome<EndTurnResult> endTurn(const GameId& gameId, const PlayerId& playerId, const std::optional<TurnId>& expectedTurnId = std::nullopt);

	//! round_complete -> round_intro of the next round.
	Outcome<Game> advanceRound(const GameId& gameId);

	Outcome<GameSnapshot> snapshot(const GameId& gameId);

	//! Check the persisted turn order of the game.
	Outcome<RingReport> verifyTurnOrder(const GameId& gameId);

private:
	//! Playing game in one of the allowed sub statuses. Throws GameError(StateConflict) otherwise.
	Game requirePhase(const ITransaction& transaction, std::initializer_list<SubStatus> allowed, std::string_view message) const;

	//! Current, not yet completed turn. Throws GameError(StateConflict) if there is none.
	Turn requireCurrentTurn(const ITransaction& transaction, const Game& game) const;

	//! Throws GameError(Forbidden) unless playerId acts in turn.
	static void requireActor(const Turn& turn, const PlayerId& playerId);

	//! New pending turn for a player in a round. The player must be on a team.
	Turn makeTurn(const ITransaction& transaction, const Game& game, const PlayerId& playerId, unsigned round) const;

	//! Mark the turn complete and credit its points to the acting team.
	void completeTurn(ITransaction& transaction, Turn& turn) const;

	PlayerInfo playerInfo(const ITransaction& transaction, const PlayerId& playerId) const;

	void publish(const std::vector<GameEvent>& events);

private:
	IEntityStore& m_store;
	Random& m_random;
	EventHub& m_events;
	NowFunction m_now;

	TurnOrderBuilder m_builder;
	TurnNavigator m_navigator;
};

} // namespace fishbowl
