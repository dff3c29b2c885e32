#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

namespace fishbowl {

//! Root entity. Every other row is scoped to a game and removed with it.
struct Game {
	GameId id;
	std::string name;
	PlayerId hostPlayerId;

	GameStatus status{GameStatus::Setup};
	SubStatus subStatus{SubStatus::WaitingForPlayers}; //!< Always legal for status.

	unsigned teamCount{2u};
	unsigned phrasesPerPlayer{5u};
	unsigned timerDuration{60u}; //!< Seconds per turn.

	unsigned currentRound{1u};            //!< 1-based, up to ROUND_COUNT.
	std::optional<TurnId> currentTurnId; //!< Active turn while playing.

	TimePoint createdAt{};
	std::optional<TimePoint> startedAt;
	std::optional<TimePoint> finishedAt;
};

struct Team {
	TeamId id;
	GameId gameId;
	std::string name;
	std::string color;

	std::array<unsigned, ROUND_COUNT> roundScores{}; //!< Score per round, index 0 is round 1.
	unsigned totalScore{0u};

	TimePoint createdAt{};
};

struct Player {
	PlayerId id;
	GameId gameId;
	std::optional<TeamId> teamId;
	std::string name;

	bool isConnected{true}; //!< Written by the presence layer only.
	TimePoint lastSeenAt{};
};

struct Phrase {
	PhraseId id;
	GameId gameId;
	PlayerId playerId; //!< Author.
	std::string text;

	PhraseStatus status{PhraseStatus::Active};
	std::optional<unsigned> guessedInRound;
	std::optional<TeamId> guessedByTeamId;
};

struct Turn {
	TurnId id;
	GameId gameId;
	unsigned round{1u};
	TeamId teamId;
	PlayerId playerId; //!< Acting player.

	std::optional<TimePoint> startTime;
	std::optional<TimePoint> endTime;
	std::optional<TimePoint> pausedAt;
	std::optional<PauseReason> pausedReason;

	unsigned duration{0u}; //!< Seconds between start and end.
	unsigned phrasesGuessed{0u};
	unsigned phrasesSkipped{0u};
	unsigned pointsScored{0u};
	bool isComplete{false};
};

//! One element of the circular turn order. Neighbours are addressed by player id.
struct TurnOrderNode {
	NodeId id;
	GameId gameId;
	PlayerId playerId;
	TeamId teamId;
	PlayerId nextPlayerId;
	PlayerId prevPlayerId;
	unsigned position{0u}; //!< Index in the draft sequence the ring was built from.
};

} // namespace fishbowl
