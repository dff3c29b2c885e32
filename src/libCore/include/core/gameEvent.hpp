#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace fishbowl {

//! Signal bits listeners subscribe to.
enum GameSignal : std::uint64_t {
	GS_GameStarted    = 1 << 0,
	GS_RoundStarted   = 1 << 1,
	GS_TurnStarted    = 1 << 2,
	GS_TurnEnded      = 1 << 3,
	GS_RoundCompleted = 1 << 4,
	GS_GameCompleted  = 1 << 5,
	GS_All            = GS_GameStarted | GS_RoundStarted | GS_TurnStarted | GS_TurnEnded | GS_RoundCompleted | GS_GameCompleted
};

struct GameStartedEvent {
	GameId gameId;
	std::size_t turnOrderSize;
	TurnId firstTurnId;
	PlayerId firstPlayerId;
};

struct RoundStartedEvent {
	GameId gameId;
	unsigned round;
	std::string roundName;
	TurnId turnId;
	PlayerId playerId;
	TeamId teamId;
};

//! Acting player started the clock.
struct TurnStartedEvent {
	GameId gameId;
	TurnId turnId;
	PlayerId playerId;
	TeamId teamId;
	unsigned round;
	unsigned timerDuration; //!< Seconds the timer layer should count down.
};

struct TurnEndedEvent {
	GameId gameId;
	TurnId turnId;
	PlayerId playerId;
	TeamId teamId;
	unsigned pointsScored;
	std::optional<TurnId> nextTurnId;     //!< Empty when the game finished with this turn.
	std::optional<PlayerId> nextPlayerId; //!< Empty when the game finished with this turn.
};

struct RoundCompletedEvent {
	GameId gameId;
	unsigned round;
};

struct GameCompletedEvent {
	GameId gameId;
};

using GameEvent = std::variant<GameStartedEvent, RoundStartedEvent, TurnStartedEvent, TurnEndedEvent, RoundCompletedEvent, GameCompletedEvent>;

//! Signal bit of an event.
GameSignal signalOf(const GameEvent& event);

//! Game id carried by an event.
const GameId& gameIdOf(const GameEvent& event);

} // namespace fishbowl
