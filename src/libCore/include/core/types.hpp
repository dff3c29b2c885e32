#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fishbowl {

using GameId   = std::string; //!< Six character join code.
using TeamId   = std::string;
using PlayerId = std::string;
using PhraseId = std::string;
using TurnId   = std::string;
using NodeId   = std::string;

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline constexpr unsigned ROUND_COUNT = 3u;

//! Coarse game phase.
enum class GameStatus { Setup, Playing, Finished };

//! Fine grained phase within a game status.
enum class SubStatus {
	// Setup
	WaitingForPlayers,
	ReadyToStart,
	// Playing
	RoundIntro,
	TurnStarting,
	TurnActive,
	TurnPaused,
	RoundComplete,
	// Finished
	GameComplete
};

enum class PhraseStatus { Active, Guessed, Skipped };

//! What the acting player did with the phrase in hand.
enum class PhraseAction { Guessed, Skipped };

enum class PauseReason { PlayerDisconnected, HostPaused, Dispute };

//! True if the sub status is one of the phases allowed for the status.
bool isLegal(GameStatus status, SubStatus subStatus);

//! True for the phases in which a turn is in progress.
inline constexpr bool isTurnPhase(SubStatus subStatus) {
	return subStatus == SubStatus::TurnStarting || subStatus == SubStatus::TurnActive || subStatus == SubStatus::TurnPaused;
}

//! Fixed rule name of a round. Round numbers are 1-based.
std::string_view roundName(unsigned round);

std::string_view toString(GameStatus status);
std::string_view toString(SubStatus subStatus);
std::string_view toString(PhraseStatus status);
std::string_view toString(PauseReason reason);

std::optional<GameStatus> gameStatusFromString(std::string_view value);
std::optional<SubStatus> subStatusFromString(std::string_view value);
std::optional<PauseReason> pauseReasonFromString(std::string_view value);

} // namespace fishbowl
