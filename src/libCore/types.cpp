#include "core/types.hpp"

namespace fishbowl {

static constexpr std::array<std::string_view, ROUND_COUNT> ROUND_NAMES = {"Taboo", "Charades", "One Word"};

static constexpr std::array<std::string_view, 3> GAME_STATUS_NAMES = {"setup", "playing", "finished"};
static constexpr std::array<std::string_view, 8> SUB_STATUS_NAMES  = {
        "waiting_for_players", "ready_to_start", "round_intro", "turn_starting",
        "turn_active",         "turn_paused",    "round_complete", "game_complete",
};
static constexpr std::array<std::string_view, 3> PHRASE_STATUS_NAMES = {"active", "guessed", "skipped"};
static constexpr std::array<std::string_view, 3> PAUSE_REASON_NAMES  = {"player_disconnected", "host_paused", "dispute"};

template <class Enum, std::size_t N>
static std::optional<Enum> fromName(const std::array<std::string_view, N>& names, std::string_view value) {
	for (std::size_t i = 0; i != N; ++i) {
		if (names[i] == value) {
			return static_cast<Enum>(i);
		}
	}
	return std::nullopt;
}

bool isLegal(GameStatus status, SubStatus subStatus) {
	switch (status) {
	case GameStatus::Setup:
		return subStatus == SubStatus::WaitingForPlayers || subStatus == SubStatus::ReadyToStart;
	case GameStatus::Playing:
		return subStatus == SubStatus::RoundIntro || subStatus == SubStatus::RoundComplete || isTurnPhase(subStatus);
	case GameStatus::Finished:
		return subStatus == SubStatus::GameComplete;
	}
	return false;
}

std::string_view roundName(unsigned round) {
	if (round == 0u || round > ROUND_COUNT) {
		return {};
	}
	return ROUND_NAMES[round - 1];
}

std::string_view toString(GameStatus status) {
	return GAME_STATUS_NAMES[static_cast<std::size_t>(status)];
}

std::string_view toString(SubStatus subStatus) {
	return SUB_STATUS_NAMES[static_cast<std::size_t>(subStatus)];
}

std::string_view toString(PhraseStatus status) {
	return PHRASE_STATUS_NAMES[static_cast<std::size_t>(status)];
}

std::string_view toString(PauseReason reason) {
	return PAUSE_REASON_NAMES[static_cast<std::size_t>(reason)];
}

std::optional<GameStatus> gameStatusFromString(std::string_view value) {
	return fromName<GameStatus>(GAME_STATUS_NAMES, value);
}

std::optional<SubStatus> subStatusFromString(std::string_view value) {
	return fromName<SubStatus>(SUB_STATUS_NAMES, value);
}

std::optional<PauseReason> pauseReasonFromString(std::string_view value) {
	return fromName<PauseReason>(PAUSE_REASON_NAMES, value);
}

} // namespace fishbowl
