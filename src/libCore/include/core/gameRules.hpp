#pragma once

#include "core/IEntityStore.hpp"

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fishbowl {

inline constexpr unsigned MIN_TEAMS            = 2u;
inline constexpr unsigned MAX_TEAMS            = 8u;
inline constexpr unsigned MIN_PHRASES          = 3u;
inline constexpr unsigned MAX_PHRASES          = 10u;
inline constexpr unsigned MIN_TIMER_SECONDS    = 30u;
inline constexpr unsigned MAX_TIMER_SECONDS    = 180u;
inline constexpr unsigned PLAYERS_PER_TEAM_MIN = 2u;

inline constexpr std::size_t GAME_CODE_LENGTH  = 6u;
inline constexpr unsigned GAME_CODE_ATTEMPTS   = 10u;
inline constexpr std::size_t MAX_GAME_NAME     = 100u;
inline constexpr std::size_t MAX_PLAYER_NAME   = 20u;
inline constexpr std::size_t MAX_PHRASE_LENGTH = 100u;

//! Source of the current time. Injected so tests control turn durations.
using NowFunction = std::function<TimePoint()>;

//! Tunables chosen when a game is created.
struct GameConfig {
	unsigned teamCount{2u};
	unsigned phrasesPerPlayer{5u};
	unsigned timerDuration{60u}; //!< Seconds.
};

//! Partial configuration change during setup. Unset fields stay as they are.
struct ConfigUpdate {
	std::optional<unsigned> teamCount;
	std::optional<unsigned> phrasesPerPlayer;
	std::optional<unsigned> timerDuration;
};

struct TeamPreset {
	std::string_view name;
	std::string_view color;
};

//! Names and colors of the default teams, in creation order.
inline constexpr std::array<TeamPreset, MAX_TEAMS> TEAM_PRESETS = {{
	{"Red Team", "#FF6B6B"},
	{"Teal Team", "#4ECDC4"},
	{"Blue Team", "#45B7D1"},
	{"Green Team", "#96CEB4"},
	{"Yellow Team", "#FFEAA7"},
	{"Purple Team", "#DDA0DD"},
	{"Mint Team", "#98D8C8"},
	{"Gold Team", "#F7DC6F"},
}};

//! Range violations of the set fields, empty if valid.
std::vector<std::string> validateConfig(const ConfigUpdate& config);

//! Reason the name is rejected, nullopt if valid. Expects a trimmed name.
std::optional<std::string> validatePlayerName(std::string_view name);
std::optional<std::string> validateGameName(std::string_view name);
std::optional<std::string> validatePhrase(std::string_view text);

//! Strip leading and trailing whitespace.
std::string trim(std::string_view text);

//! Every reason the game can not leave setup yet, empty once it may start.
//! Checks team count, roster size, team assignment and each player's phrase quota.
std::vector<std::string> startBlockers(const ITransaction& transaction, const Game& game);

} // namespace fishbowl
