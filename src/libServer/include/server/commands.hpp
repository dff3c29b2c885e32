#pragma once

#include "core/errors.hpp"
#include "core/gameEvent.hpp"
#include "core/gameRules.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace fishbowl::server {

// Client commands. Arguments are separated by ':'.
// Commands without a game id act on the game and player the connection joined.
struct CreateGameCommand { //!< CREATE:<name>:<host>[:<teams>:<phrases>:<timer>]
	std::string gameName;
	std::string hostName;
	GameConfig config{};
};
struct JoinGameCommand { //!< JOIN_GAME:<code>:<name>
	GameId gameId;
	std::string playerName;
};
struct JoinCommand { //!< JOIN:<code>:<playerId>, rebinds an existing player.
	GameId gameId;
	PlayerId playerId;
};
struct LeaveCommand {};
struct AssignTeamCommand { //!< TEAM:<teamId>
	TeamId teamId;
};
struct UpdateConfigCommand { //!< CONFIG:<teams>:<phrases>:<timer>, empty fields stay unchanged.
	ConfigUpdate update;
};
struct SubmitPhrasesCommand { //!< PHRASES:<text>|<text>|...
	std::vector<std::string> phrases;
};
struct EditPhraseCommand { //!< PHRASE_EDIT:<phraseId>:<text>
	PhraseId phraseId;
	std::string text;
};
struct DeletePhraseCommand { //!< PHRASE_DELETE:<phraseId>
	PhraseId phraseId;
};
struct ListPhrasesCommand {}; //!< PHRASE_LIST, host only.
struct StartGameCommand {};
struct StartRoundCommand {};
struct NextRoundCommand {};
struct StartTurnCommand {};
struct RecordPhraseCommand { //!< GUESS:<phraseId> or SKIP:<phraseId>
	PhraseId phraseId;
	PhraseAction action;
};
struct PauseCommand {};
struct ResumeCommand {};
struct EndTurnCommand { //!< END_TURN[:<turnId>]
	std::optional<TurnId> expectedTurnId;
};
struct StateCommand {};

using Command = std::variant<CreateGameCommand, JoinGameCommand, JoinCommand, LeaveCommand, AssignTeamCommand, UpdateConfigCommand, SubmitPhrasesCommand,
                             EditPhraseCommand, DeletePhraseCommand, ListPhrasesCommand, StartGameCommand, StartRoundCommand, NextRoundCommand, StartTurnCommand, RecordPhraseCommand, PauseCommand, ResumeCommand,
                             EndTurnCommand, StateCommand>;

//! Payload to command, nullopt for unknown commands or malformed arguments.
std::optional<Command> parseCommand(std::string_view payload);

//! Wire name of the command, e.g. "END_TURN".
std::string_view commandName(const Command& command);

using Fields = std::vector<std::pair<std::string, std::string>>;

std::string formatOk(std::string_view command, const Fields& fields = {}); //!< OK:<command>[:key=value;...]
std::string formatError(const Error& error);                               //!< ERROR:<kind>:<message>
std::string formatEvent(const GameEvent& event);                           //!< EVENT:<name>:key=value;...
std::string formatEvent(std::string_view name, const Fields& fields);       //!< Notices outside the engine's event set.

} // namespace fishbowl::server
