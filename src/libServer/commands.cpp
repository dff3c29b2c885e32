#include "server/commands.hpp"

#include <charconv>
#include <format>

namespace fishbowl::server {

static constexpr std::string_view CMD_CREATE      = "CREATE";
static constexpr std::string_view CMD_JOIN_GAME   = "JOIN_GAME";
static constexpr std::string_view CMD_JOIN        = "JOIN";
static constexpr std::string_view CMD_LEAVE       = "LEAVE";
static constexpr std::string_view CMD_TEAM        = "TEAM";
static constexpr std::string_view CMD_CONFIG      = "CONFIG";
static constexpr std::string_view CMD_PHRASES     = "PHRASES";
static constexpr std::string_view CMD_PHRASE_EDIT = "PHRASE_EDIT";
static constexpr std::string_view CMD_PHRASE_DEL  = "PHRASE_DELETE";
static constexpr std::string_view CMD_PHRASE_LIST = "PHRASE_LIST";
static constexpr std::string_view CMD_START_GAME  = "START_GAME";
static constexpr std::string_view CMD_START_ROUND = "START_ROUND";
static constexpr std::string_view CMD_NEXT_ROUND  = "NEXT_ROUND";
static constexpr std::string_view CMD_START_TURN  = "START_TURN";
static constexpr std::string_view CMD_GUESS       = "GUESS";
static constexpr std::string_view CMD_SKIP        = "SKIP";
static constexpr std::string_view CMD_PAUSE       = "PAUSE";
static constexpr std::string_view CMD_RESUME      = "RESUME";
static constexpr std::string_view CMD_END_TURN    = "END_TURN";
static constexpr std::string_view CMD_STATE       = "STATE";

static std::vector<std::string> split(std::string_view text, char separator) {
	std::vector<std::string> parts;
	std::size_t begin = 0;
	while (true) {
		const auto end = text.find(separator, begin);
		parts.emplace_back(text.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin));
		if (end == std::string_view::npos) {
			break;
		}
		begin = end + 1;
	}
	return parts;
}

static std::optional<unsigned> parseUnsigned(const std::string& text) {
	unsigned value{};
	const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || end != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

//! Empty text is an unset field; anything else must be a number.
static bool parseOptional(const std::string& text, std::optional<unsigned>& out) {
	if (text.empty()) {
		return true;
	}
	out = parseUnsigned(text);
	return out.has_value();
}

static std::optional<Command> parseCreate(const std::vector<std::string>& args) {
	if (args.size() != 2 && args.size() != 5) {
		return std::nullopt;
	}

	CreateGameCommand command{.gameName = args[0], .hostName = args[1]};
	if (args.size() == 5) {
		const auto teams   = parseUnsigned(args[2]);
		const auto phrases = parseUnsigned(args[3]);
		const auto timer   = parseUnsigned(args[4]);
		if (!teams || !phrases || !timer) {
			return std::nullopt;
		}
		command.config = GameConfig{.teamCount = *teams, .phrasesPerPlayer = *phrases, .timerDuration = *timer};
	}
	return command;
}

static std::optional<Command> parseConfig(const std::vector<std::string>& args) {
	if (args.size() != 3) {
		return std::nullopt;
	}

	UpdateConfigCommand command;
	if (!parseOptional(args[0], command.update.teamCount) || !parseOptional(args[1], command.update.phrasesPerPlayer) ||
	    !parseOptional(args[2], command.update.timerDuration)) {
		return std::nullopt;
	}
	return command;
}

std::optional<Command> parseCommand(std::string_view payload) {
	const auto separator = payload.find(':');
	const auto name      = payload.substr(0, separator);
	const auto rest      = separator == std::string_view::npos ? std::string_view{} : payload.substr(separator + 1);
	const bool hasArgs   = separator != std::string_view::npos;

	// Phrases may contain ':' themselves.
	if (name == CMD_PHRASES) {
		if (!hasArgs || rest.empty()) {
			return std::nullopt;
		}
		return SubmitPhrasesCommand{.phrases = split(rest, '|')};
	}
	if (name == CMD_PHRASE_EDIT) {
		const auto textStart = rest.find(':');
		if (!hasArgs || textStart == 0u || textStart == std::string_view::npos) {
			return std::nullopt;
		}
		return EditPhraseCommand{.phraseId = std::string(rest.substr(0, textStart)), .text = std::string(rest.substr(textStart + 1))};
	}

	const auto args = hasArgs ? split(rest, ':') : std::vector<std::string>{};
	const auto bare = [&](auto command) -> std::optional<Command> {
		if (!args.empty()) {
			return std::nullopt;
		}
		return command;
	};
	const auto singleId = [&]() -> std::optional<std::string> {
		if (args.size() != 1 || args[0].empty()) {
			return std::nullopt;
		}
		return args[0];
	};

	if (name == CMD_CREATE) {
		return parseCreate(args);
	}
	if (name == CMD_JOIN_GAME || name == CMD_JOIN) {
		if (args.size() != 2 || args[0].empty() || args[1].empty()) {
			return std::nullopt;
		}
		if (name == CMD_JOIN) {
			return JoinCommand{.gameId = args[0], .playerId = args[1]};
		}
		return JoinGameCommand{.gameId = args[0], .playerName = args[1]};
	}
	if (name == CMD_TEAM) {
		if (const auto id = singleId()) {
			return AssignTeamCommand{.teamId = *id};
		}
		return std::nullopt;
	}
	if (name == CMD_CONFIG) {
		return parseConfig(args);
	}
	if (name == CMD_PHRASE_DEL) {
		if (const auto id = singleId()) {
			return DeletePhraseCommand{.phraseId = *id};
		}
		return std::nullopt;
	}
	if (name == CMD_PHRASE_LIST) {
		return bare(ListPhrasesCommand{});
	}
	if (name == CMD_GUESS || name == CMD_SKIP) {
		if (const auto id = singleId()) {
			return RecordPhraseCommand{.phraseId = *id, .action = name == CMD_GUESS ? PhraseAction::Guessed : PhraseAction::Skipped};
		}
		return std::nullopt;
	}
	if (name == CMD_END_TURN) {
		if (args.empty()) {
			return EndTurnCommand{};
		}
		if (const auto id = singleId()) {
			return EndTurnCommand{.expectedTurnId = *id};
		}
		return std::nullopt;
	}
	if (name == CMD_LEAVE) {
		return bare(LeaveCommand{});
	}
	if (name == CMD_START_GAME) {
		return bare(StartGameCommand{});
	}
	if (name == CMD_START_ROUND) {
		return bare(StartRoundCommand{});
	}
	if (name == CMD_NEXT_ROUND) {
		return bare(NextRoundCommand{});
	}
	if (name == CMD_START_TURN) {
		return bare(StartTurnCommand{});
	}
	if (name == CMD_PAUSE) {
		return bare(PauseCommand{});
	}
	if (name == CMD_RESUME) {
		return bare(ResumeCommand{});
	}
	if (name == CMD_STATE) {
		return bare(StateCommand{});
	}

	return std::nullopt;
}

std::string_view commandName(const Command& command) {
	struct Visitor {
		std::string_view operator()(const CreateGameCommand&) const { return CMD_CREATE; }
		std::string_view operator()(const JoinGameCommand&) const { return CMD_JOIN_GAME; }
		std::string_view operator()(const JoinCommand&) const { return CMD_JOIN; }
		std::string_view operator()(const LeaveCommand&) const { return CMD_LEAVE; }
		std::string_view operator()(const AssignTeamCommand&) const { return CMD_TEAM; }
		std::string_view operator()(const UpdateConfigCommand&) const { return CMD_CONFIG; }
		std::string_view operator()(const SubmitPhrasesCommand&) const { return CMD_PHRASES; }
		std::string_view operator()(const EditPhraseCommand&) const { return CMD_PHRASE_EDIT; }
		std::string_view operator()(const DeletePhraseCommand&) const { return CMD_PHRASE_DEL; }
		std::string_view operator()(const ListPhrasesCommand&) const { return CMD_PHRASE_LIST; }
		std::string_view operator()(const StartGameCommand&) const { return CMD_START_GAME; }
		std::string_view operator()(const StartRoundCommand&) const { return CMD_START_ROUND; }
		std::string_view operator()(const NextRoundCommand&) const { return CMD_NEXT_ROUND; }
		std::string_view operator()(const StartTurnCommand&) const { return CMD_START_TURN; }
		std::string_view operator()(const RecordPhraseCommand& c) const { return c.action == PhraseAction::Guessed ? CMD_GUESS : CMD_SKIP; }
		std::string_view operator()(const PauseCommand&) const { return CMD_PAUSE; }
		std::string_view operator()(const ResumeCommand&) const { return CMD_RESUME; }
		std::string_view operator()(const EndTurnCommand&) const { return CMD_END_TURN; }
		std::string_view operator()(const StateCommand&) const { return CMD_STATE; }
	};
	return std::visit(Visitor{}, command);
}

static std::string joinFields(const Fields& fields) {
	std::string text;
	for (const auto& [key, value]: fields) {
		if (!text.empty()) {
			text += ';';
		}
		text += std::format("{}={}", key, value);
	}
	return text;
}

std::string formatOk(std::string_view command, const Fields& fields) {
	if (fields.empty()) {
		return std::format("OK:{}", command);
	}
	return std::format("OK:{}:{}", command, joinFields(fields));
}

std::string formatError(const Error& error) {
	return std::format("ERROR:{}:{}", toString(error.kind), error.message);
}

std::string formatEvent(std::string_view name, const Fields& fields) {
	return std::format("EVENT:{}:{}", name, joinFields(fields));
}

std::string formatEvent(const GameEvent& event) {
	struct Visitor {
		std::string operator()(const GameStartedEvent& e) const {
			const Fields fields{{"game", e.gameId}, {"players", std::to_string(e.turnOrderSize)}, {"turn", e.firstTurnId}, {"player", e.firstPlayerId}};
			return formatEvent("game_started", fields);
		}
		std::string operator()(const RoundStartedEvent& e) const {
			const Fields fields{
			        {"game", e.gameId}, {"round", std::to_string(e.round)}, {"name", e.roundName}, {"turn", e.turnId}, {"player", e.playerId}, {"team", e.teamId},
			};
			return formatEvent("round_started", fields);
		}
		std::string operator()(const TurnStartedEvent& e) const {
			const Fields fields{
			        {"game", e.gameId}, {"turn", e.turnId}, {"player", e.playerId}, {"team", e.teamId}, {"round", std::to_string(e.round)},
			        {"timer", std::to_string(e.timerDuration)},
			};
			return formatEvent("turn_started", fields);
		}
		std::string operator()(const TurnEndedEvent& e) const {
			Fields fields{{"game", e.gameId}, {"turn", e.turnId}, {"player", e.playerId}, {"team", e.teamId}, {"points", std::to_string(e.pointsScored)}};
			if (e.nextTurnId && e.nextPlayerId) {
				fields.emplace_back("next_turn", *e.nextTurnId);
				fields.emplace_back("next_player", *e.nextPlayerId);
			}
			return formatEvent("turn_ended", fields);
		}
		std::string operator()(const RoundCompletedEvent& e) const {
			return formatEvent("round_completed", Fields{{"game", e.gameId}, {"round", std::to_string(e.round)}});
		}
		std::string operator()(const GameCompletedEvent& e) const {
			return formatEvent("game_completed", Fields{{"game", e.gameId}});
		}
	};
	return std::visit(Visitor{}, event);
}

} // namespace fishbowl::server
