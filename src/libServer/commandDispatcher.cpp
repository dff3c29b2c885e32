#include "server/commandDispatcher.hpp"

#include "Logging.hpp"

#include <format>

namespace fishbowl::server {

//! OK reply built from the result, or the error reply.
template <class T, class Format>
static std::string reply(std::string_view command, const Outcome<T>& outcome, Format&& format) {
	if (const auto* error = std::get_if<Error>(&outcome)) {
		return formatError(*error);
	}
	return formatOk(command, format(std::get<T>(outcome)));
}

static std::string flag(bool value) {
	return value ? "1" : "0";
}

CommandDispatcher::CommandDispatcher(IEntityStore& store, Random& random, std::chrono::seconds sessionTtl, SendFunction send, NowFunction now)
    : m_lobby(store, random, now), m_stateMachine(store, random, m_events, now), m_presence(store, sessionTtl, now), m_send(std::move(send)) {
	m_events.subscribe(this);
}

CommandDispatcher::~CommandDispatcher() {
	m_events.unsubscribe(this);
}

std::string CommandDispatcher::handle(ConnectionId connection, const std::string& payload) {
	const auto command = parseCommand(payload);
	if (!command) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Dispatcher] Connection {} sent malformed command '{}'.", connection, payload));
		return formatError(validationError("Malformed command"));
	}

	try {
		return std::visit([&](const auto& cmd) { return execute(connection, cmd); }, *command);
	} catch (const GameError& e) {
		return formatError(e.error());
	}
}

void CommandDispatcher::disconnected(ConnectionId connection) {
	if (const auto entry = m_presence.disconnect(connection)) {
		departed(entry->gameId, entry->playerId);
	}
}

void CommandDispatcher::expireSessions() {
	for (const auto& entry: m_presence.expire()) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Dispatcher] Session of player '{}' in game '{}' expired.", entry.playerId, entry.gameId));
	}
}

void CommandDispatcher::onGameEvent(const GameEvent& event) {
	broadcast(gameIdOf(event), formatEvent(event));
}

std::string CommandDispatcher::execute(ConnectionId connection, const CreateGameCommand& command) {
	auto outcome = m_lobby.createGame({.name = command.gameName, .hostName = command.hostName, .config = command.config});
	if (const auto* created = std::get_if<CreateGameResult>(&outcome)) {
		if (const auto bound = bind(connection, created->game.id, created->host.id); !succeeded(bound)) {
			return formatError(std::get<Error>(bound));
		}
	}

	return reply("CREATE", outcome, [](const CreateGameResult& result) {
		std::string teams;
		for (const auto& team: result.teams) {
			teams += teams.empty() ? team.id : "," + team.id;
		}
		return Fields{{"game", result.game.id}, {"player", result.host.id}, {"teams", teams}};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const JoinGameCommand& command) {
	auto outcome = m_lobby.joinGame(command.gameId, command.playerName);
	if (const auto* joined = std::get_if<JoinGameResult>(&outcome)) {
		if (const auto bound = bind(connection, command.gameId, joined->player.id); !succeeded(bound)) {
			return formatError(std::get<Error>(bound));
		}
	}

	return reply("JOIN_GAME", outcome, [&](const JoinGameResult& result) {
		return Fields{{"game", command.gameId}, {"player", result.player.id}, {"team", result.player.teamId.value_or("")}};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const JoinCommand& command) {
	return reply("JOIN", bind(connection, command.gameId, command.playerId), [](const Player& player) {
		return Fields{{"player", player.id}, {"name", player.name}};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const LeaveCommand&) {
	const auto session = requireSession(connection);
	const auto outcome = m_presence.leave(session.playerId);
	if (succeeded(outcome)) {
		departed(session.gameId, session.playerId);
	}
	return reply("LEAVE", outcome, [](const Player&) { return Fields{}; });
}

std::string CommandDispatcher::execute(ConnectionId connection, const AssignTeamCommand& command) {
	const auto session = requireSession(connection);
	return reply("TEAM", m_lobby.assignTeam(session.gameId, session.playerId, command.teamId), [](const Player& player) {
		return Fields{{"team", player.teamId.value_or("")}};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const UpdateConfigCommand& command) {
	const auto session = requireSession(connection);
	return reply("CONFIG", m_lobby.updateConfig(session.gameId, command.update), [](const Game& game) {
		return Fields{
		        {"teams", std::to_string(game.teamCount)},
		        {"phrases", std::to_string(game.phrasesPerPlayer)},
		        {"timer", std::to_string(game.timerDuration)},
		        {"sub_status", std::string(toString(game.subStatus))},
		};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const SubmitPhrasesCommand& command) {
	const auto session = requireSession(connection);
	return reply("PHRASES", m_lobby.submitPhrases(session.gameId, session.playerId, command.phrases), [](const SubmitPhrasesResult& result) {
		return Fields{{"submitted", std::to_string(result.submittedCount)}, {"required", std::to_string(result.requiredCount)}};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const EditPhraseCommand& command) {
	const auto session = requireSession(connection);
	return reply("PHRASE_EDIT", m_lobby.updatePhrase(session.gameId, session.playerId, command.phraseId, command.text), [](const Phrase& phrase) {
		return Fields{{"phrase", phrase.id}, {"text", phrase.text}};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const DeletePhraseCommand& command) {
	const auto session = requireSession(connection);
	return reply("PHRASE_DELETE", m_lobby.deletePhrase(session.gameId, session.playerId, command.phraseId), [](const Game& game) {
		return Fields{{"sub_status", std::string(toString(game.subStatus))}};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const ListPhrasesCommand&) {
	const auto session = requireSession(connection);
	return reply("PHRASE_LIST", m_lobby.listPhrases(session.gameId, session.playerId), [](const std::vector<PhraseListing>& listing) {
		Fields fields{{"count", std::to_string(listing.size())}};
		for (const auto& entry: listing) {
			fields.emplace_back(entry.phrase.id, std::format("{}|{}", entry.authorName, entry.phrase.text));
		}
		return fields;
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const StartGameCommand&) {
	const auto session = requireSession(connection);
	return reply("START_GAME", m_stateMachine.startGame(session.gameId), [](const StartGameResult& result) {
		return Fields{{"players", std::to_string(result.turnOrder.size())}, {"turn", result.firstTurn.id}, {"player", result.firstPlayer.id}};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const StartRoundCommand&) {
	const auto session = requireSession(connection);
	return reply("START_ROUND", m_stateMachine.startRound(session.gameId), [](const StartRoundResult& result) {
		return Fields{
		        {"round", std::to_string(result.round)},
		        {"name", result.roundName},
		        {"turn", result.currentTurn.id},
		        {"player", result.currentPlayer.id},
		        {"reset", std::to_string(result.resetPhrases)},
		};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const NextRoundCommand&) {
	const auto session = requireSession(connection);
	return reply("NEXT_ROUND", m_stateMachine.advanceRound(session.gameId), [](const Game& game) {
		return Fields{{"round", std::to_string(game.currentRound)}, {"name", std::string(roundName(game.currentRound))}};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const StartTurnCommand&) {
	const auto session = requireSession(connection);
	return reply("START_TURN", m_stateMachine.startTurn(session.gameId, session.playerId), [](const Turn& turn) {
		return Fields{{"turn", turn.id}};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const RecordPhraseCommand& command) {
	const auto session = requireSession(connection);
	const auto outcome = m_stateMachine.recordPhrase(session.gameId, session.playerId, command.phraseId, command.action);
	return reply(commandName(command), outcome, [](const RecordPhraseResult& result) {
		return Fields{
		        {"remaining", std::to_string(result.remainingPhrases)},
		        {"points", std::to_string(result.turn.pointsScored)},
		        {"round_complete", flag(result.roundComplete)},
		        {"game_complete", flag(result.gameComplete)},
		};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const PauseCommand&) {
	const auto session = requireSession(connection);
	auto outcome       = m_stateMachine.pauseTurn(session.gameId, PauseReason::HostPaused);
	if (succeeded(outcome)) {
		broadcast(session.gameId, formatEvent("turn_paused", Fields{{"game", session.gameId}, {"player", session.playerId}, {"reason", "host_paused"}}));
	}
	return reply("PAUSE", outcome, [](const Game&) { return Fields{}; });
}

std::string CommandDispatcher::execute(ConnectionId connection, const ResumeCommand&) {
	const auto session = requireSession(connection);
	auto outcome       = m_stateMachine.resumeTurn(session.gameId);
	if (succeeded(outcome)) {
		broadcast(session.gameId, formatEvent("turn_resumed", Fields{{"game", session.gameId}}));
	}
	return reply("RESUME", outcome, [](const Game&) { return Fields{}; });
}

std::string CommandDispatcher::execute(ConnectionId connection, const EndTurnCommand& command) {
	const auto session = requireSession(connection);
	return reply("END_TURN", m_stateMachine.endTurn(session.gameId, session.playerId, command.expectedTurnId), [](const EndTurnResult& result) {
		return Fields{
		        {"points", std::to_string(result.completedTurn.pointsScored)},
		        {"next_turn", result.nextTurn.id},
		        {"next_player", result.nextPlayer.id},
		};
	});
}

std::string CommandDispatcher::execute(ConnectionId connection, const StateCommand&) {
	const auto session = requireSession(connection);
	return reply("STATE", m_stateMachine.snapshot(session.gameId), [](const GameSnapshot& snapshot) {
		std::string scores;
		for (const auto& team: snapshot.teams) {
			scores += std::format("{}{}={}", scores.empty() ? "" : ",", team.id, team.totalScore);
		}

		return Fields{
		        {"status", std::string(toString(snapshot.game.status))},
		        {"sub_status", std::string(toString(snapshot.game.subStatus))},
		        {"round", std::to_string(snapshot.game.currentRound)},
		        {"turn", snapshot.currentTurn ? snapshot.currentTurn->id : ""},
		        {"player", snapshot.currentTurn ? snapshot.currentTurn->playerId : ""},
		        {"phrases", std::to_string(snapshot.activePhrases)},
		        {"scores", scores},
		};
	});
}

CommandDispatcher::Session CommandDispatcher::requireSession(ConnectionId connection) const {
	const auto entry = m_presence.entryOf(connection);
	if (!entry) {
		throw GameError(notFoundError("Connection has not joined a game"));
	}
	return Session{.gameId = entry->gameId, .playerId = entry->playerId};
}

Outcome<Player> CommandDispatcher::bind(ConnectionId connection, const GameId& gameId, const PlayerId& playerId) {
	auto outcome = m_presence.join(gameId, playerId, connection);
	if (!succeeded(outcome)) {
		return outcome;
	}

	const auto snapshot = m_stateMachine.snapshot(gameId);
	const auto* state   = std::get_if<GameSnapshot>(&snapshot);
	if (state && state->game.subStatus == SubStatus::TurnPaused && state->currentTurn && state->currentTurn->playerId == playerId &&
	    state->currentTurn->pausedReason == PauseReason::PlayerDisconnected) {
		if (succeeded(m_stateMachine.resumeTurn(gameId))) {
			broadcast(gameId, formatEvent("turn_resumed", Fields{{"game", gameId}}));
		}
	}
	return outcome;
}

void CommandDispatcher::departed(const GameId& gameId, const PlayerId& playerId) {
	const auto snapshot = m_stateMachine.snapshot(gameId);
	const auto* state   = std::get_if<GameSnapshot>(&snapshot);
	if (!state || !state->currentTurn || state->currentTurn->playerId != playerId) {
		return;
	}

	if (state->game.subStatus == SubStatus::TurnActive) {
		if (succeeded(m_stateMachine.pauseTurn(gameId, PauseReason::PlayerDisconnected))) {
			broadcast(gameId, formatEvent("turn_paused", Fields{{"game", gameId}, {"player", playerId}, {"reason", "player_disconnected"}}));
		}
	} else if (state->game.subStatus == SubStatus::TurnStarting) {
		const auto handed = m_stateMachine.endTurn(gameId, playerId, state->currentTurn->id);
		if (const auto* error = std::get_if<Error>(&handed)) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Dispatcher] Turn of departed player '{}' stays in game '{}': {}", playerId, gameId, error->message));
		}
	}
}

void CommandDispatcher::broadcast(const GameId& gameId, const std::string& message) {
	for (const auto connection: m_presence.connections(gameId)) {
		m_send(connection, message);
	}
}

} // namespace fishbowl::server
