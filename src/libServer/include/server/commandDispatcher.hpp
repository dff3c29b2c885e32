#pragma once

#include "core/IGameEventListener.hpp"
#include "core/eventHub.hpp"
#include "core/gameLobby.hpp"
#include "core/gameStateMachine.hpp"
#include "core/presenceRegistry.hpp"
#include "server/commands.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace fishbowl::server {

//! Delivers a text frame to a connection.
using SendFunction = std::function<void(ConnectionId, const std::string&)>;

//! Application layer of the server. Maps client commands to the engine and broadcasts committed game events.
//! A connection is bound to one player of one game through CREATE, JOIN_GAME or JOIN; game commands act for that player.
//! \note Not thread safe. The server loop is the only caller.
class CommandDispatcher : public IGameEventListener {
public:
	CommandDispatcher(IEntityStore& store, Random& random, std::chrono::seconds sessionTtl, SendFunction send,
	                  NowFunction now = [] { return Clock::now(); });
	~CommandDispatcher() override;

	//! Execute one client payload and return the reply frame.
	std::string handle(ConnectionId connection, const std::string& payload);

	//! Connection dropped. The turn of the player on this connection is paused or handed on.
	void disconnected(ConnectionId connection);

	//! Forget sessions disconnected for longer than the session TTL.
	void expireSessions();

	void onGameEvent(const GameEvent& event) override;

private:
	struct Session {
		GameId gameId;
		PlayerId playerId;
	};

	std::string execute(ConnectionId connection, const CreateGameCommand& command);
	std::string execute(ConnectionId connection, const JoinGameCommand& command);
	std::string execute(ConnectionId connection, const JoinCommand& command);
	std::string execute(ConnectionId connection, const LeaveCommand& command);
	std::string execute(ConnectionId connection, const AssignTeamCommand& command);
	std::string execute(ConnectionId connection, const UpdateConfigCommand& command);
	std::string execute(ConnectionId connection, const SubmitPhrasesCommand& command);
	std::string execute(ConnectionId connection, const EditPhraseCommand& command);
	std::string execute(ConnectionId connection, const DeletePhraseCommand& command);
	std::string execute(ConnectionId connection, const ListPhrasesCommand& command);
	std::string execute(ConnectionId connection, const StartGameCommand& command);
	std::string execute(ConnectionId connection, const StartRoundCommand& command);
	std::string execute(ConnectionId connection, const NextRoundCommand& command);
	std::string execute(ConnectionId connection, const StartTurnCommand& command);
	std::string execute(ConnectionId connection, const RecordPhraseCommand& command);
	std::string execute(ConnectionId connection, const PauseCommand& command);
	std::string execute(ConnectionId connection, const ResumeCommand& command);
	std::string execute(ConnectionId connection, const EndTurnCommand& command);
	std::string execute(ConnectionId connection, const StateCommand& command);

	//! Player bound to the connection. Throws GameError(NotFound) if the connection joined nothing.
	Session requireSession(ConnectionId connection) const;

	//! Bind the connection to a player and resume the player's turn if their disconnect paused it.
	Outcome<Player> bind(ConnectionId connection, const GameId& gameId, const PlayerId& playerId);

	//! Player went away through LEAVE or a dropped connection.
	//! An active turn of theirs is paused until they rejoin. A turn they have not started yet moves to the next connected player.
	void departed(const GameId& gameId, const PlayerId& playerId);

	void broadcast(const GameId& gameId, const std::string& message);

private:
	EventHub m_events;
	GameLobby m_lobby;
	GameStateMachine m_stateMachine;
	PresenceRegistry m_presence;
	SendFunction m_send;
};

} // namespace fishbowl::server
