#include "server/commandDispatcher.hpp"

#include "core/memoryStore.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <map>

namespace fishbowl::gtest {

using namespace server;

//! Key value fields of an "OK:<command>:k=v;..." reply.
static std::map<std::string, std::string> replyFields(const std::string& reply) {
	std::map<std::string, std::string> fields;

	const auto start = reply.find(':', 3);
	if (!reply.starts_with("OK:") || start == std::string::npos) {
		return fields;
	}

	std::size_t begin = start + 1;
	while (begin < reply.size()) {
		auto end = reply.find(';', begin);
		if (end == std::string::npos) {
			end = reply.size();
		}
		const auto item = reply.substr(begin, end - begin);
		const auto eq   = item.find('=');
		fields[item.substr(0, eq)] = eq == std::string::npos ? "" : item.substr(eq + 1);
		begin                      = end + 1;
	}
	return fields;
}

class CommandDispatcherTest : public ::testing::Test {
protected:
	std::string handle(ConnectionId connection, const std::string& payload) {
		return m_dispatcher.handle(connection, payload);
	}

	//! Create a game on connection 1 and add three players on connections 2 to 4, each with a full phrase quota.
	void setupGame() {
		const auto created = handle(1u, "CREATE:Friday:Host:2:3:60");
		ASSERT_TRUE(created.starts_with("OK:CREATE:")) << created;
		m_gameId = replyFields(created)["game"];
		m_players[1u] = replyFields(created)["player"];

		for (ConnectionId connection = 2u; connection <= 4u; ++connection) {
			const auto joined = handle(connection, std::format("JOIN_GAME:{}:Player{}", m_gameId, connection));
			ASSERT_TRUE(joined.starts_with("OK:JOIN_GAME:")) << joined;
			m_players[connection] = replyFields(joined)["player"];
		}
		for (ConnectionId connection = 1u; connection <= 4u; ++connection) {
			const auto submitted = handle(connection, std::format("PHRASES:first {0}|second {0}|third {0}", connection));
			ASSERT_EQ(replyFields(submitted)["submitted"], "3") << submitted;
		}
	}

	ConnectionId connectionOf(const PlayerId& playerId) const {
		for (const auto& [connection, player]: m_players) {
			if (player == playerId) {
				return connection;
			}
		}
		ADD_FAILURE() << "No connection for player " << playerId;
		return 0u;
	}

	std::vector<std::string> sentTo(ConnectionId connection) const {
		std::vector<std::string> messages;
		for (const auto& [target, message]: m_sent) {
			if (target == connection) {
				messages.push_back(message);
			}
		}
		return messages;
	}

	std::size_t sentCount(const std::string& prefix) const {
		return static_cast<std::size_t>(
		        std::count_if(m_sent.begin(), m_sent.end(), [&](const auto& entry) { return entry.second.starts_with(prefix); }));
	}

	MemoryStore m_store;
	Random m_random{31u};
	std::vector<std::pair<ConnectionId, std::string>> m_sent;
	CommandDispatcher m_dispatcher{m_store, m_random, std::chrono::seconds(60),
	                               [this](ConnectionId connection, const std::string& message) { m_sent.emplace_back(connection, message); }};

	GameId m_gameId;
	std::map<ConnectionId, PlayerId> m_players;
};

TEST_F(CommandDispatcherTest, RejectsMalformedAndUnboundCommands) {
	EXPECT_EQ(handle(1u, "DANCE"), "ERROR:validation:Malformed command");
	EXPECT_EQ(handle(1u, "STATE"), "ERROR:not_found:Connection has not joined a game");
	EXPECT_EQ(handle(1u, "JOIN:NOGAME:someone").rfind("ERROR:not_found:", 0), 0u);
	EXPECT_TRUE(m_sent.empty());
}

TEST_F(CommandDispatcherTest, UnknownGamesDoNotGrowTheStore) {
	for (int i = 0; i < 1000; ++i) {
		EXPECT_EQ(handle(1u, std::format("JOIN:BOGUS{}:someone", i)).rfind("ERROR:not_found:", 0), 0u);
		EXPECT_EQ(handle(1u, std::format("JOIN_GAME:BOGUS{}:someone", i)).rfind("ERROR:not_found:", 0), 0u);
	}
	EXPECT_EQ(m_store.gameCount(), 0u);
	EXPECT_EQ(m_store.shardCount(), 0u);
}

TEST_F(CommandDispatcherTest, LobbyFlow) {
	setupGame();

	const auto state = replyFields(handle(1u, "STATE"));
	EXPECT_EQ(state.at("status"), "setup");
	EXPECT_EQ(state.at("sub_status"), "ready_to_start");

	const auto config = handle(2u, "CONFIG:::90");
	EXPECT_EQ(replyFields(config)["timer"], "90");
	EXPECT_EQ(replyFields(config)["teams"], "2");

	EXPECT_EQ(handle(2u, "CONFIG:1::").rfind("ERROR:validation:", 0), 0u);
	EXPECT_EQ(handle(2u, "PHRASES:one more").rfind("ERROR:validation:", 0), 0u);
}

TEST_F(CommandDispatcherTest, StartGameBroadcasts) {
	setupGame();

	const auto reply = handle(1u, "START_GAME");
	ASSERT_TRUE(reply.starts_with("OK:START_GAME:")) << reply;
	EXPECT_EQ(replyFields(reply)["players"], "4");

	for (ConnectionId connection = 1u; connection <= 4u; ++connection) {
		const auto messages = sentTo(connection);
		ASSERT_EQ(messages.size(), 1u);
		EXPECT_TRUE(messages.front().starts_with(std::format("EVENT:game_started:game={};players=4;", m_gameId)));
	}

	const auto state = replyFields(handle(3u, "STATE"));
	EXPECT_EQ(state.at("status"), "playing");
	EXPECT_EQ(state.at("sub_status"), "round_intro");
	EXPECT_EQ(state.at("round"), "1");
	EXPECT_EQ(handle(1u, "START_GAME").rfind("ERROR:state_conflict:", 0), 0u);
}

TEST_F(CommandDispatcherTest, TurnFlow) {
	setupGame();
	handle(1u, "START_GAME");

	const auto round = replyFields(handle(2u, "START_ROUND"));
	const auto actor = connectionOf(round.at("player"));
	const auto other = actor == 1u ? 2u : 1u;
	EXPECT_EQ(round.at("round"), "1");
	EXPECT_EQ(sentCount("EVENT:round_started:"), 4u);

	EXPECT_EQ(handle(other, "START_TURN").rfind("ERROR:forbidden:", 0), 0u);
	EXPECT_EQ(replyFields(handle(actor, "START_TURN"))["turn"], round.at("turn"));
	EXPECT_EQ(sentCount("EVENT:turn_started:"), 4u);

	const auto ended = handle(actor, std::format("END_TURN:{}", round.at("turn")));
	ASSERT_TRUE(ended.starts_with("OK:END_TURN:")) << ended;
	EXPECT_EQ(replyFields(ended)["points"], "0");
	EXPECT_EQ(sentCount("EVENT:turn_ended:"), 4u);

	// A repeated end turn for the same turn is stale.
	EXPECT_EQ(handle(actor, std::format("END_TURN:{}", round.at("turn"))).rfind("ERROR:state_conflict:", 0), 0u);

	const auto state = replyFields(handle(other, "STATE"));
	EXPECT_EQ(state.at("sub_status"), "turn_starting");
	EXPECT_EQ(state.at("player"), replyFields(ended)["next_player"]);
}

TEST_F(CommandDispatcherTest, DisconnectPausesAndRejoinResumes) {
	setupGame();
	handle(1u, "START_GAME");

	const auto round = replyFields(handle(1u, "START_ROUND"));
	const auto actor = connectionOf(round.at("player"));
	const auto other = actor == 1u ? 2u : 1u;
	handle(actor, "START_TURN");

	m_sent.clear();
	m_dispatcher.disconnected(actor);

	EXPECT_EQ(sentCount("EVENT:turn_paused:"), 3u);
	EXPECT_TRUE(sentTo(actor).empty());
	EXPECT_EQ(replyFields(handle(other, "STATE")).at("sub_status"), "turn_paused");

	const auto rejoined = handle(9u, std::format("JOIN:{}:{}", m_gameId, round.at("player")));
	ASSERT_TRUE(rejoined.starts_with("OK:JOIN:")) << rejoined;
	EXPECT_EQ(sentCount("EVENT:turn_resumed:"), 4u);
	EXPECT_EQ(replyFields(handle(other, "STATE")).at("sub_status"), "turn_active");

	// The rejoined connection acts for the player.
	EXPECT_TRUE(handle(9u, "END_TURN").starts_with("OK:END_TURN:"));
}

TEST_F(CommandDispatcherTest, DisconnectOfBystanderKeepsTurnRunning) {
	setupGame();
	handle(1u, "START_GAME");

	const auto round = replyFields(handle(1u, "START_ROUND"));
	const auto actor = connectionOf(round.at("player"));
	handle(actor, "START_TURN");

	const auto bystander = actor == 4u ? 3u : 4u;
	m_dispatcher.disconnected(bystander);

	EXPECT_EQ(sentCount("EVENT:turn_paused:"), 0u);
	EXPECT_EQ(replyFields(handle(actor, "STATE")).at("sub_status"), "turn_active");
}

TEST_F(CommandDispatcherTest, LeaveDuringActiveTurnPauses) {
	setupGame();
	handle(1u, "START_GAME");

	const auto round = replyFields(handle(1u, "START_ROUND"));
	const auto actor = connectionOf(round.at("player"));
	const auto other = actor == 1u ? 2u : 1u;
	handle(actor, "START_TURN");

	m_sent.clear();
	EXPECT_EQ(handle(actor, "LEAVE"), "OK:LEAVE");

	EXPECT_EQ(sentCount("EVENT:turn_paused:"), 3u);
	EXPECT_TRUE(sentTo(actor).empty());
	EXPECT_EQ(replyFields(handle(other, "STATE")).at("sub_status"), "turn_paused");

	const auto rejoined = handle(actor, std::format("JOIN:{}:{}", m_gameId, round.at("player")));
	ASSERT_TRUE(rejoined.starts_with("OK:JOIN:")) << rejoined;
	EXPECT_EQ(sentCount("EVENT:turn_resumed:"), 4u);
	EXPECT_EQ(replyFields(handle(other, "STATE")).at("sub_status"), "turn_active");
}

TEST_F(CommandDispatcherTest, DepartureBeforeTurnStartHandsTurnOn) {
	setupGame();
	handle(1u, "START_GAME");

	const auto round = replyFields(handle(1u, "START_ROUND"));
	const auto actor = connectionOf(round.at("player"));
	const auto other = actor == 1u ? 2u : 1u;

	m_sent.clear();
	m_dispatcher.disconnected(actor);

	EXPECT_EQ(sentCount("EVENT:turn_ended:"), 3u);
	const auto state = replyFields(handle(other, "STATE"));
	EXPECT_EQ(state.at("sub_status"), "turn_starting");
	EXPECT_NE(state.at("turn"), round.at("turn"));
	EXPECT_NE(state.at("player"), round.at("player"));

	// The new actor leaves before starting as well, and the turn moves on again.
	const auto next = connectionOf(state.at("player"));
	ConnectionId stay = 1u;
	while (stay == actor || stay == next) {
		++stay;
	}
	EXPECT_EQ(handle(next, "LEAVE"), "OK:LEAVE");
	const auto after = replyFields(handle(stay, "STATE"));
	EXPECT_EQ(after.at("sub_status"), "turn_starting");
	EXPECT_NE(after.at("player"), state.at("player"));
	EXPECT_NE(after.at("player"), round.at("player"));

	EXPECT_TRUE(handle(connectionOf(after.at("player")), "START_TURN").starts_with("OK:START_TURN:"));
}

TEST_F(CommandDispatcherTest, PhraseEditingDuringSetup) {
	setupGame();

	const auto listed = replyFields(handle(1u, "PHRASE_LIST"));
	EXPECT_EQ(listed.at("count"), "12");
	EXPECT_EQ(handle(2u, "PHRASE_LIST").rfind("ERROR:forbidden:", 0), 0u);

	const auto phrases = m_store.begin(m_gameId)->phrases();
	const auto own     = std::find_if(phrases.begin(), phrases.end(), [&](const Phrase& p) { return p.playerId == m_players[2u]; });
	ASSERT_NE(own, phrases.end());
	EXPECT_EQ(listed.at(own->id), std::format("Player2|{}", own->text));

	const auto edited = replyFields(handle(2u, std::format("PHRASE_EDIT:{}:Star Wars: A New Hope", own->id)));
	EXPECT_EQ(edited.at("text"), "Star Wars: A New Hope");
	EXPECT_EQ(handle(3u, std::format("PHRASE_EDIT:{}:Hijack", own->id)).rfind("ERROR:forbidden:", 0), 0u);
	EXPECT_EQ(handle(3u, std::format("PHRASE_DELETE:{}", own->id)).rfind("ERROR:forbidden:", 0), 0u);

	EXPECT_EQ(handle(1u, std::format("PHRASE_DELETE:{}", own->id)), "OK:PHRASE_DELETE:sub_status=waiting_for_players");
	EXPECT_EQ(replyFields(handle(2u, "PHRASES:first 3")).size(), 0u);
	EXPECT_EQ(replyFields(handle(2u, "PHRASES:Replacement"))["submitted"], "3");
	EXPECT_EQ(replyFields(handle(1u, "STATE")).at("sub_status"), "ready_to_start");
}

TEST_F(CommandDispatcherTest, HostPauseAndResume) {
	setupGame();
	handle(1u, "START_GAME");
	const auto round = replyFields(handle(1u, "START_ROUND"));
	handle(connectionOf(round.at("player")), "START_TURN");

	EXPECT_EQ(handle(1u, "PAUSE"), "OK:PAUSE");
	EXPECT_EQ(sentCount("EVENT:turn_paused:"), 4u);
	EXPECT_EQ(handle(1u, "PAUSE").rfind("ERROR:state_conflict:", 0), 0u);
	EXPECT_EQ(handle(2u, "RESUME"), "OK:RESUME");
	EXPECT_EQ(sentCount("EVENT:turn_resumed:"), 4u);
}

TEST_F(CommandDispatcherTest, GuessUntilRoundCompletes) {
	setupGame();
	handle(1u, "START_GAME");
	const auto round = replyFields(handle(1u, "START_ROUND"));
	const auto actor = connectionOf(round.at("player"));
	handle(actor, "START_TURN");

	const auto phrases = m_store.begin(m_gameId)->phrases();

	std::string last;
	for (const auto& phrase: phrases) {
		last = handle(actor, "GUESS:" + phrase.id);
		ASSERT_TRUE(last.starts_with("OK:GUESS:")) << last;
	}

	const auto fields = replyFields(last);
	EXPECT_EQ(fields.at("remaining"), "0");
	EXPECT_EQ(fields.at("points"), "12");
	EXPECT_EQ(fields.at("round_complete"), "1");
	EXPECT_EQ(fields.at("game_complete"), "0");
	EXPECT_EQ(sentCount("EVENT:round_completed:"), 4u);

	const auto state = replyFields(handle(1u, "STATE"));
	EXPECT_EQ(state.at("sub_status"), "round_complete");
	EXPECT_NE(state.at("scores").find("=12"), std::string::npos);

	const auto next = replyFields(handle(1u, "NEXT_ROUND"));
	EXPECT_EQ(next.at("round"), "2");
	EXPECT_EQ(next.at("name"), "Charades");
}

TEST_F(CommandDispatcherTest, LeaveUnbindsConnection) {
	setupGame();

	EXPECT_EQ(handle(4u, "LEAVE"), "OK:LEAVE");
	EXPECT_EQ(handle(4u, "STATE"), "ERROR:not_found:Connection has not joined a game");
	EXPECT_EQ(handle(4u, "LEAVE"), "ERROR:not_found:Connection has not joined a game");
}

TEST_F(CommandDispatcherTest, ExpireForgetsDroppedSessions) {
	auto now = Clock::now();
	CommandDispatcher dispatcher(m_store, m_random, std::chrono::seconds(60), [](ConnectionId, const std::string&) {}, [&now] { return now; });

	const auto created = dispatcher.handle(1u, "CREATE:Friday:Host");
	const auto gameId  = replyFields(created)["game"];
	const auto player  = replyFields(created)["player"];

	dispatcher.disconnected(1u);
	now += std::chrono::seconds(61);
	dispatcher.expireSessions();

	// The player still exists and can bind a new connection explicitly.
	EXPECT_TRUE(dispatcher.handle(2u, std::format("JOIN:{}:{}", gameId, player)).starts_with("OK:JOIN:"));
}

} // namespace fishbowl::gtest
