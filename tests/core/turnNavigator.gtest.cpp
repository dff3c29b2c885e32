#include "core/memoryStore.hpp"
#include "core/turnNavigator.hpp"
#include "core/turnOrderBuilder.hpp"

#include "fixtures.hpp"

#include <gtest/gtest.h>

#include <set>

namespace fishbowl::gtest {

//! Game with players p0..p<n-1> on two teams and a ring in id order p0 -> p1 -> ... -> p0.
class TurnNavigatorTest : public ::testing::Test {
protected:
	void SetUp() override {
		seedGame(m_store, "GAME01", {3u, 3u});

		auto tx = m_store.begin("GAME01");
		TurnOrderBuilder builder(m_random);
		for (const auto& node: builder.link("GAME01", {"p0", "p1", "p2", "p3", "p4", "p5"}, tx->players())) {
			tx->insert(node);
		}
		tx->commit();
	}

	std::optional<PlayerId> next(const PlayerId& playerId) {
		return m_navigator.nextPlayer(*m_store.begin("GAME01"), playerId);
	}

	MemoryStore m_store;
	Random m_random{5u};
	TurnNavigator m_navigator{m_random};
};

TEST_F(TurnNavigatorTest, NextFollowsTheRing) {
	EXPECT_EQ(next("p0"), "p1");
	EXPECT_EQ(next("p3"), "p4");
	EXPECT_EQ(next("p5"), "p0");
}

TEST_F(TurnNavigatorTest, SkipsDisconnectedTail) {
	// p5 closes the ring. From p4 the walk passes over it to the head.
	setConnected(m_store, "GAME01", "p5", false);

	EXPECT_EQ(next("p3"), "p4");
	EXPECT_EQ(next("p4"), "p0");
}

TEST_F(TurnNavigatorTest, SkipsSeveralDisconnected) {
	setConnected(m_store, "GAME01", "p1", false);
	setConnected(m_store, "GAME01", "p2", false);
	setConnected(m_store, "GAME01", "p3", false);

	EXPECT_EQ(next("p0"), "p4");
}

TEST_F(TurnNavigatorTest, DisconnectedCurrentPlayerStillHandsOver) {
	setConnected(m_store, "GAME01", "p2", false);
	EXPECT_EQ(next("p2"), "p3");
}

TEST_F(TurnNavigatorTest, SoleConnectedPlayerWrapsToSelf) {
	for (const auto* id: {"p0", "p1", "p3", "p4", "p5"}) {
		setConnected(m_store, "GAME01", id, false);
	}
	EXPECT_EQ(next("p2"), "p2");
}

TEST_F(TurnNavigatorTest, NobodyConnected) {
	for (const auto* id: {"p0", "p1", "p2", "p3", "p4", "p5"}) {
		setConnected(m_store, "GAME01", id, false);
	}

	EXPECT_FALSE(next("p0").has_value());
	EXPECT_FALSE(m_navigator.randomStartPlayer(*m_store.begin("GAME01")).has_value());
	EXPECT_TRUE(m_navigator.activePlayers(*m_store.begin("GAME01")).empty());
}

TEST_F(TurnNavigatorTest, MissingNodeIsIntegrityError) {
	try {
		next("stranger");
		FAIL() << "Navigation from an unknown player succeeded";
	} catch (const GameError& e) {
		EXPECT_EQ(e.error().kind, ErrorKind::Integrity);
	}
}

TEST_F(TurnNavigatorTest, BrokenLinkIsIntegrityError) {
	{
		auto tx = m_store.begin("GAME01");
		tx->removeGame();
		tx->commit();
	}
	seedGame(m_store, "GAME01", {2u, 2u});
	{
		auto tx = m_store.begin("GAME01");
		tx->insert(TurnOrderNode{.id = "n0", .gameId = "GAME01", .playerId = "p0", .nextPlayerId = "p1", .prevPlayerId = "p1"});
		tx->insert(TurnOrderNode{.id = "n1", .gameId = "GAME01", .playerId = "p1", .nextPlayerId = "ghost", .prevPlayerId = "p0"});
		tx->commit();
	}
	setConnected(m_store, "GAME01", "p1", false);

	EXPECT_THROW(next("p0"), GameError);
}

TEST_F(TurnNavigatorTest, ActivePlayersInDraftOrder) {
	setConnected(m_store, "GAME01", "p3", false);

	const std::vector<PlayerId> expected{"p0", "p1", "p2", "p4", "p5"};
	EXPECT_EQ(m_navigator.activePlayers(*m_store.begin("GAME01")), expected);
	EXPECT_FALSE(m_navigator.isPlayerActive(*m_store.begin("GAME01"), "p3"));
	EXPECT_TRUE(m_navigator.isPlayerActive(*m_store.begin("GAME01"), "p4"));
	EXPECT_FALSE(m_navigator.isPlayerActive(*m_store.begin("GAME01"), "stranger"));
}

TEST_F(TurnNavigatorTest, RandomStartPicksConnectedPlayers) {
	setConnected(m_store, "GAME01", "p0", false);
	setConnected(m_store, "GAME01", "p1", false);

	std::set<PlayerId> picked;
	for (int i = 0; i != 200; ++i) {
		const auto player = m_navigator.randomStartPlayer(*m_store.begin("GAME01"));
		ASSERT_TRUE(player.has_value());
		picked.insert(*player);
	}

	EXPECT_FALSE(picked.contains("p0"));
	EXPECT_FALSE(picked.contains("p1"));
	EXPECT_EQ(picked.size(), 4u);
}

TEST_F(TurnNavigatorTest, CurrentPlayerWithoutTurn) {
	EXPECT_FALSE(m_navigator.currentPlayer(*m_store.begin("GAME01")).has_value());
}

} // namespace fishbowl::gtest
