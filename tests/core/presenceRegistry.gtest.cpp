#include "core/memoryStore.hpp"
#include "core/presenceRegistry.hpp"

#include "fixtures.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace fishbowl::gtest {

class PresenceRegistryTest : public ::testing::Test {
protected:
	void SetUp() override {
		m_roster = seedGame(m_store, "GAME01", {2u, 2u});
	}

	bool storedFlag(const PlayerId& playerId) {
		return m_store.begin("GAME01")->player(playerId).value().isConnected;
	}

	MemoryStore m_store;
	ManualClock m_clock;
	PresenceRegistry m_presence{m_store, std::chrono::seconds(60), m_clock.function()};
	Roster m_roster;
};

TEST_F(PresenceRegistryTest, JoinMarksConnected) {
	setConnected(m_store, "GAME01", "p1", false);

	const auto player = unwrap(m_presence.join("GAME01", "p1", 7u));
	EXPECT_TRUE(player.isConnected);
	EXPECT_TRUE(storedFlag("p1"));
	EXPECT_TRUE(m_presence.isConnected("p1"));

	const auto entry = m_presence.entryOf(7u);
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(entry->playerId, "p1");
	EXPECT_EQ(entry->gameId, "GAME01");
}

TEST_F(PresenceRegistryTest, JoinUnknownPlayerFails) {
	EXPECT_EQ(errorOf(m_presence.join("GAME01", "stranger", 1u)).kind, ErrorKind::NotFound);
	EXPECT_EQ(errorOf(m_presence.join("NOGAME", "p0", 1u)).kind, ErrorKind::NotFound);
	EXPECT_FALSE(m_presence.entryOf(1u).has_value());
}

TEST_F(PresenceRegistryTest, DisconnectKeepsSession) {
	unwrap(m_presence.join("GAME01", "p0", 1u));

	const auto dropped = m_presence.disconnect(1u);
	ASSERT_TRUE(dropped.has_value());
	EXPECT_EQ(dropped->playerId, "p0");
	EXPECT_FALSE(dropped->connected);

	EXPECT_FALSE(storedFlag("p0"));
	EXPECT_FALSE(m_presence.isConnected("p0"));
	EXPECT_FALSE(m_presence.entryOf(1u).has_value());
	EXPECT_TRUE(m_presence.entry("p0").has_value());

	EXPECT_FALSE(m_presence.disconnect(1u).has_value());
}

TEST_F(PresenceRegistryTest, ReconnectRestoresSession) {
	unwrap(m_presence.join("GAME01", "p2", 1u));
	m_presence.disconnect(1u);

	const auto player = unwrap(m_presence.reconnect("p2", 2u));
	EXPECT_TRUE(player.isConnected);
	EXPECT_TRUE(storedFlag("p2"));
	EXPECT_EQ(m_presence.entry("p2")->connectionId, 2u);

	EXPECT_EQ(errorOf(m_presence.reconnect("p3", 3u)).kind, ErrorKind::NotFound);
}

TEST_F(PresenceRegistryTest, LeaveForgetsPlayer) {
	unwrap(m_presence.join("GAME01", "p0", 1u));
	unwrap(m_presence.leave("p0"));

	EXPECT_FALSE(storedFlag("p0"));
	EXPECT_FALSE(m_presence.entry("p0").has_value());
	EXPECT_FALSE(m_presence.entryOf(1u).has_value());
	EXPECT_EQ(errorOf(m_presence.leave("p0")).kind, ErrorKind::NotFound);
}

TEST_F(PresenceRegistryTest, SwitchingPlayerOnConnection) {
	unwrap(m_presence.join("GAME01", "p0", 1u));
	unwrap(m_presence.join("GAME01", "p1", 1u));

	EXPECT_FALSE(storedFlag("p0"));
	EXPECT_FALSE(m_presence.isConnected("p0"));
	EXPECT_TRUE(m_presence.isConnected("p1"));
	EXPECT_EQ(m_presence.entryOf(1u)->playerId, "p1");
}

TEST_F(PresenceRegistryTest, MovingPlayerToNewConnection) {
	unwrap(m_presence.join("GAME01", "p0", 1u));
	unwrap(m_presence.join("GAME01", "p0", 2u));

	EXPECT_FALSE(m_presence.entryOf(1u).has_value());
	EXPECT_EQ(m_presence.entryOf(2u)->playerId, "p0");
	EXPECT_TRUE(storedFlag("p0"));
}

TEST_F(PresenceRegistryTest, ExpireAfterTtl) {
	unwrap(m_presence.join("GAME01", "p0", 1u));
	unwrap(m_presence.join("GAME01", "p1", 2u));
	m_presence.disconnect(1u);

	m_clock.advance(std::chrono::seconds(60));
	EXPECT_TRUE(m_presence.expire().empty());

	m_clock.advance(std::chrono::seconds(1));
	const auto expired = m_presence.expire();
	ASSERT_EQ(expired.size(), 1u);
	EXPECT_EQ(expired.front().playerId, "p0");

	EXPECT_FALSE(m_presence.entry("p0").has_value());
	EXPECT_TRUE(m_presence.entry("p1").has_value());
	EXPECT_EQ(errorOf(m_presence.reconnect("p0", 3u)).kind, ErrorKind::NotFound);
}

TEST_F(PresenceRegistryTest, ConnectionsOfGame) {
	seedGame(m_store, "GAME02", {2u, 2u});
	unwrap(m_presence.join("GAME01", "p0", 1u));
	unwrap(m_presence.join("GAME01", "p1", 2u));
	unwrap(m_presence.join("GAME02", "p2", 3u));
	m_presence.disconnect(2u);

	EXPECT_EQ(m_presence.connections("GAME01"), std::vector<ConnectionId>{1u});
	EXPECT_EQ(m_presence.connections("GAME02"), std::vector<ConnectionId>{3u});
	EXPECT_TRUE(m_presence.connections("GAME03").empty());
}

} // namespace fishbowl::gtest
