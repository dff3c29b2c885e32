#pragma once

#include "core/IEntityStore.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace fishbowl {

//! All rows belonging to one game.
struct GameTables {
	std::optional<Game> game;
	std::vector<Team> teams;
	std::vector<Player> players;
	std::vector<Phrase> phrases;
	std::vector<Turn> turns;
	std::vector<TurnOrderNode> turnOrder;
};

class MemoryTransaction;

//! In-process entity store.
//! Each game lives in its own shard guarded by a mutex that a transaction holds until commit or rollback.
//! Transactions work on a private copy of the shard, so a rollback simply drops the copy.
//! A shard without a committed game is dropped once the last transaction on it ends.
class MemoryStore : public IEntityStore {
public:
	struct Shard {
		std::mutex mutex;                 //!< Held for the lifetime of a transaction.
		GameTables tables;                //!< Committed state.
		std::atomic<bool> exists{false};  //!< Committed game row present.
		std::size_t users{0u};            //!< Open or waiting transactions. Guarded by the store's map mutex.
	};

	std::unique_ptr<ITransaction> begin(const GameId& gameId) override;
	bool contains(const GameId& gameId) const override;

	std::size_t gameCount() const;  //!< Number of committed games.
	std::size_t shardCount() const; //!< Games with committed rows or open transactions.

private:
	friend class MemoryTransaction;

	std::shared_ptr<Shard> acquire(const GameId& gameId); //!< Find or create the shard of a game and register a user.
	void release(const GameId& gameId);                   //!< Unregister a user. Drops the shard if it holds no game.

private:
	mutable std::mutex m_shardsMutex;
	std::unordered_map<GameId, std::shared_ptr<Shard>> m_shards;
};

} // namespace fishbowl
