#pragma once

#include "core/entities.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace fishbowl {

//! Unit of work scoped to a single game.
//! Reads observe the transaction's own writes. Nothing is visible to other transactions before commit().
//! Destroying an uncommitted transaction rolls every write back.
//! \note Insert of an existing id, update or remove of an unknown id throw StoreError.
class ITransaction {
public:
	virtual ~ITransaction() = default;

	virtual const GameId& gameId() const = 0;

	// Get by id
	virtual std::optional<Game> game() const                                           = 0;
	virtual std::optional<Team> team(const TeamId& teamId) const                       = 0;
	virtual std::optional<Player> player(const PlayerId& playerId) const               = 0;
	virtual std::optional<Phrase> phrase(const PhraseId& phraseId) const               = 0;
	virtual std::optional<Turn> turn(const TurnId& turnId) const                       = 0;
	virtual std::optional<TurnOrderNode> turnOrderNode(const PlayerId& playerId) const = 0;

	// Lists of all rows in this game, in insertion order.
	virtual std::vector<Team> teams() const              = 0;
	virtual std::vector<Player> players() const          = 0;
	virtual std::vector<Phrase> phrases() const          = 0;
	virtual std::vector<Turn> turns() const              = 0;
	virtual std::vector<TurnOrderNode> turnOrder() const = 0;

	virtual void insert(const Game& game)          = 0;
	virtual void insert(const Team& team)          = 0;
	virtual void insert(const Player& player)      = 0;
	virtual void insert(const Phrase& phrase)      = 0;
	virtual void insert(const Turn& turn)          = 0;
	virtual void insert(const TurnOrderNode& node) = 0;

	virtual void update(const Game& game)     = 0;
	virtual void update(const Team& team)     = 0;
	virtual void update(const Player& player) = 0;
	virtual void update(const Phrase& phrase) = 0;
	virtual void update(const Turn& turn)     = 0;

	virtual void remove(const Phrase& phrase) = 0;

	//! Raw delete of the game and every row scoped to it.
	virtual void removeGame() = 0;

	//! Publish all writes atomically. The transaction can not be used afterwards.
	virtual void commit() = 0;
};

//! Transactional entity store.
//! Transactions on the same game are serialized; transactions on different games may run in parallel.
class IEntityStore {
public:
	virtual ~IEntityStore() = default;

	//! Open a transaction on a game. The game does not need to exist yet (creation inserts it).
	//! Blocks while another transaction on the same game is open.
	virtual std::unique_ptr<ITransaction> begin(const GameId& gameId) = 0;

	//! True if a committed game with this id exists.
	virtual bool contains(const GameId& gameId) const = 0;
};

} // namespace fishbowl
