#include "core/memoryStore.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <format>

namespace fishbowl {

template <class Row, class Key, class Projection>
static const Row* findRow(const std::vector<Row>& rows, const Key& key, Projection projection) {
	const auto it = std::find_if(rows.begin(), rows.end(), [&](const Row& row) { return projection(row) == key; });
	return it == rows.end() ? nullptr : &*it;
}

template <class Row>
static const Row* findById(const std::vector<Row>& rows, const std::string& id) {
	return findRow(rows, id, [](const Row& row) -> const std::string& { return row.id; });
}

template <class Row>
static std::optional<Row> copyOf(const Row* row) {
	return row ? std::optional<Row>{*row} : std::nullopt;
}

//! Transaction on a private copy of one shard.
class MemoryTransaction final : public ITransaction {
public:
	MemoryTransaction(MemoryStore& store, GameId gameId, std::shared_ptr<MemoryStore::Shard> shard)
	    : m_store(store), m_gameId(std::move(gameId)), m_shard(std::move(shard)), m_lock(m_shard->mutex), m_tables(m_shard->tables) {
	}

	~MemoryTransaction() override {
		if (m_lock.owns_lock()) {
			m_lock.unlock();
			m_store.release(m_gameId);
		}
	}

	const GameId& gameId() const override {
		return m_gameId;
	}

	std::optional<Game> game() const override {
		ensureOpen();
		return m_tables.game;
	}
	std::optional<Team> team(const TeamId& teamId) const override {
		ensureOpen();
		return copyOf(findById(m_tables.teams, teamId));
	}
	std::optional<Player> player(const PlayerId& playerId) const override {
		ensureOpen();
		return copyOf(findById(m_tables.players, playerId));
	}
	std::optional<Phrase> phrase(const PhraseId& phraseId) const override {
		ensureOpen();
		return copyOf(findById(m_tables.phrases, phraseId));
	}
	std::optional<Turn> turn(const TurnId& turnId) const override {
		ensureOpen();
		return copyOf(findById(m_tables.turns, turnId));
	}
	std::optional<TurnOrderNode> turnOrderNode(const PlayerId& playerId) const override {
		ensureOpen();
		return copyOf(findRow(m_tables.turnOrder, playerId, [](const TurnOrderNode& node) -> const PlayerId& { return node.playerId; }));
	}

	std::vector<Team> teams() const override {
		ensureOpen();
		return m_tables.teams;
	}
	std::vector<Player> players() const override {
		ensureOpen();
		return m_tables.players;
	}
	std::vector<Phrase> phrases() const override {
		ensureOpen();
		return m_tables.phrases;
	}
	std::vector<Turn> turns() const override {
		ensureOpen();
		return m_tables.turns;
	}
	std::vector<TurnOrderNode> turnOrder() const override {
		ensureOpen();
		return m_tables.turnOrder;
	}

	void insert(const Game& game) override {
		ensureOpen();
		if (game.id != m_gameId) {
			throw StoreError(std::format("Game '{}' inserted through transaction of game '{}'.", game.id, m_gameId));
		}
		if (m_tables.game) {
			throw StoreError(std::format("Game '{}' already exists.", game.id));
		}
		m_tables.game = game;
	}
	void insert(const Team& team) override {
		insertRow(m_tables.teams, team, "Team");
	}
	void insert(const Player& player) override {
		insertRow(m_tables.players, player, "Player");
	}
	void insert(const Phrase& phrase) override {
		insertRow(m_tables.phrases, phrase, "Phrase");
	}
	void insert(const Turn& turn) override {
		insertRow(m_tables.turns, turn, "Turn");
	}
	void insert(const TurnOrderNode& node) override {
		ensureOpen();
		if (findRow(m_tables.turnOrder, node.playerId, [](const TurnOrderNode& n) -> const PlayerId& { return n.playerId; })) {
			throw StoreError(std::format("Player '{}' already has a turn order entry.", node.playerId));
		}
		insertRow(m_tables.turnOrder, node, "TurnOrderNode");
	}

	void update(const Game& game) override {
		ensureOpen();
		if (!m_tables.game || m_tables.game->id != game.id) {
			throw StoreError(std::format("Update of unknown game '{}'.", game.id));
		}
		m_tables.game = game;
	}
	void update(const Team& team) override {
		updateRow(m_tables.teams, team, "Team");
	}
	void update(const Player& player) override {
		updateRow(m_tables.players, player, "Player");
	}
	void update(const Phrase& phrase) override {
		updateRow(m_tables.phrases, phrase, "Phrase");
	}
	void update(const Turn& turn) override {
		updateRow(m_tables.turns, turn, "Turn");
	}

	void remove(const Phrase& phrase) override {
		ensureOpen();
		const auto it = std::find_if(m_tables.phrases.begin(), m_tables.phrases.end(), [&](const Phrase& p) { return p.id == phrase.id; });
		if (it == m_tables.phrases.end()) {
			throw StoreError(std::format("Remove of unknown Phrase '{}'.", phrase.id));
		}
		m_tables.phrases.erase(it);
	}

	void removeGame() override {
		ensureOpen();
		m_tables = GameTables{};
	}

	void commit() override {
		ensureOpen();
		m_shard->exists = m_tables.game.has_value();
		m_shard->tables = std::move(m_tables);
		m_lock.unlock();
		m_store.release(m_gameId);
	}

private:
	void ensureOpen() const {
		if (!m_lock.owns_lock()) {
			throw StoreError(std::format("Transaction on game '{}' already committed.", m_gameId));
		}
	}

	template <class Row>
	void insertRow(std::vector<Row>& rows, const Row& row, std::string_view table) {
		ensureOpen();
		if (!m_tables.game) {
			throw StoreError(std::format("{} '{}' inserted without game '{}'.", table, row.id, m_gameId));
		}
		if (row.gameId != m_gameId) {
			throw StoreError(std::format("{} '{}' belongs to game '{}', not '{}'.", table, row.id, row.gameId, m_gameId));
		}
		if (findById(rows, row.id)) {
			throw StoreError(std::format("{} '{}' already exists.", table, row.id));
		}
		rows.push_back(row);
	}

	template <class Row>
	void updateRow(std::vector<Row>& rows, const Row& row, std::string_view table) {
		ensureOpen();
		const auto it = std::find_if(rows.begin(), rows.end(), [&](const Row& r) { return r.id == row.id; });
		if (it == rows.end()) {
			throw StoreError(std::format("Update of unknown {} '{}'.", table, row.id));
		}
		*it = row;
	}

private:
	MemoryStore& m_store;
	GameId m_gameId;
	std::shared_ptr<MemoryStore::Shard> m_shard;
	std::unique_lock<std::mutex> m_lock; //!< Released on commit or destruction (rollback).
	GameTables m_tables;                 //!< Working copy.
};

std::unique_ptr<ITransaction> MemoryStore::begin(const GameId& gameId) {
	// Shard lookup is short; the shard lock itself is taken without holding the map lock.
	return std::make_unique<MemoryTransaction>(*this, gameId, acquire(gameId));
}

bool MemoryStore::contains(const GameId& gameId) const {
	std::lock_guard<std::mutex> lock(m_shardsMutex);
	const auto it = m_shards.find(gameId);
	return it != m_shards.end() && it->second->exists;
}

std::size_t MemoryStore::gameCount() const {
	std::lock_guard<std::mutex> lock(m_shardsMutex);
	return static_cast<std::size_t>(std::count_if(m_shards.begin(), m_shards.end(), [](const auto& entry) { return entry.second->exists.load(); }));
}

std::size_t MemoryStore::shardCount() const {
	std::lock_guard<std::mutex> lock(m_shardsMutex);
	return m_shards.size();
}

std::shared_ptr<MemoryStore::Shard> MemoryStore::acquire(const GameId& gameId) {
	std::lock_guard<std::mutex> lock(m_shardsMutex);
	auto& entry = m_shards[gameId];
	if (!entry) {
		entry = std::make_shared<Shard>();
	}
	++entry->users;
	return entry;
}

void MemoryStore::release(const GameId& gameId) {
	std::lock_guard<std::mutex> lock(m_shardsMutex);
	const auto it = m_shards.find(gameId);
	if (it == m_shards.end()) {
		return;
	}
	if (--it->second->users == 0u && !it->second->exists) {
		m_shards.erase(it);
	}
}

} // namespace fishbowl
