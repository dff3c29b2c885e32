#pragma once

#include "core/IEntityStore.hpp"
#include "core/errors.hpp"

#include "Logging.hpp"

#include <format>
#include <string_view>

namespace fishbowl {

//! Run work inside a transaction on gameId and commit it if work returns.
//! GameError and StoreError abort the transaction (rolled back on destruction) and are returned as Error.
template <class Result, class Work>
Outcome<Result> runTransaction(IEntityStore& store, const GameId& gameId, std::string_view operation, Work&& work) {
	try {
		auto transaction = store.begin(gameId);
		Result result    = work(*transaction);
		transaction->commit();
		return result;
	} catch (const GameError& e) {
		const auto level = e.error().kind == ErrorKind::Integrity ? Logging::LogLevel::Error : Logging::LogLevel::Info;
		Logger().Log(level, std::format("[{}] Game '{}' rejected ({}): {}", operation, gameId, toString(e.error().kind), e.what()));
		return e.error();
	} catch (const StoreError& e) {
		Logger().Log(Logging::LogLevel::Error, std::format("[{}] Game '{}' store failure: {}", operation, gameId, e.what()));
		return integrityError(e.what());
	}
}

//! Game row of the transaction. Throws GameError(NotFound) if the game does not exist.
inline Game requireGame(const ITransaction& transaction) {
	auto game = transaction.game();
	if (!game) {
		throw GameError(notFoundError(std::format("Game '{}' not found", transaction.gameId())));
	}
	return *game;
}

inline Player requirePlayer(const ITransaction& transaction, const PlayerId& playerId) {
	auto player = transaction.player(playerId);
	if (!player) {
		throw GameError(notFoundError(std::format("Player '{}' not found", playerId)));
	}
	return *player;
}

} // namespace fishbowl
