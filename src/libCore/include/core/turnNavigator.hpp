#pragma once

#include "core/IEntityStore.hpp"
#include "core/random.hpp"

#include <optional>
#include <vector>

namespace fishbowl {

//! Read side traversal over the turn order ring of a game.
//! All queries skip players whose connection flag is cleared and never walk more than the ring size.
//! \note A ring entry missing for a player the walk reaches throws GameError(Integrity).
class TurnNavigator {
public:
	explicit TurnNavigator(Random& random);

	//! First connected player after currentPlayerId, following next links.
	//! Returns currentPlayerId itself if it is the only connected player, nullopt if nobody is connected.
	std::optional<PlayerId> nextPlayer(const ITransaction& transaction, const PlayerId& currentPlayerId) const;

	//! Acting player of the game's current turn, nullopt if there is no current turn.
	std::optional<PlayerId> currentPlayer(const ITransaction& transaction) const;

	//! Uniform pick among connected ring members, nullopt if the ring is empty or nobody is connected.
	std::optional<PlayerId> randomStartPlayer(const ITransaction& transaction) const;

	//! Connected players in ring order, starting at the first drafted player.
	std::vector<PlayerId> activePlayers(const ITransaction& transaction) const;

	//! True if the player exists in this game and is connected.
	bool isPlayerActive(const ITransaction& transaction, const PlayerId& playerId) const;

private:
	TurnOrderNode requireNode(const ITransaction& transaction, const PlayerId& playerId) const;

private:
	Random& m_random;
};

} // namespace fishbowl
