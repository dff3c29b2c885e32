#pragma once

#include "core/IEntityStore.hpp"
#include "core/random.hpp"

#include <vector>

namespace fishbowl {

//! Builds the circular turn order of a game when it leaves setup.
//!
//! Snake draft: players are shuffled within their team, the team order is shuffled, then draft rows
//! alternate between forward and reverse team order. A team drops out of a row once it has no player left
//! at that position. The resulting sequence is closed into a ring.
//!
//! \note Callers validate the roster (every player on a team, enough players) before building.
class TurnOrderBuilder {
public:
	explicit TurnOrderBuilder(Random& random);

	//! Draft order over the roster. Every player appears exactly once.
	//! Teams are drafted in a shuffled order; teams without players are ignored.
	std::vector<PlayerId> draft(const std::vector<Player>& players, const std::vector<Team>& teams);

	//! Close a draft sequence into ring nodes: node i links to i+1 and i-1 modulo the sequence length.
	std::vector<TurnOrderNode> link(const GameId& gameId, const std::vector<PlayerId>& sequence, const std::vector<Player>& players);

	//! Draft the game's roster and insert the ring into the transaction. Returns the draft sequence.
	std::vector<PlayerId> build(ITransaction& transaction);

private:
	Random& m_random;
};

} // namespace fishbowl
