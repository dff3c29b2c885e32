#pragma once

#include "core/IEntityStore.hpp"

#include <string>
#include <vector>

namespace fishbowl {

enum class RingDefect {
	None,
	DuplicatePlayer,   //!< A player owns more than one node.
	DanglingNext,      //!< next_player_id names no node of the ring.
	DanglingPrev,      //!< prev_player_id names no node of the ring.
	PrevMismatch,      //!< prev of a node's successor is not the node.
	NotSingleCycle     //!< Walking next does not visit every node exactly once.
};

struct RingReport {
	RingDefect defect{RingDefect::None};
	PlayerId playerId{}; //!< Node at which the defect was found.
	std::string message{};

	bool valid() const {
		return defect == RingDefect::None;
	}
};

//! Check that the nodes form exactly one closed cycle covering every node once. An empty ring is valid.
//! Runs in O(n).
RingReport checkRing(const std::vector<TurnOrderNode>& nodes);

//! Check the persisted ring of the transaction's game. Defects are logged as warnings.
RingReport checkRing(const ITransaction& transaction);

} // namespace fishbowl
