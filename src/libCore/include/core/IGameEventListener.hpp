#pragma once

#include "core/gameEvent.hpp"

namespace fishbowl {

//! Collaborator that broadcasts committed engine events (real-time layer, timers, tests).
class IGameEventListener {
public:
	virtual ~IGameEventListener()                    = default;
	virtual void onGameEvent(const GameEvent& event) = 0;
};

} // namespace fishbowl
