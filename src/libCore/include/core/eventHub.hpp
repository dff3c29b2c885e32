#pragma once

#include "core/IGameEventListener.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace fishbowl {

//! Allows external components to be told about committed game transitions.
class EventHub {
	struct ListenerEntry {
		IGameEventListener* listener; //!< Pointer to the listener.
		std::uint64_t signalMask;     //!< What events the listener cares about.
	};

public:
	void subscribe(IGameEventListener* listener, std::uint64_t signalMask = GS_All);
	void unsubscribe(IGameEventListener* listener);

	//! Deliver an event to every listener subscribed to its signal.
	//! \note Only call after the transaction producing the event committed.
	void publish(const GameEvent& event);

private:
	std::mutex m_listenerMutex;
	std::vector<ListenerEntry> m_listeners;
};

} // namespace fishbowl
