#include "core/eventHub.hpp"

#include <algorithm>

namespace fishbowl {

GameSignal signalOf(const GameEvent& event) {
	struct Visitor {
		GameSignal operator()(const GameStartedEvent&) const {
			return GS_GameStarted;
		}
		GameSignal operator()(const RoundStartedEvent&) const {
			return GS_RoundStarted;
		}
		GameSignal operator()(const TurnStartedEvent&) const {
			return GS_TurnStarted;
		}
		GameSignal operator()(const TurnEndedEvent&) const {
			return GS_TurnEnded;
		}
		GameSignal operator()(const RoundCompletedEvent&) const {
			return GS_RoundCompleted;
		}
		GameSignal operator()(const GameCompletedEvent&) const {
			return GS_GameCompleted;
		}
	};
	return std::visit(Visitor{}, event);
}

const GameId& gameIdOf(const GameEvent& event) {
	return std::visit([](const auto& ev) -> const GameId& { return ev.gameId; }, event);
}

void EventHub::subscribe(IGameEventListener* listener, std::uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameEventListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; }),
	                  m_listeners.end());
}

void EventHub::publish(const GameEvent& event) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	const auto signal = signalOf(event);
	for (const auto& [listener, signalMask]: m_listeners) {
		if (signalMask & signal) {
			listener->onGameEvent(event);
		}
	}
}

} // namespace fishbowl
