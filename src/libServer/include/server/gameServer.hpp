#pragma once

#include "core/memoryStore.hpp"
#include "core/random.hpp"
#include "network/tcpServer.hpp"
#include "server/commandDispatcher.hpp"
#include "server/safeQueue.hpp"
#include "server/serverConfig.hpp"
#include "server/serverEvents.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace fishbowl::server {

//! Game server on two layers.
//! - Network layer    : TcpServer threads only enqueue events.
//! - Application layer: One server thread drains the queue and drives the engine through the dispatcher.
class GameServer {
public:
	explicit GameServer(const ServerConfig& config = {});
	~GameServer();

	void start(); //!< Boot the network listener and the server event loop.
	void stop();  //!< Signal shutdown to the server loop and stop the network listener.

	std::uint16_t port() const; //!< Port the listener is bound to.

private:
	// Network callbacks (run on the network thread) just enqueue events.
	void onClientConnected(network::ConnectionId connectionId);
	void onClientMessage(network::ConnectionId connectionId, const network::Message& payload);
	void onClientDisconnected(network::ConnectionId connectionId);

private:
	void serverLoop();                           //!< Server thread: drain queue and act.
	void processEvent(const ServerEvent& event); //!< Reads event type and distributes.

private:
	std::atomic<bool> m_isRunning{false};

	MemoryStore m_store;
	std::unique_ptr<Random> m_random;

	network::TcpServer m_network; //!< Communication with clients.
	CommandDispatcher m_dispatcher;

	SafeQueue<ServerEvent> m_eventQueue; //!< Event queue between network thread and server thread.
	std::thread m_serverThread;          //!< Runs serverLoop.
};

} // namespace fishbowl::server
