#pragma once

#include "network/connection.hpp"
#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace fishbowl::network {

//! Connection manager that runs an async accept loop and all connection IO on one dedicated thread.
//! Callbacks are invoked from that thread.
class TcpServer {
public:
	struct Callbacks {
		std::function<void(ConnectionId)> onConnect;
		std::function<void(ConnectionId, const Message&)> onMessage;
		std::function<void(ConnectionId)> onDisconnect;
	};

	explicit TcpServer(std::uint16_t port = DEFAULT_PORT); //!< Port 0 binds an ephemeral port.
	~TcpServer();

	void connect(Callbacks callbacks); //!< Set callbacks. Call before start.
	void start();                      //!< Start accepting clients.
	void stop();                       //!< Disconnect clients and stop the server.

	bool send(ConnectionId connectionId, const Message& msg); //!< False if the connection is gone.
	void disconnect(ConnectionId connectionId);               //!< Close a connection from the server side.

	std::uint16_t port() const; //!< Bound port.

private:
	void doAccept();
	void addConnection(asio::ip::tcp::socket socket);
	void removeConnection(ConnectionId connectionId);

private:
	asio::io_context m_ioContext;
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;

	std::thread m_ioThread;             //!< IO context thread.
	std::atomic<bool> m_running{false}; //!< TCP Server running.

	Callbacks m_callbacks;
	ConnectionId m_nextConnectionId{1u}; //!< Only touched on the io thread.

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections;
	std::mutex m_connectionsMutex;
};

} // namespace fishbowl::network
