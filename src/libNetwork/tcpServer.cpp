#include "network/tcpServer.hpp"

#include "Logging.hpp"

#include <format>
#include <utility>
#include <vector>

namespace fishbowl::network {

TcpServer::TcpServer(std::uint16_t port) : m_ioContext(), m_acceptor(m_ioContext, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port)) {
}

TcpServer::~TcpServer() {
	stop();
}

void TcpServer::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void TcpServer::start() {
	if (m_running.exchange(true)) {
		return;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });

	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on port {}.", port()));
}

void TcpServer::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}
	for (auto& [id, connection]: connections) {
		connection->stop();
	}

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}

	Logger().Log(Logging::LogLevel::Info, "[TcpServer] Stopped.");
}

bool TcpServer::send(ConnectionId connectionId, const Message& msg) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = m_connections.find(connectionId);
	if (it == m_connections.end()) {
		return false;
	}
	it->second->send(msg);
	return true;
}

void TcpServer::disconnect(ConnectionId connectionId) {
	std::shared_ptr<Connection> connection;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		if (const auto it = m_connections.find(connectionId); it != m_connections.end()) {
			connection = it->second;
			m_connections.erase(it);
		}
	}

	if (connection) {
		connection->stop();
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(connectionId);
		}
	}
}

std::uint16_t TcpServer::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? std::uint16_t{0} : endpoint.port();
}

void TcpServer::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}
		if (ec) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[TcpServer] Accept failed: {}", ec.message()));
		} else {
			addConnection(std::move(socket));
		}
		doAccept();
	});
}

void TcpServer::addConnection(asio::ip::tcp::socket socket) {
	const auto connectionId = m_nextConnectionId++;

	Connection::Callbacks callbacks{
	        .onMessage =
	                [this](ConnectionId id, const Message& message) {
		                if (m_callbacks.onMessage) {
			                m_callbacks.onMessage(id, message);
		                }
	                },
	        .onDisconnect = [this](ConnectionId id) { removeConnection(id); },
	};

	auto connection = std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks));
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		m_connections.emplace(connectionId, connection);
	}

	Logger().Log(Logging::LogLevel::Debug, std::format("[TcpServer] Accepted connection {}.", connectionId));
	if (m_callbacks.onConnect) {
		m_callbacks.onConnect(connectionId);
	}
	connection->start();
}

void TcpServer::removeConnection(ConnectionId connectionId) {
	bool removed = false;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		removed = m_connections.erase(connectionId) != 0u;
	}

	// Connections dropped by disconnect() or stop() were already signalled.
	if (removed && m_callbacks.onDisconnect) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[TcpServer] Connection {} closed.", connectionId));
		m_callbacks.onDisconnect(connectionId);
	}
}

} // namespace fishbowl::network
