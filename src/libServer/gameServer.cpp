#include "server/gameServer.hpp"

#include "Logging.hpp"

#include <format>

namespace fishbowl::server {

static std::unique_ptr<Random> makeRandom(const ServerConfig& config) {
	return config.seed ? std::make_unique<Random>(*config.seed) : std::make_unique<Random>();
}

GameServer::GameServer(const ServerConfig& config)
    : m_random(makeRandom(config)), m_network{config.port},
      m_dispatcher(m_store, *m_random, config.sessionTtl, [this](ConnectionId connectionId, const std::string& message) { m_network.send(connectionId, message); }) {
	// Keep network callbacks thin: they only enqueue events.
	network::TcpServer::Callbacks callbacks;
	callbacks.onConnect    = [this](network::ConnectionId connectionId) { onClientConnected(connectionId); };
	callbacks.onMessage    = [this](network::ConnectionId connectionId, const network::Message& payload) { onClientMessage(connectionId, payload); };
	callbacks.onDisconnect = [this](network::ConnectionId connectionId) { onClientDisconnected(connectionId); };
	m_network.connect(callbacks);
}

GameServer::~GameServer() {
	stop();
}

void GameServer::start() {
	if (m_isRunning.exchange(true)) {
		return;
	}

	m_network.start();
	m_serverThread = std::thread([this] { serverLoop(); });
}

void GameServer::stop() {
	if (!m_isRunning.exchange(false)) {
		return;
	}

	m_network.stop();
	m_eventQueue.Push(ServerEvent{.type = ServerEventType::Shutdown});
	m_eventQueue.Release();

	if (m_serverThread.joinable()) {
		m_serverThread.join();
	}
}

std::uint16_t GameServer::port() const {
	return m_network.port();
}

void GameServer::onClientConnected(network::ConnectionId connectionId) {
	m_eventQueue.Push(ServerEvent{.type = ServerEventType::ClientConnected, .connectionId = connectionId});
}

void GameServer::onClientMessage(network::ConnectionId connectionId, const network::Message& payload) {
	m_eventQueue.Push(ServerEvent{
	        .type         = ServerEventType::ClientMessage,
	        .connectionId = connectionId,
	        .payload      = payload,
	});
}

void GameServer::onClientDisconnected(network::ConnectionId connectionId) {
	m_eventQueue.Push(ServerEvent{.type = ServerEventType::ClientDisconnected, .connectionId = connectionId});
}

void GameServer::serverLoop() {
	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Event loop started on port {}.", port()));

	auto lastHousekeeping = Clock::now();
	while (m_isRunning) {
		if (const auto event = m_eventQueue.PopFor(HOUSEKEEPING_INTERVAL)) {
			processEvent(*event);
		}

		if (Clock::now() - lastHousekeeping >= HOUSEKEEPING_INTERVAL) {
			m_dispatcher.expireSessions();
			lastHousekeeping = Clock::now();
		}
	}

	Logger().Log(Logging::LogLevel::Info, "[GameServer] Event loop stopped.");
}

void GameServer::processEvent(const ServerEvent& event) {
	switch (event.type) {
	case ServerEventType::ClientConnected:
		Logger().Log(Logging::LogLevel::Debug, std::format("[GameServer] Client {} connected.", event.connectionId));
		break;
	case ServerEventType::ClientDisconnected:
		Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Client {} disconnected.", event.connectionId));
		m_dispatcher.disconnected(event.connectionId);
		break;
	case ServerEventType::ClientMessage:
		m_network.send(event.connectionId, m_dispatcher.handle(event.connectionId, event.payload));
		break;
	case ServerEventType::Shutdown:
		Logger().Log(Logging::LogLevel::Info, "[GameServer] Shutdown requested.");
		break;
	}
}

} // namespace fishbowl::server
