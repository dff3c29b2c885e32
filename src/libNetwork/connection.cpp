#include "network/connection.hpp"

#include "Logging.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <format>
#include <utility>

namespace fishbowl::network {

Connection::Connection(asio::ip::tcp::socket socket, ConnectionId id, Callbacks callbacks)
    : m_socket(std::move(socket)), m_strand(asio::make_strand(m_socket.get_executor())), m_id(id), m_callbacks(std::move(callbacks)) {
}

void Connection::start() {
	if (m_running.exchange(true)) {
		return;
	}
	asio::post(m_strand, [self = shared_from_this()] { self->startRead(); });
}

void Connection::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::post(m_strand, [self = shared_from_this()] {
		asio::error_code ec;
		self->m_socket.shutdown(asio::socket_base::shutdown_both, ec);
		self->m_socket.close(ec);
	});
}

void Connection::send(const Message& msg) {
	if (!m_running.load()) {
		return;
	}
	if (msg.size() > MAX_PAYLOAD_BYTES) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Connection] Dropped {} byte message to connection {}.", msg.size(), m_id));
		return;
	}

	asio::post(m_strand, [self = shared_from_this(), frame = encodeFrame(msg)]() mutable {
		const bool idle = self->m_writeQueue.empty();
		self->m_writeQueue.push_back(std::move(frame));
		if (idle) {
			self->startWrite();
		}
	});
}

ConnectionId Connection::id() const {
	return m_id;
}

void Connection::startRead() {
	asio::async_read(m_socket, asio::buffer(m_readHeader), asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                 if (ec || !self->m_running) {
			                 self->doDisconnect();
			                 return;
		                 }

		                 const auto payloadSize = decodeHeader(self->m_readHeader);
		                 if (payloadSize > MAX_PAYLOAD_BYTES) {
			                 Logger().Log(Logging::LogLevel::Warning,
			                              std::format("[Connection] Connection {} announced {} byte frame. Closing.", self->m_id, payloadSize));
			                 self->doDisconnect();
			                 return;
		                 }
		                 self->readPayload(payloadSize);
	                 }));
}

void Connection::readPayload(std::uint32_t payloadSize) {
	m_readPayload.assign(payloadSize, '\0');
	asio::async_read(m_socket, asio::buffer(m_readPayload), asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                 if (ec || !self->m_running) {
			                 self->doDisconnect();
			                 return;
		                 }

		                 if (self->m_callbacks.onMessage) {
			                 self->m_callbacks.onMessage(self->m_id, self->m_readPayload);
		                 }
		                 self->startRead();
	                 }));
}

void Connection::startWrite() {
	if (!m_running || m_writeQueue.empty()) {
		return;
	}

	asio::async_write(m_socket, asio::buffer(m_writeQueue.front()), asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                  if (ec || !self->m_running) {
			                  self->doDisconnect();
			                  return;
		                  }

		                  self->m_writeQueue.pop_front();
		                  if (!self->m_writeQueue.empty()) {
			                  self->startWrite();
		                  }
	                  }));
}

void Connection::doDisconnect() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);

	if (m_callbacks.onDisconnect) {
		m_callbacks.onDisconnect(m_id);
	}
}

} // namespace fishbowl::network
