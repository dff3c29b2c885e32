#pragma once

#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>

namespace fishbowl::network {

//! One client socket. Reads frames and queues outgoing frames on a strand of the server's io context.
//! Owned through shared_ptr so pending handlers keep it alive after the server dropped it.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(ConnectionId, const Message&)> onMessage;
		std::function<void(ConnectionId)> onDisconnect; //!< Called once, from the io thread.
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId id, Callbacks callbacks);

	void start();                  //!< Begin reading.
	void stop();                   //!< Close the socket without signalling onDisconnect.
	void send(const Message& msg); //!< Queue a frame. Oversized payloads are dropped.

	ConnectionId id() const;

private:
	void startRead();
	void readPayload(std::uint32_t payloadSize);
	void startWrite();
	void doDisconnect(); //!< Close and signal onDisconnect.

private:
	asio::ip::tcp::socket m_socket;
	asio::strand<asio::any_io_executor> m_strand; //!< Serializes handlers and the write queue.
	ConnectionId m_id;
	Callbacks m_callbacks;
	std::atomic<bool> m_running{false};

	FrameHeader m_readHeader{};
	Message m_readPayload;
	std::deque<std::string> m_writeQueue; //!< Encoded frames, front is in flight.
};

} // namespace fishbowl::network
