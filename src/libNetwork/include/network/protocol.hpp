#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fishbowl::network {

using ConnectionId = std::uint64_t; //!< Server assigned, unique for the lifetime of the server.
using Message      = std::string;   //!< Frame payload.

inline constexpr std::uint16_t DEFAULT_PORT = 12345;

//! Largest payload accepted in either direction. Larger frames close the connection.
inline constexpr std::uint32_t MAX_PAYLOAD_BYTES = 16 * 1024;

//! Every frame starts with the payload size as an unsigned 32 bit big endian integer.
inline constexpr std::size_t HEADER_BYTES = 4;
using FrameHeader                         = std::array<std::uint8_t, HEADER_BYTES>;

FrameHeader encodeHeader(std::uint32_t payloadSize);
std::uint32_t decodeHeader(const FrameHeader& header);

//! Header followed by payload.
std::string encodeFrame(std::string_view payload);

//! Reassembles frames from a byte stream that may split or merge them arbitrarily.
class FrameReader {
public:
	void feed(std::string_view bytes);

	//! Next complete payload, nullopt until enough bytes arrived.
	std::optional<Message> next();

	//! Set once a header announced more than MAX_PAYLOAD_BYTES. The stream can not be resynchronized.
	bool corrupt() const;

private:
	std::string m_buffer;
	bool m_corrupt{false};
};

} // namespace fishbowl::network
