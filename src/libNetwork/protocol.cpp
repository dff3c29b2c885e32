#include "network/protocol.hpp"

namespace fishbowl::network {

FrameHeader encodeHeader(std::uint32_t payloadSize) {
	return FrameHeader{
	        static_cast<std::uint8_t>(payloadSize >> 24),
	        static_cast<std::uint8_t>(payloadSize >> 16),
	        static_cast<std::uint8_t>(payloadSize >> 8),
	        static_cast<std::uint8_t>(payloadSize),
	};
}

std::uint32_t decodeHeader(const FrameHeader& header) {
	return (static_cast<std::uint32_t>(header[0]) << 24) | (static_cast<std::uint32_t>(header[1]) << 16) | (static_cast<std::uint32_t>(header[2]) << 8) |
	       static_cast<std::uint32_t>(header[3]);
}

std::string encodeFrame(std::string_view payload) {
	const auto header = encodeHeader(static_cast<std::uint32_t>(payload.size()));

	std::string frame(header.begin(), header.end());
	frame.append(payload);
	return frame;
}

void FrameReader::feed(std::string_view bytes) {
	m_buffer.append(bytes);
}

std::optional<Message> FrameReader::next() {
	if (m_corrupt || m_buffer.size() < HEADER_BYTES) {
		return std::nullopt;
	}

	FrameHeader header{};
	for (std::size_t i = 0; i != HEADER_BYTES; ++i) {
		header[i] = static_cast<std::uint8_t>(m_buffer[i]);
	}

	const auto payloadSize = decodeHeader(header);
	if (payloadSize > MAX_PAYLOAD_BYTES) {
		m_corrupt = true;
		return std::nullopt;
	}
	if (m_buffer.size() < HEADER_BYTES + payloadSize) {
		return std::nullopt;
	}

	auto payload = m_buffer.substr(HEADER_BYTES, payloadSize);
	m_buffer.erase(0, HEADER_BYTES + payloadSize);
	return payload;
}

bool FrameReader::corrupt() const {
	return m_corrupt;
}

} // namespace fishbowl::network
