#include "core/random.hpp"

#include <format>
#include <string_view>

namespace fishbowl {

static constexpr std::string_view CODE_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

static std::uint64_t deviceSeed() {
	std::random_device device;
	return (static_cast<std::uint64_t>(device()) << 32) ^ static_cast<std::uint64_t>(device());
}

Random::Random() : m_engine(deviceSeed()) {
}

Random::Random(std::uint64_t seed) : m_engine(seed) {
}

std::size_t Random::index(std::size_t count) {
	std::lock_guard<std::mutex> lock(m_mutex);
	std::uniform_int_distribution<std::size_t> distribution(0u, count - 1u);
	return distribution(m_engine);
}

std::string Random::uuid() {
	std::uint64_t high = 0u;
	std::uint64_t low  = 0u;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		high = m_engine();
		low  = m_engine();
	}

	// Stamp version 4 and the RFC 4122 variant bits.
	high = (high & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
	low  = (low & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

	return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", high >> 32, (high >> 16) & 0xFFFFu, high & 0xFFFFu, low >> 48,
	                   low & 0xFFFFFFFFFFFFull);
}

std::string Random::code(std::size_t length) {
	std::string result;
	result.reserve(length);
	for (std::size_t i = 0; i != length; ++i) {
		result.push_back(CODE_ALPHABET[index(CODE_ALPHABET.size())]);
	}
	return result;
}

} // namespace fishbowl
