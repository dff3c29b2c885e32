#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace fishbowl {

//! Seedable random source shared by the draft, the start player pick and id generation.
//! Passing the same seed reproduces every shuffle and pick.
class Random {
public:
	Random();                            //!< Seeded from the random device.
	explicit Random(std::uint64_t seed); //!< Deterministic sequence.

	//! Uniform index in [0, count). Count must be non zero.
	std::size_t index(std::size_t count);

	//! Shuffle a random access range in place.
	template <class It>
	void shuffle(It first, It last) {
		std::lock_guard<std::mutex> lock(m_mutex);
		std::shuffle(first, last, m_engine);
	}

	std::string uuid();                   //!< Version 4 style identifier.
	std::string code(std::size_t length); //!< Upper case alphanumeric join code.

private:
	std::mutex m_mutex; //!< Engine is shared between request threads.
	std::mt19937_64 m_engine;
};

} // namespace fishbowl
