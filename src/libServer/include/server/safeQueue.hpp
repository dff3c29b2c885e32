#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace fishbowl::server {

//! Thread safe FIFO between producer threads and a single consumer loop.
template <class Entry>
class SafeQueue {
public:
	//! Push element onto the queue.
	void Push(Entry value);

	//! Wait at most timeout for an element. Nullopt on timeout or once released and drained.
	template <class Rep, class Period>
	std::optional<Entry> PopFor(std::chrono::duration<Rep, Period> timeout);

	bool Empty() const;

	//! Stop blocking consumers. Elements already queued can still be popped.
	void Release();

private:
	std::deque<Entry> m_queue;           //!< Stores the entries.
	mutable std::mutex m_mutex;          //!< Manage access to the queue.
	std::condition_variable m_condition; //!< Notify that element can be popped.
	bool m_released{false};              //!< Guarded by m_mutex.
};


template <class Entry>
void SafeQueue<Entry>::Push(Entry value) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_queue.push_back(std::move(value));
	}
	m_condition.notify_one();
}

template <class Entry>
template <class Rep, class Period>
std::optional<Entry> SafeQueue<Entry>::PopFor(std::chrono::duration<Rep, Period> timeout) {
	std::unique_lock<std::mutex> lock(m_mutex);
	if (!m_condition.wait_for(lock, timeout, [this] { return !m_queue.empty() || m_released; }) || m_queue.empty()) {
		return std::nullopt;
	}

	auto element = std::move(m_queue.front());
	m_queue.pop_front();
	return element;
}

template <class Entry>
bool SafeQueue<Entry>::Empty() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_queue.empty();
}

template <class Entry>
void SafeQueue<Entry>::Release() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_released = true;
	}
	m_condition.notify_all();
}

} // namespace fishbowl::server
