#ifndef EVENT_QUEUE_H
#define EVENT_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// ============================================================================
// Event Queue
// ============================================================================

// Hands events from the input thread to the single thread that owns the
// session. Events pushed after close() are dropped.
template <typename T>
class EventQueue {
	std::deque<T> events_ = {};
	mutable std::mutex mutex_;
	std::condition_variable cv_;
	bool closed_ = false;

public:
	template <typename... Args>
	bool emplace(Args&&... args)
	{
		{
			std::scoped_lock lock(mutex_);
			if (closed_) {
				return false;
			}
			events_.emplace_back(std::forward<Args>(args)...);
		}
		cv_.notify_one();
		return true;
	}

	[[nodiscard]] std::optional<T> pop(const std::chrono::milliseconds timeout);

	[[nodiscard]] std::optional<T> try_pop();

	void close();

	[[nodiscard]] bool closed() const;

	[[nodiscard]] size_t size() const;
};

#endif
