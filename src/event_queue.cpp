#include "event_queue.h"
#include "key_event_t.h"

// ============================================================================
// Event Queue
// ============================================================================

// Waits up to `timeout`; returns early with nothing once closed and empty.
template <class T>
[[nodiscard]] std::optional<T> EventQueue<T>::pop(const std::chrono::milliseconds timeout)
{
	std::unique_lock lock(mutex_);
	cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });

	if (events_.empty()) {
		return std::nullopt;
	}

	T event = std::move(events_.front());
	events_.pop_front();
	return event;
}

template <class T>
[[nodiscard]] std::optional<T> EventQueue<T>::try_pop()
{
	std::scoped_lock lock(mutex_);
	if (events_.empty()) {
		return std::nullopt;
	}

	T event = std::move(events_.front());
	events_.pop_front();
	return event;
}

template <class T>
void EventQueue<T>::close()
{
	{
		std::scoped_lock lock(mutex_);
		closed_ = true;
	}
	cv_.notify_all();
}

template <class T>
[[nodiscard]] bool EventQueue<T>::closed() const
{
	std::scoped_lock lock(mutex_);
	return closed_;
}

template <class T>
[[nodiscard]] size_t EventQueue<T>::size() const
{
	std::scoped_lock lock(mutex_);
	return events_.size();
}

template class EventQueue<KeyEvent>;
