#include "safe_queue.h"

#include <utility>

// ============================================================================
// Thread-Safe Queue
// ============================================================================

template <class T>
[[nodiscard]] bool SafeQueue<T>::push(T&& item)
{
	std::scoped_lock lock(mutex_);
	if (!running_) {
		return false;
	}
	queue_.push(std::move(item));
	return true;
}

template <class T>
[[nodiscard]] std::vector<T> SafeQueue<T>::drain()
{
	std::queue<T> taken = {};
	{
		std::scoped_lock lock(mutex_);
		std::swap(taken, queue_);
	}

	std::vector<T> items = {};
	items.reserve(taken.size());
	while (!taken.empty()) {
		items.push_back(std::move(taken.front()));
		taken.pop();
	}
	return items;
}

template <class T>
void SafeQueue<T>::shutdown()
{
	std::scoped_lock lock(mutex_);
	running_ = false;
}

template <class T>
[[nodiscard]] bool SafeQueue<T>::closed() const
{
	std::scoped_lock lock(mutex_);
	return !running_;
}

template <class T>
[[nodiscard]] size_t SafeQueue<T>::size() const
{
	std::scoped_lock lock(mutex_);
	return queue_.size();
}

template <class T>
[[nodiscard]] bool SafeQueue<T>::empty() const
{
	std::scoped_lock lock(mutex_);
	return queue_.empty();
}

// Explicit instantiations
#include "command_t.h"
template class SafeQueue<Mutation>;
