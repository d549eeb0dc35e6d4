#ifndef SAFE_QUEUE_H
#define SAFE_QUEUE_H

#include <cstddef>
#include <mutex>
#include <queue>
#include <vector>

// ============================================================================
// Thread-Safe Queue
// ============================================================================

// Multi-producer, single-consumer queue. After shutdown() every enqueue is
// refused, and the refusal is reported to the caller.
template <typename T>
class SafeQueue {
	std::queue<T> queue_;
	mutable std::mutex mutex_;
	bool running_ = true;

public:
	// False once the queue is shut down.
	[[nodiscard]] bool push(T&& item);

	// Takes every queued element under a single lock.
	[[nodiscard]] std::vector<T> drain();

	void shutdown();

	[[nodiscard]] bool closed() const;

	[[nodiscard]] size_t size() const;

	[[nodiscard]] bool empty() const;
};

#endif
