/*
 * Roomcast
 * Per-peer serial task executor
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace roomcast
{

// Runs tasks for one peer on a dedicated thread, in submission order. Delayed
// tasks become runnable once their deadline passes and are then ordered by
// deadline. stop() discards pending tasks and joins the thread; it must not be
// called from a task running on this worker.
class PeerWorker
{
public:
	using Task = std::function<void()>;

	explicit PeerWorker(std::string name);
	~PeerWorker();

	PeerWorker(const PeerWorker &) = delete;
	PeerWorker &operator=(const PeerWorker &) = delete;

	bool post(Task task);
	bool postDelayed(int delayMs, Task task);
	void stop();

	bool isCurrentThread() const;
	size_t pendingCount() const;

private:
	using Clock = std::chrono::steady_clock;

	void run();

	const std::string name_;
	mutable std::mutex mutex_;
	std::condition_variable cv_;
	// Keyed by (deadline, sequence) so equal deadlines keep submission order.
	std::map<std::pair<Clock::time_point, uint64_t>, Task> tasks_;
	uint64_t nextSequence_ = 0;
	bool stopping_ = false;
	std::thread thread_;
};

} // namespace roomcast
