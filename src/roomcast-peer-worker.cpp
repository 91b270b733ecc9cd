/*
 * Roomcast
 * Per-peer serial task executor
 */

#include "roomcast-peer-worker.h"

#include "roomcast-utils.h"

namespace roomcast
{

PeerWorker::PeerWorker(std::string name) : name_(std::move(name))
{
	thread_ = std::thread(&PeerWorker::run, this);
}

PeerWorker::~PeerWorker()
{
	stop();
}

bool PeerWorker::post(Task task)
{
	return postDelayed(0, std::move(task));
}

bool PeerWorker::postDelayed(int delayMs, Task task)
{
	if (!task) {
		return false;
	}

	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (stopping_) {
			return false;
		}
		const auto deadline = Clock::now() + std::chrono::milliseconds(delayMs > 0 ? delayMs : 0);
		tasks_.emplace(std::make_pair(deadline, nextSequence_++), std::move(task));
	}
	cv_.notify_one();
	return true;
}

void PeerWorker::stop()
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (stopping_ && !thread_.joinable()) {
			return;
		}
		stopping_ = true;
		tasks_.clear();
	}
	cv_.notify_all();

	if (thread_.joinable()) {
		if (thread_.get_id() == std::this_thread::get_id()) {
			logError("Worker %s asked to stop itself; detaching", name_.c_str());
			thread_.detach();
			return;
		}
		thread_.join();
	}
}

bool PeerWorker::isCurrentThread() const
{
	return thread_.get_id() == std::this_thread::get_id();
}

size_t PeerWorker::pendingCount() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return tasks_.size();
}

void PeerWorker::run()
{
	std::unique_lock<std::mutex> lock(mutex_);
	while (!stopping_) {
		if (tasks_.empty()) {
			cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
			continue;
		}

		auto next = tasks_.begin();
		const auto deadline = next->first.first;
		if (Clock::now() < deadline) {
			cv_.wait_until(lock, deadline);
			continue;
		}

		Task task = std::move(next->second);
		tasks_.erase(next);
		lock.unlock();

		try {
			task();
		} catch (const std::exception &e) {
			logError("Task on worker %s failed: %s", name_.c_str(), e.what());
		}

		lock.lock();
	}
}

} // namespace roomcast
