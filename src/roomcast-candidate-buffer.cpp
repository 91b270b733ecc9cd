/*
 * Roomcast
 * Remote ICE candidate buffering
 */

#include "roomcast-candidate-buffer.h"

#include <utility>

namespace roomcast
{

void CandidateBuffer::push(const IceCandidate &candidate)
{
	queue_.push_back(candidate);
}

void CandidateBuffer::append(CandidateBuffer &&other)
{
	for (auto &candidate : other.queue_) {
		queue_.push_back(std::move(candidate));
	}
	other.queue_.clear();
}

CandidateFlushResult CandidateBuffer::flush(const ApplyFn &apply)
{
	CandidateFlushResult result;
	std::deque<IceCandidate> pending;
	pending.swap(queue_);

	for (auto &candidate : pending) {
		if (apply(candidate)) {
			result.applied++;
		} else {
			queue_.push_back(std::move(candidate));
			result.requeued++;
		}
	}

	return result;
}

void CandidateBuffer::clear()
{
	queue_.clear();
}

bool CandidateBuffer::empty() const
{
	return queue_.empty();
}

size_t CandidateBuffer::size() const
{
	return queue_.size();
}

std::vector<IceCandidate> CandidateBuffer::snapshot() const
{
	return std::vector<IceCandidate>(queue_.begin(), queue_.end());
}

} // namespace roomcast
