/*
 * Roomcast
 * Per-peer queue of remote ICE candidates awaiting a remote description
 */

#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <vector>

#include "roomcast-common.h"

namespace roomcast
{

struct CandidateFlushResult {
	size_t applied = 0;
	size_t requeued = 0;
};

// Not thread-safe; the owning record's lock guards it.
class CandidateBuffer
{
public:
	using ApplyFn = std::function<bool(const IceCandidate &candidate)>;

	void push(const IceCandidate &candidate);
	void append(CandidateBuffer &&other);

	// Applies every queued candidate in arrival order. Candidates the apply
	// function rejects stay queued, still in arrival order.
	CandidateFlushResult flush(const ApplyFn &apply);

	void clear();
	bool empty() const;
	size_t size() const;
	std::vector<IceCandidate> snapshot() const;

private:
	std::deque<IceCandidate> queue_;
};

} // namespace roomcast
