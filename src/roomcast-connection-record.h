/*
 * Roomcast
 * Per-peer connection state owned by the orchestrator
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "roomcast-candidate-buffer.h"
#include "roomcast-common.h"
#include "roomcast-peer-worker.h"
#include "roomcast-transport.h"

namespace roomcast
{

// All fields except peerId and worker are guarded by mutex. The mutex is
// recursive because a transport may raise events synchronously from inside a
// call made while it is held.
struct ConnectionRecord {
	explicit ConnectionRecord(const std::string &id) : peerId(id), worker("peer-" + id) {}

	const std::string peerId;
	Role remoteRole = Role::Viewer;
	std::unique_ptr<PeerTransport> transport;

	int retryCount = 0;
	std::chrono::steady_clock::time_point lastRetryAt{};
	bool isRetrying = false;
	bool permanentlyFailed = false;

	ConnectionState state = ConnectionState::New;
	IceConnectionState iceState = IceConnectionState::New;
	CandidateBuffer candidates;

	// Set once the record leaves the table; wakes gathering waits.
	bool closing = false;

	std::recursive_mutex mutex;
	std::condition_variable_any cv;

	PeerWorker worker;
};

// Read-only view of a record for inspection.
struct PeerSnapshot {
	std::string peerId;
	Role remoteRole = Role::Viewer;
	ConnectionState state = ConnectionState::New;
	IceConnectionState iceState = IceConnectionState::New;
	int retryCount = 0;
	bool isRetrying = false;
	bool permanentlyFailed = false;
	bool remoteDescriptionSet = false;
	size_t bufferedCandidates = 0;
};

} // namespace roomcast
