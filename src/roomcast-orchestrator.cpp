/*
 * Roomcast
 * Peer connection orchestrator implementation
 *
 * Every remote peer gets a ConnectionRecord with its own lock and worker
 * thread. Offer/answer cycles, gathering waits and recovery attempts run on
 * that worker so a slow or failing peer never holds up the others. Inbound
 * answers, candidates and transport events are applied inline under the
 * record lock.
 */

#include "roomcast-orchestrator.h"

#include <chrono>
#include <initializer_list>
#include <utility>

#include "roomcast-utils.h"

namespace roomcast
{

namespace
{

constexpr size_t MAX_PENDING_CANDIDATES_PER_PEER = 128;

bool isIceEstablished(IceConnectionState state)
{
	return state == IceConnectionState::Connected || state == IceConnectionState::Completed;
}

} // namespace

PeerOrchestrator::PeerOrchestrator(SignalingLink &link, TransportFactory &factory, LocalMediaController &media,
                                   OrchestratorSettings settings)
    : link_(link), factory_(factory), media_(media), settings_(std::move(settings)), role_(settings_.role)
{
	recoveryConfig_.enabled = settings_.enableRecovery;
	recoveryConfig_.maxRetryAttempts = settings_.maxRetryAttempts;
	recoveryConfig_.baseDelayMs = settings_.retryBaseDelayMs;
	localId_ = settings_.userId;
	roomId_ = settings_.roomId;

	media_.setOnStreamChanged(
	    [this](const std::shared_ptr<MediaStream> &stream) { republishLocalStream(stream); });
}

PeerOrchestrator::~PeerOrchestrator()
{
	shutdown();
	media_.setOnStreamChanged(nullptr);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void PeerOrchestrator::start()
{
	start(settings_.role, localId(), roomId());
}

void PeerOrchestrator::start(Role role, const std::string &localId, const std::string &roomId)
{
	std::lock_guard<std::mutex> lifecycleLock(lifecycleMutex_);

	if (shuttingDown_) {
		throw RoomcastError(ErrorCode::ShutDown, "Orchestrator has been shut down");
	}
	if (started_) {
		throw RoomcastError(ErrorCode::AlreadyStarted, "Already joined room " + this->roomId());
	}
	if (localId.empty() || roomId.empty()) {
		throw RoomcastError(ErrorCode::InvalidSettings, "A user id and a room id are required to join");
	}

	role_ = role;
	{
		std::lock_guard<std::mutex> lock(identityMutex_);
		localId_ = localId;
		roomId_ = roomId;
	}

	link_.setOnMessage([this](const SignalMessage &message) { onSignalingMessage(message); });
	link_.setOnClosed([this]() { handleSignalingLost(); });

	if (!link_.connect(settings_.signalingUrl)) {
		throw RoomcastError(ErrorCode::SignalingUnavailable,
		                    "Could not connect to signaling relay " + settings_.signalingUrl);
	}

	signalingDegraded_ = false;
	if (!link_.send(makeJoinRoom(roomId, localId, role))) {
		link_.disconnect();
		throw RoomcastError(ErrorCode::SignalingUnavailable, "Signaling relay closed before join-room was sent");
	}

	started_ = true;
	logInfo("Joined room %s as %s (%s)", roomId.c_str(), roleToString(role), localId.c_str());

	auto stream = media_.current();
	if (stream && role == Role::Broadcaster) {
		sendSignal(makeStreamType(roomId, stream->kind()));
	}
}

void PeerOrchestrator::shutdown()
{
	if (shuttingDown_.exchange(true)) {
		return;
	}

	std::lock_guard<std::mutex> lifecycleLock(lifecycleMutex_);
	logInfo("Shutting down orchestrator");

	media_.release();

	std::map<std::string, RecordPtr> records;
	{
		std::lock_guard<std::mutex> lock(peersMutex_);
		records.swap(peers_);
		pendingCandidates_.clear();
	}

	for (const auto &pair : records) {
		closeRecord(pair.second, "shutdown");
	}

	if (started_ && link_.isConnected()) {
		sendSignal(makeLeaveRoom(roomId()));
	}

	link_.setOnMessage(nullptr);
	link_.setOnClosed(nullptr);
	link_.disconnect();
	started_ = false;

	logInfo("Orchestrator shut down, %zu peer(s) closed", records.size());
}

// ---------------------------------------------------------------------------
// Signaling dispatch
// ---------------------------------------------------------------------------

void PeerOrchestrator::onSignalingMessage(const SignalMessage &message)
{
	if (shuttingDown_) {
		return;
	}

	switch (message.kind) {
	case SignalKind::RoomUsers:
		handleRoomUsers(message);
		break;
	case SignalKind::UserJoined:
		handleUserJoined(message);
		break;
	case SignalKind::UserLeft:
		handleUserLeft(message);
		break;
	case SignalKind::Offer:
		handleOffer(message);
		break;
	case SignalKind::Answer:
		handleAnswer(message);
		break;
	case SignalKind::IceCandidate:
		handleRemoteCandidate(message);
		break;
	case SignalKind::PeerConnectionState:
		handlePeerConnectionState(message);
		break;
	case SignalKind::StreamType:
		logInfo("Peer %s is streaming %s", message.peerId().c_str(), streamKindToString(message.streamKind));
		break;
	case SignalKind::Error:
		logError("Signaling relay error: %s", message.message.c_str());
		break;
	default:
		logDebug("Ignoring signaling message of type '%s'", message.type.c_str());
		break;
	}
}

void PeerOrchestrator::handleRoomUsers(const SignalMessage &message)
{
	const std::string self = localId();
	logInfo("Room roster has %zu member(s)", message.users.size());

	for (const auto &member : message.users) {
		if (member.userId.empty() || member.userId == self) {
			continue;
		}

		OnUserJoinedCallback cb;
		{
			std::lock_guard<std::mutex> lock(callbackMutex_);
			cb = onUserJoined_;
		}
		if (cb) {
			cb(member);
		}

		onPeerJoined(member.userId, member.role);
	}
}

void PeerOrchestrator::handleUserJoined(const SignalMessage &message)
{
	RoomMember member;
	member.userId = message.userId.empty() ? message.senderId : message.userId;
	member.role = message.userRole;
	if (member.userId.empty() || member.userId == localId()) {
		return;
	}

	logInfo("User %s joined as %s", member.userId.c_str(), roleToString(member.role));

	OnUserJoinedCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onUserJoined_;
	}
	if (cb) {
		cb(member);
	}

	onPeerJoined(member.userId, member.role);
}

void PeerOrchestrator::handleUserLeft(const SignalMessage &message)
{
	const std::string peerId = message.userId.empty() ? message.senderId : message.userId;
	if (peerId.empty()) {
		return;
	}

	logInfo("User %s left", peerId.c_str());
	removePeer(peerId, "peer left");

	OnUserLeftCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onUserLeft_;
	}
	if (cb) {
		cb(peerId);
	}
}

void PeerOrchestrator::onPeerJoined(const std::string &peerId, Role peerRole)
{
	if (shuttingDown_ || peerId.empty() || peerId == localId()) {
		return;
	}

	// Only the broadcaster initiates; viewers wait for its offer.
	if (role_ != Role::Broadcaster || peerRole != Role::Viewer) {
		return;
	}

	bool created = false;
	RecordPtr record = getOrCreateRecord(peerId, peerRole, created);
	if (!record) {
		return;
	}

	if (!created) {
		logInfo("Renegotiating with returning viewer %s", peerId.c_str());
	}
	scheduleOffer(record, false);
}

void PeerOrchestrator::handleOffer(const SignalMessage &message)
{
	const std::string peerId = message.peerId();
	if (peerId.empty() || message.description.sdp.empty()) {
		logWarning("Dropping offer without sender or SDP");
		return;
	}

	const Role remoteRole = role_ == Role::Broadcaster ? Role::Viewer : Role::Broadcaster;
	bool created = false;
	RecordPtr record = getOrCreateRecord(peerId, remoteRole, created);
	if (!record) {
		return;
	}

	logInfo("Received %soffer from %s", created ? "" : "renegotiation ", peerId.c_str());

	std::weak_ptr<ConnectionRecord> weak = record;
	const SessionDescription offer = message.description;
	if (!record->worker.post([this, weak, offer]() {
		    if (auto rec = weak.lock()) {
			    runAnswerCycle(rec, offer);
		    }
	    })) {
		logWarning("Peer %s is closing; offer dropped", peerId.c_str());
	}
}

void PeerOrchestrator::handleAnswer(const SignalMessage &message)
{
	const std::string peerId = message.peerId();
	RecordPtr record = findRecord(peerId);
	if (!record) {
		logWarning("Dropping answer from %s: no connection for that peer", peerId.c_str());
		return;
	}

	RecordLock lock(record->mutex);
	if (record->closing || !record->transport) {
		return;
	}
	applyRemoteAnswerLocked(record, message.description);
}

void PeerOrchestrator::handleRemoteCandidate(const SignalMessage &message)
{
	const std::string peerId = message.peerId();
	if (peerId.empty() || message.candidate.candidate.empty()) {
		return;
	}

	RecordPtr record;
	{
		std::lock_guard<std::mutex> lock(peersMutex_);
		auto it = peers_.find(peerId);
		if (it == peers_.end()) {
			auto &pending = pendingCandidates_[peerId];
			if (pending.size() >= MAX_PENDING_CANDIDATES_PER_PEER) {
				logWarning("Too many early candidates from %s; dropping", peerId.c_str());
				return;
			}
			pending.push(message.candidate);
			logDebug("Buffered early candidate from %s (%zu pending)", peerId.c_str(), pending.size());
			return;
		}
		record = it->second;
	}

	RecordLock lock(record->mutex);
	if (record->closing || !record->transport) {
		return;
	}

	if (!record->transport->hasRemoteDescription()) {
		record->candidates.push(message.candidate);
		logDebug("Buffered candidate from %s until remote description is set (%zu queued)", peerId.c_str(),
		         record->candidates.size());
		return;
	}

	// Candidates rejected earlier are retried ahead of the new one.
	record->candidates.push(message.candidate);
	flushCandidatesLocked(record);
}

void PeerOrchestrator::handlePeerConnectionState(const SignalMessage &message)
{
	const std::string peerId = message.peerId();
	const ConnectionState state = parseConnectionState(message.connectionState);
	const IceConnectionState iceState = parseIceConnectionState(message.iceConnectionState);

	logDebug("Peer %s reports connection %s, ICE %s", peerId.c_str(), connectionStateToString(state),
	         iceConnectionStateToString(iceState));

	// Only the broadcaster acts on remote reports, since it owns restarts.
	if (role_ != Role::Broadcaster) {
		return;
	}

	RecordPtr record = findRecord(peerId);
	if (!record) {
		return;
	}

	const bool failed = (!message.connectionState.empty() && shouldRecover(Role::Broadcaster, state)) ||
	                    (!message.iceConnectionState.empty() && shouldRecover(Role::Broadcaster, iceState));
	if (!failed) {
		return;
	}

	RecordLock lock(record->mutex);
	if (record->closing) {
		return;
	}
	requestRecoveryLocked(record, "remote report");
}

void PeerOrchestrator::handleSignalingLost()
{
	if (shuttingDown_) {
		return;
	}

	signalingDegraded_ = true;
	logWarning("Signaling relay lost; established peers keep streaming but no new signaling is possible");

	OnSignalingLostCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onSignalingLost_;
	}
	if (cb) {
		cb();
	}
}

// ---------------------------------------------------------------------------
// Record table
// ---------------------------------------------------------------------------

PeerOrchestrator::RecordPtr PeerOrchestrator::findRecord(const std::string &peerId) const
{
	std::lock_guard<std::mutex> lock(peersMutex_);
	auto it = peers_.find(peerId);
	return it == peers_.end() ? nullptr : it->second;
}

PeerOrchestrator::RecordPtr PeerOrchestrator::getOrCreateRecord(const std::string &peerId, Role remoteRole,
                                                                bool &created)
{
	created = false;
	{
		std::lock_guard<std::mutex> lock(peersMutex_);
		auto it = peers_.find(peerId);
		if (it != peers_.end()) {
			return it->second;
		}
	}

	auto record = std::make_shared<ConnectionRecord>(peerId);
	record->remoteRole = remoteRole;

	std::weak_ptr<ConnectionRecord> weak = record;
	try {
		record->transport = factory_.create(peerId, [this, weak](const TransportEvent &event) {
			if (auto rec = weak.lock()) {
				handleTransportEvent(rec, event);
			}
		});
	} catch (const std::exception &e) {
		logError("Failed to create transport for %s: %s", peerId.c_str(), e.what());
		record->worker.stop();
		return nullptr;
	}

	RecordPtr existing;
	{
		std::lock_guard<std::mutex> lock(peersMutex_);
		if (shuttingDown_) {
			existing = nullptr;
		} else {
			auto it = peers_.find(peerId);
			if (it != peers_.end()) {
				existing = it->second;
			} else {
				auto pending = pendingCandidates_.find(peerId);
				if (pending != pendingCandidates_.end()) {
					record->candidates.append(std::move(pending->second));
					pendingCandidates_.erase(pending);
				}
				peers_[peerId] = record;
				created = true;
			}
		}
	}

	if (!created) {
		// Lost a creation race or shutting down; discard the spare record.
		closeRecord(record, "superseded");
		return existing;
	}

	logInfo("Created connection for %s (%s)", peerId.c_str(), roleToString(remoteRole));
	return record;
}

void PeerOrchestrator::closeRecord(const RecordPtr &record, const char *reason)
{
	{
		RecordLock lock(record->mutex);
		record->closing = true;
		record->isRetrying = false;
	}
	record->cv.notify_all();

	record->worker.stop();

	std::unique_ptr<PeerTransport> transport;
	{
		RecordLock lock(record->mutex);
		transport = std::move(record->transport);
		record->candidates.clear();
		record->state = ConnectionState::Closed;
	}

	if (transport) {
		try {
			transport->close();
		} catch (const std::exception &e) {
			logWarning("Error closing transport for %s: %s", record->peerId.c_str(), e.what());
		}
	}

	logInfo("Closed connection to %s (%s)", record->peerId.c_str(), reason);
}

void PeerOrchestrator::removePeer(const std::string &peerId, const char *reason)
{
	RecordPtr record;
	{
		std::lock_guard<std::mutex> lock(peersMutex_);
		pendingCandidates_.erase(peerId);
		auto it = peers_.find(peerId);
		if (it == peers_.end()) {
			return;
		}
		record = it->second;
		peers_.erase(it);
	}
	closeRecord(record, reason);
}

std::vector<PeerOrchestrator::RecordPtr> PeerOrchestrator::snapshotRecords() const
{
	std::vector<RecordPtr> records;
	std::lock_guard<std::mutex> lock(peersMutex_);
	records.reserve(peers_.size());
	for (const auto &pair : peers_) {
		records.push_back(pair.second);
	}
	return records;
}

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------

void PeerOrchestrator::scheduleOffer(const RecordPtr &record, bool iceRestart)
{
	std::weak_ptr<ConnectionRecord> weak = record;
	if (!record->worker.post([this, weak, iceRestart]() {
		    if (auto rec = weak.lock()) {
			    runOfferCycle(rec, iceRestart);
		    }
	    })) {
		logWarning("Peer %s is closing; offer not scheduled", record->peerId.c_str());
	}
}

bool PeerOrchestrator::runOfferCycle(const RecordPtr &record, bool iceRestart)
{
	RecordLock lock(record->mutex);
	if (record->closing || shuttingDown_ || !record->transport) {
		return false;
	}

	try {
		attachStreamLocked(record, media_.current());
		SessionDescription offer = record->transport->createOffer(iceRestart);
		record->transport->setLocalDescription(offer);
	} catch (const std::exception &e) {
		logError("Failed to create %soffer for %s: %s", iceRestart ? "ICE restart " : "", record->peerId.c_str(),
		         e.what());
		return false;
	}

	if (!waitForGathering(record, lock)) {
		return false;
	}

	SessionDescription local;
	try {
		local = record->transport->localDescription();
	} catch (const std::exception &e) {
		logError("No local description for %s: %s", record->peerId.c_str(), e.what());
		return false;
	}
	lock.unlock();

	logInfo("Sending %soffer to %s", iceRestart ? "ICE restart " : "", record->peerId.c_str());
	return sendSignal(makeOffer(roomId(), record->peerId, local.sdp));
}

void PeerOrchestrator::runAnswerCycle(const RecordPtr &record, const SessionDescription &offer)
{
	RecordLock lock(record->mutex);
	if (record->closing || shuttingDown_ || !record->transport) {
		return;
	}

	try {
		record->transport->setRemoteDescription({"offer", offer.sdp});
	} catch (const std::exception &e) {
		logError("Failed to apply offer from %s: %s", record->peerId.c_str(), e.what());
		return;
	}

	flushCandidatesLocked(record);

	try {
		SessionDescription answer = record->transport->createAnswer();
		record->transport->setLocalDescription(answer);
	} catch (const std::exception &e) {
		logError("Failed to create answer for %s: %s", record->peerId.c_str(), e.what());
		return;
	}

	if (!waitForGathering(record, lock)) {
		return;
	}

	SessionDescription local;
	try {
		local = record->transport->localDescription();
	} catch (const std::exception &e) {
		logError("No local description for %s: %s", record->peerId.c_str(), e.what());
		return;
	}
	lock.unlock();

	logInfo("Sending answer to %s", record->peerId.c_str());
	sendSignal(makeAnswer(roomId(), record->peerId, local.sdp));
}

bool PeerOrchestrator::waitForGathering(const RecordPtr &record, RecordLock &lock)
{
	auto gatheringDone = [this, &record]() {
		return record->closing || shuttingDown_ || !record->transport ||
		       record->transport->gatheringState() == GatheringState::Complete;
	};

	const int timeoutMs = settings_.iceGatheringTimeoutMs > 0 ? settings_.iceGatheringTimeoutMs : 0;
	if (!record->cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), gatheringDone)) {
		logWarning("ICE gathering for %s not complete after %d ms; sending what was gathered",
		           record->peerId.c_str(), timeoutMs);
	}

	return !record->closing && !shuttingDown_ && record->transport;
}

// ---------------------------------------------------------------------------
// Record-locked helpers
// ---------------------------------------------------------------------------

void PeerOrchestrator::onTransportEvent(const std::string &peerId, const TransportEvent &event)
{
	RecordPtr record = findRecord(peerId);
	if (!record) {
		logDebug("Ignoring transport event for unknown peer %s", peerId.c_str());
		return;
	}
	handleTransportEvent(record, event);
}

void PeerOrchestrator::handleTransportEvent(const RecordPtr &record, const TransportEvent &event)
{
	if (shuttingDown_) {
		return;
	}

	RecordLock lock(record->mutex);
	if (record->closing) {
		return;
	}

	switch (event.type) {
	case TransportEventType::LocalCandidate:
		sendSignal(makeIceCandidate(roomId(), record->peerId, event.candidate));
		break;

	case TransportEventType::GatheringStateChange:
		if (event.gatheringState == GatheringState::Complete) {
			logDebug("ICE gathering complete for %s", record->peerId.c_str());
			record->cv.notify_all();
			if (record->transport && record->transport->hasRemoteDescription()) {
				flushCandidatesLocked(record);
			}
		}
		break;

	case TransportEventType::ConnectionStateChange: {
		record->state = event.connectionState;
		logInfo("Peer %s connection %s", record->peerId.c_str(), connectionStateToString(event.connectionState));

		if (event.connectionState == ConnectionState::Connected) {
			markConnectedLocked(record);
		} else if (shouldRecover(role_, event.connectionState)) {
			requestRecoveryLocked(record, connectionStateToString(event.connectionState));
		}
		announceStateLocked(record);

		OnPeerStateChangedCallback cb;
		{
			std::lock_guard<std::mutex> cbLock(callbackMutex_);
			cb = onPeerStateChanged_;
		}
		lock.unlock();
		if (cb) {
			cb(record->peerId, event.connectionState);
		}
		break;
	}

	case TransportEventType::IceStateChange:
		record->iceState = event.iceState;
		logDebug("Peer %s ICE %s", record->peerId.c_str(), iceConnectionStateToString(event.iceState));

		if (isIceEstablished(event.iceState)) {
			markConnectedLocked(record);
		} else if (shouldRecover(role_, event.iceState)) {
			requestRecoveryLocked(record, iceConnectionStateToString(event.iceState));
		}
		announceStateLocked(record);
		break;

	case TransportEventType::RemoteTrack: {
		if (!event.track) {
			break;
		}
		logInfo("Received %s track from %s", trackKindToString(event.track->kind()), record->peerId.c_str());

		OnRemoteTrackCallback cb;
		{
			std::lock_guard<std::mutex> cbLock(callbackMutex_);
			cb = onRemoteTrack_;
		}
		lock.unlock();
		if (cb) {
			cb(record->peerId, event.track);
		}
		break;
	}
	}
}

void PeerOrchestrator::applyRemoteAnswerLocked(const RecordPtr &record, const SessionDescription &answer)
{
	try {
		record->transport->setRemoteDescription({"answer", answer.sdp});
	} catch (const std::exception &e) {
		logError("Failed to apply answer from %s: %s", record->peerId.c_str(), e.what());
		return;
	}

	logInfo("Applied answer from %s", record->peerId.c_str());
	flushCandidatesLocked(record);
}

void PeerOrchestrator::flushCandidatesLocked(const RecordPtr &record)
{
	if (record->candidates.empty()) {
		return;
	}

	const CandidateFlushResult result =
	    record->candidates.flush([this, &record](const IceCandidate &c) { return applyCandidateLocked(record, c); });

	if (result.requeued > 0) {
		logWarning("Applied %zu buffered candidate(s) for %s, %zu kept for retry", result.applied,
		           record->peerId.c_str(), result.requeued);
	} else {
		logDebug("Applied %zu buffered candidate(s) for %s", result.applied, record->peerId.c_str());
	}
}

bool PeerOrchestrator::applyCandidateLocked(const RecordPtr &record, const IceCandidate &candidate)
{
	try {
		record->transport->addIceCandidate(candidate);
		return true;
	} catch (const std::exception &e) {
		logWarning("Failed to add candidate for %s: %s", record->peerId.c_str(), e.what());
		return false;
	}
}

bool PeerOrchestrator::attachStreamLocked(const RecordPtr &record, const std::shared_ptr<MediaStream> &stream)
{
	bool added = false;
	for (TrackKind kind : {TrackKind::Audio, TrackKind::Video}) {
		auto track = stream ? stream->track(kind) : nullptr;
		try {
			if (record->transport->hasSender(kind)) {
				record->transport->replaceTrack(kind, track);
			} else if (track) {
				record->transport->addTrack(track);
				added = true;
			}
		} catch (const std::exception &e) {
			logWarning("Failed to attach %s track for %s: %s", trackKindToString(kind), record->peerId.c_str(),
			           e.what());
		}
	}
	return added;
}

void PeerOrchestrator::markConnectedLocked(const RecordPtr &record)
{
	if (record->retryCount > 0 || record->permanentlyFailed) {
		logInfo("Peer %s recovered after %d attempt(s)", record->peerId.c_str(), record->retryCount);
	}
	record->retryCount = 0;
	record->isRetrying = false;
	record->permanentlyFailed = false;
}

void PeerOrchestrator::requestRecoveryLocked(const RecordPtr &record, const char *trigger)
{
	const RecoveryDecision decision = evaluateRecovery(recoveryConfig_, record->retryCount, record->isRetrying);

	switch (decision) {
	case RecoveryDecision::Disabled:
		logDebug("Recovery disabled; not restarting %s (%s)", record->peerId.c_str(), trigger);
		return;
	case RecoveryDecision::AlreadyRetrying:
		logDebug("Recovery for %s already in progress (%s)", record->peerId.c_str(), trigger);
		return;
	case RecoveryDecision::Exhausted:
		if (!record->permanentlyFailed) {
			record->permanentlyFailed = true;
			logError("Peer %s permanently failed after %d attempt(s)", record->peerId.c_str(),
			         record->retryCount);
		}
		return;
	case RecoveryDecision::Retry:
		break;
	}

	record->isRetrying = true;
	record->retryCount++;

	const int delay = backoffDelayMs(recoveryConfig_, record->retryCount);
	const int waitMs = remainingDelayMs(delay, record->lastRetryAt, std::chrono::steady_clock::now());
	logInfo("Recovering %s (%s), attempt %d/%d in %d ms", record->peerId.c_str(), trigger, record->retryCount,
	        recoveryConfig_.maxRetryAttempts, waitMs);

	std::weak_ptr<ConnectionRecord> weak = record;
	if (!record->worker.postDelayed(waitMs, [this, weak]() {
		    if (auto rec = weak.lock()) {
			    runRecovery(rec);
		    }
	    })) {
		record->isRetrying = false;
	}
}

void PeerOrchestrator::runRecovery(const RecordPtr &record)
{
	{
		RecordLock lock(record->mutex);
		if (record->closing || shuttingDown_) {
			record->isRetrying = false;
			return;
		}
		record->lastRetryAt = std::chrono::steady_clock::now();

		// A transition to connected while waiting clears isRetrying.
		if (!record->isRetrying) {
			logInfo("Peer %s reconnected before restart", record->peerId.c_str());
			return;
		}
	}

	if (role_ == Role::Broadcaster) {
		if (!runOfferCycle(record, true)) {
			logWarning("ICE restart toward %s did not complete", record->peerId.c_str());
		}
	} else {
		logInfo("Waiting for broadcaster to restart ICE with %s", record->peerId.c_str());
	}

	RecordLock lock(record->mutex);
	record->isRetrying = false;
}

void PeerOrchestrator::announceStateLocked(const RecordPtr &record)
{
	sendSignal(makePeerConnectionState(roomId(), localId(), record->peerId, record->state, record->iceState));
}

PeerSnapshot PeerOrchestrator::snapshotLocked(const RecordPtr &record) const
{
	PeerSnapshot snapshot;
	snapshot.peerId = record->peerId;
	snapshot.remoteRole = record->remoteRole;
	snapshot.state = record->state;
	snapshot.iceState = record->iceState;
	snapshot.retryCount = record->retryCount;
	snapshot.isRetrying = record->isRetrying;
	snapshot.permanentlyFailed = record->permanentlyFailed;
	snapshot.bufferedCandidates = record->candidates.size();
	if (record->transport) {
		try {
			snapshot.remoteDescriptionSet = record->transport->hasRemoteDescription();
		} catch (const std::exception &e) {
			logDebug("Could not query %s: %s", record->peerId.c_str(), e.what());
		}
	}
	return snapshot;
}

// ---------------------------------------------------------------------------
// Local stream
// ---------------------------------------------------------------------------

void PeerOrchestrator::setLocalStream(std::shared_ptr<MediaStream> stream)
{
	media_.adopt(std::move(stream));
}

void PeerOrchestrator::clearLocalStream()
{
	media_.release();
}

std::shared_ptr<MediaStream> PeerOrchestrator::startLocalStream(StreamKind kind)
{
	return media_.acquire(kind);
}

std::shared_ptr<MediaStream> PeerOrchestrator::switchLocalStream(StreamKind kind)
{
	return media_.switchTo(kind);
}

std::shared_ptr<MediaStream> PeerOrchestrator::localStream() const
{
	return media_.current();
}

void PeerOrchestrator::republishLocalStream(const std::shared_ptr<MediaStream> &stream)
{
	if (shuttingDown_) {
		return;
	}

	for (const auto &record : snapshotRecords()) {
		bool renegotiate = false;
		{
			RecordLock lock(record->mutex);
			if (record->closing || !record->transport) {
				continue;
			}
			renegotiate = attachStreamLocked(record, stream);
		}

		if (renegotiate && role_ == Role::Broadcaster) {
			logInfo("New sender for %s; renegotiating", record->peerId.c_str());
			scheduleOffer(record, false);
		}
	}

	if (stream && started_ && role_ == Role::Broadcaster) {
		sendSignal(makeStreamType(roomId(), stream->kind()));
	}
}

bool PeerOrchestrator::sendSignal(const SignalMessage &message)
{
	if (!link_.send(message)) {
		logWarning("Dropped %s for %s: signaling link is down", signalKindToType(message.kind),
		           message.targetUserId.empty() ? "room" : message.targetUserId.c_str());
		return false;
	}
	return true;
}

// ---------------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------------

std::string PeerOrchestrator::localId() const
{
	std::lock_guard<std::mutex> lock(identityMutex_);
	return localId_;
}

std::string PeerOrchestrator::roomId() const
{
	std::lock_guard<std::mutex> lock(identityMutex_);
	return roomId_;
}

bool PeerOrchestrator::hasPeer(const std::string &peerId) const
{
	return findRecord(peerId) != nullptr;
}

std::vector<std::string> PeerOrchestrator::peerIds() const
{
	std::vector<std::string> ids;
	std::lock_guard<std::mutex> lock(peersMutex_);
	ids.reserve(peers_.size());
	for (const auto &pair : peers_) {
		ids.push_back(pair.first);
	}
	return ids;
}

bool PeerOrchestrator::peerSnapshot(const std::string &peerId, PeerSnapshot &snapshot) const
{
	RecordPtr record = findRecord(peerId);
	if (!record) {
		return false;
	}
	RecordLock lock(record->mutex);
	snapshot = snapshotLocked(record);
	return true;
}

size_t PeerOrchestrator::bufferedCandidateCount(const std::string &peerId) const
{
	RecordPtr record;
	{
		std::lock_guard<std::mutex> lock(peersMutex_);
		auto it = peers_.find(peerId);
		if (it == peers_.end()) {
			auto pending = pendingCandidates_.find(peerId);
			return pending == pendingCandidates_.end() ? 0 : pending->second.size();
		}
		record = it->second;
	}
	RecordLock lock(record->mutex);
	return record->candidates.size();
}

// ---------------------------------------------------------------------------
// Callbacks
// ---------------------------------------------------------------------------

void PeerOrchestrator::setOnRemoteTrack(OnRemoteTrackCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onRemoteTrack_ = callback;
}

void PeerOrchestrator::setOnUserJoined(OnUserJoinedCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onUserJoined_ = callback;
}

void PeerOrchestrator::setOnUserLeft(OnUserLeftCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onUserLeft_ = callback;
}

void PeerOrchestrator::setOnPeerStateChanged(OnPeerStateChangedCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onPeerStateChanged_ = callback;
}

void PeerOrchestrator::setOnSignalingLost(OnSignalingLostCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onSignalingLost_ = callback;
}

} // namespace roomcast
