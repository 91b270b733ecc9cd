/*
 * Roomcast
 * Peer connection orchestrator: signaling handshake, per-peer lifecycle and
 * failure recovery for one broadcaster and many viewers
 */

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "roomcast-candidate-buffer.h"
#include "roomcast-common.h"
#include "roomcast-connection-record.h"
#include "roomcast-media.h"
#include "roomcast-recovery-policy.h"
#include "roomcast-signaling.h"
#include "roomcast-transport.h"

namespace roomcast
{

using OnRemoteTrackCallback = std::function<void(const std::string &peerId, const std::shared_ptr<MediaTrack> &track)>;
using OnUserJoinedCallback = std::function<void(const RoomMember &member)>;
using OnUserLeftCallback = std::function<void(const std::string &peerId)>;
using OnPeerStateChangedCallback = std::function<void(const std::string &peerId, ConnectionState state)>;
using OnSignalingLostCallback = std::function<void()>;

class PeerOrchestrator
{
public:
	PeerOrchestrator(SignalingLink &link, TransportFactory &factory, LocalMediaController &media,
	                 OrchestratorSettings settings);
	~PeerOrchestrator();

	PeerOrchestrator(const PeerOrchestrator &) = delete;
	PeerOrchestrator &operator=(const PeerOrchestrator &) = delete;

	// Connects the signaling link and joins the room. Throws RoomcastError with
	// SignalingUnavailable, AlreadyStarted, ShutDown or InvalidSettings.
	void start();
	void start(Role role, const std::string &localId, const std::string &roomId);

	void onPeerJoined(const std::string &peerId, Role peerRole);
	void onSignalingMessage(const SignalMessage &message);
	void onTransportEvent(const std::string &peerId, const TransportEvent &event);

	// Local stream lifecycle. Every change is republished to all live peers.
	void setLocalStream(std::shared_ptr<MediaStream> stream);
	void clearLocalStream();
	std::shared_ptr<MediaStream> startLocalStream(StreamKind kind);
	std::shared_ptr<MediaStream> switchLocalStream(StreamKind kind);

	// Closes every peer, leaves the room and closes the link. Safe to call
	// more than once and concurrently with in-flight handshakes.
	void shutdown();

	// Inspection
	bool isStarted() const { return started_; }
	bool isShutDown() const { return shuttingDown_; }
	bool isSignalingDegraded() const { return signalingDegraded_; }
	Role localRole() const { return role_; }
	std::string localId() const;
	std::string roomId() const;
	bool hasPeer(const std::string &peerId) const;
	std::vector<std::string> peerIds() const;
	bool peerSnapshot(const std::string &peerId, PeerSnapshot &snapshot) const;
	size_t bufferedCandidateCount(const std::string &peerId) const;
	std::shared_ptr<MediaStream> localStream() const;

	// Callbacks
	void setOnRemoteTrack(OnRemoteTrackCallback callback);
	void setOnUserJoined(OnUserJoinedCallback callback);
	void setOnUserLeft(OnUserLeftCallback callback);
	void setOnPeerStateChanged(OnPeerStateChangedCallback callback);
	void setOnSignalingLost(OnSignalingLostCallback callback);

private:
	using RecordPtr = std::shared_ptr<ConnectionRecord>;
	using RecordLock = std::unique_lock<std::recursive_mutex>;

	// Signaling dispatch
	void handleRoomUsers(const SignalMessage &message);
	void handleUserJoined(const SignalMessage &message);
	void handleUserLeft(const SignalMessage &message);
	void handleOffer(const SignalMessage &message);
	void handleAnswer(const SignalMessage &message);
	void handleRemoteCandidate(const SignalMessage &message);
	void handlePeerConnectionState(const SignalMessage &message);
	void handleSignalingLost();

	// Record table
	RecordPtr findRecord(const std::string &peerId) const;
	RecordPtr getOrCreateRecord(const std::string &peerId, Role remoteRole, bool &created);
	void closeRecord(const RecordPtr &record, const char *reason);
	void removePeer(const std::string &peerId, const char *reason);
	std::vector<RecordPtr> snapshotRecords() const;

	// Handshake, run on the record's worker
	void scheduleOffer(const RecordPtr &record, bool iceRestart);
	bool runOfferCycle(const RecordPtr &record, bool iceRestart);
	void runAnswerCycle(const RecordPtr &record, const SessionDescription &offer);
	bool waitForGathering(const RecordPtr &record, RecordLock &lock);

	// Record-locked helpers
	void handleTransportEvent(const RecordPtr &record, const TransportEvent &event);
	void applyRemoteAnswerLocked(const RecordPtr &record, const SessionDescription &answer);
	void flushCandidatesLocked(const RecordPtr &record);
	bool applyCandidateLocked(const RecordPtr &record, const IceCandidate &candidate);
	bool attachStreamLocked(const RecordPtr &record, const std::shared_ptr<MediaStream> &stream);
	void markConnectedLocked(const RecordPtr &record);
	void requestRecoveryLocked(const RecordPtr &record, const char *trigger);
	void announceStateLocked(const RecordPtr &record);
	PeerSnapshot snapshotLocked(const RecordPtr &record) const;

	// Recovery, run on the record's worker after the backoff delay
	void runRecovery(const RecordPtr &record);

	void republishLocalStream(const std::shared_ptr<MediaStream> &stream);
	bool sendSignal(const SignalMessage &message);

	SignalingLink &link_;
	TransportFactory &factory_;
	LocalMediaController &media_;
	OrchestratorSettings settings_;
	RecoveryConfig recoveryConfig_;

	std::mutex lifecycleMutex_;
	std::atomic<bool> started_{false};
	std::atomic<bool> shuttingDown_{false};
	std::atomic<bool> signalingDegraded_{false};

	std::atomic<Role> role_;
	mutable std::mutex identityMutex_;
	std::string localId_;
	std::string roomId_;

	mutable std::mutex peersMutex_;
	std::map<std::string, RecordPtr> peers_;
	// Candidates from peers that have no record yet; adopted on creation.
	std::map<std::string, CandidateBuffer> pendingCandidates_;

	std::mutex callbackMutex_;
	OnRemoteTrackCallback onRemoteTrack_;
	OnUserJoinedCallback onUserJoined_;
	OnUserLeftCallback onUserLeft_;
	OnPeerStateChangedCallback onPeerStateChanged_;
	OnSignalingLostCallback onSignalingLost_;
};

} // namespace roomcast
