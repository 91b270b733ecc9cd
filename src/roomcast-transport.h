/*
 * Roomcast
 * Media transport capability consumed by the orchestrator
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "roomcast-common.h"
#include "roomcast-media.h"

namespace roomcast
{

enum class TransportEventType { LocalCandidate, GatheringStateChange, ConnectionStateChange, IceStateChange, RemoteTrack };

struct TransportEvent {
	TransportEventType type = TransportEventType::LocalCandidate;
	IceCandidate candidate;
	GatheringState gatheringState = GatheringState::New;
	ConnectionState connectionState = ConnectionState::New;
	IceConnectionState iceState = IceConnectionState::New;
	std::shared_ptr<MediaTrack> track;
};

using TransportEventSink = std::function<void(const TransportEvent &event)>;

// One media session with one remote peer. Engine failures are reported as
// std::exception from the call that hit them.
class PeerTransport
{
public:
	virtual ~PeerTransport() = default;

	virtual SessionDescription createOffer(bool iceRestart) = 0;
	virtual SessionDescription createAnswer() = 0;
	virtual void setLocalDescription(const SessionDescription &description) = 0;
	virtual void setRemoteDescription(const SessionDescription &description) = 0;
	virtual void addIceCandidate(const IceCandidate &candidate) = 0;

	// Local description including every candidate gathered so far.
	virtual SessionDescription localDescription() const = 0;
	virtual bool hasRemoteDescription() const = 0;
	virtual GatheringState gatheringState() const = 0;

	virtual bool hasSender(TrackKind kind) const = 0;
	virtual void addTrack(const std::shared_ptr<MediaTrack> &track) = 0;
	// A null track detaches the sender's source but keeps the sender.
	virtual void replaceTrack(TrackKind kind, const std::shared_ptr<MediaTrack> &track) = 0;

	// Stops event delivery and releases the session. Idempotent.
	virtual void close() = 0;
};

class TransportFactory
{
public:
	virtual ~TransportFactory() = default;
	virtual std::unique_ptr<PeerTransport> create(const std::string &peerId, TransportEventSink sink) = 0;
};

} // namespace roomcast
