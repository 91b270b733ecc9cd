/*
 * Roomcast
 * libdatachannel-backed media transport
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "roomcast-transport.h"

namespace rtc
{
class PeerConnection;
class Track;
} // namespace rtc

namespace roomcast
{

struct RtcTransportConfig {
	std::vector<IceServer> iceServers;
	bool forceTurn = false;
};

class RtcTransport : public PeerTransport
{
public:
	RtcTransport(const std::string &peerId, const RtcTransportConfig &config, TransportEventSink sink);
	~RtcTransport() override;

	SessionDescription createOffer(bool iceRestart) override;
	SessionDescription createAnswer() override;
	void setLocalDescription(const SessionDescription &description) override;
	void setRemoteDescription(const SessionDescription &description) override;
	void addIceCandidate(const IceCandidate &candidate) override;

	SessionDescription localDescription() const override;
	bool hasRemoteDescription() const override;
	GatheringState gatheringState() const override;

	bool hasSender(TrackKind kind) const override;
	void addTrack(const std::shared_ptr<MediaTrack> &track) override;
	void replaceTrack(TrackKind kind, const std::shared_ptr<MediaTrack> &track) override;

	void close() override;

private:
	struct Sender {
		std::shared_ptr<rtc::Track> rtcTrack;
		std::shared_ptr<MediaTrack> source;
		int sinkId = 0;
	};

	void setupCallbacks();
	void clearCallbacks();
	void emit(const TransportEvent &event);
	void attachSourceLocked(Sender &sender, const std::shared_ptr<MediaTrack> &track);
	void detachSourceLocked(Sender &sender);
	std::shared_ptr<rtc::Track> createSendTrack(TrackKind kind);
	SessionDescription generateLocal(bool offer, bool iceRestart);

	const std::string peerId_;
	std::shared_ptr<rtc::PeerConnection> pc_;
	TransportEventSink sink_;
	std::atomic<bool> closed_{false};

	mutable std::mutex sendersMutex_;
	std::map<TrackKind, Sender> senders_;
	// Incoming tracks and the MediaTracks they feed, index-aligned.
	std::vector<std::shared_ptr<rtc::Track>> remoteTracks_;
	std::vector<std::shared_ptr<MediaTrack>> remoteMedia_;
	uint32_t audioSsrc_ = 0;
	uint32_t videoSsrc_ = 0;
};

class RtcTransportFactory : public TransportFactory
{
public:
	explicit RtcTransportFactory(RtcTransportConfig config);

	std::unique_ptr<PeerTransport> create(const std::string &peerId, TransportEventSink sink) override;

private:
	RtcTransportConfig config_;
};

} // namespace roomcast
