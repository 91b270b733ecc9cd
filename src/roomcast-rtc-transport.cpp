/*
 * Roomcast
 * libdatachannel-backed media transport
 *
 * Negotiation is driven explicitly: auto-negotiation is disabled and local
 * descriptions are generated when the orchestrator asks for an offer or an
 * answer. Outgoing tracks forward RTP packets delivered by the local
 * MediaTrack; incoming tracks are wrapped into MediaTracks fed by the
 * remote RTP stream.
 */

#include "roomcast-rtc-transport.h"

#include <rtc/rtc.hpp>

#include <random>
#include <utility>
#include <variant>

#include "roomcast-utils.h"

namespace roomcast
{

namespace
{

std::string randomIceToken(size_t length)
{
	static const char alphabet[] = "0123456789"
	                               "abcdefghijklmnopqrstuvwxyz"
	                               "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
	thread_local std::random_device rd;
	thread_local std::mt19937 gen(rd());
	thread_local std::uniform_int_distribution<> dis(0, sizeof(alphabet) - 2);

	std::string result;
	result.reserve(length);
	for (size_t i = 0; i < length; i++) {
		result += alphabet[dis(gen)];
	}
	return result;
}

rtc::Configuration buildRtcConfig(const RtcTransportConfig &config)
{
	rtc::Configuration rtcConfig;
	rtcConfig.disableAutoNegotiation = true;
	bool hasTurnServer = false;

	for (const auto &stun : DEFAULT_STUN_SERVERS) {
		rtcConfig.iceServers.emplace_back(stun);
	}

	for (const auto &server : config.iceServers) {
		try {
			rtc::IceServer iceServer(server.urls);
			if (!server.username.empty()) {
				iceServer.username = server.username;
				iceServer.password = server.credential;
			}
			rtcConfig.iceServers.push_back(iceServer);
			if (hasTurnScheme(server.urls)) {
				hasTurnServer = true;
			}
		} catch (const std::exception &e) {
			logWarning("Ignoring ICE server %s: %s", server.urls.c_str(), e.what());
		}
	}

	if (config.forceTurn) {
		rtcConfig.iceTransportPolicy = rtc::TransportPolicy::Relay;
		if (!hasTurnServer) {
			logWarning("Force TURN is enabled but no TURN servers are configured; connections may fail.");
		}
	}

	return rtcConfig;
}

ConnectionState toConnectionState(rtc::PeerConnection::State state)
{
	switch (state) {
	case rtc::PeerConnection::State::New:
		return ConnectionState::New;
	case rtc::PeerConnection::State::Connecting:
		return ConnectionState::Connecting;
	case rtc::PeerConnection::State::Connected:
		return ConnectionState::Connected;
	case rtc::PeerConnection::State::Disconnected:
		return ConnectionState::Disconnected;
	case rtc::PeerConnection::State::Failed:
		return ConnectionState::Failed;
	case rtc::PeerConnection::State::Closed:
		return ConnectionState::Closed;
	}
	return ConnectionState::Closed;
}

IceConnectionState toIceState(rtc::PeerConnection::IceState state)
{
	switch (state) {
	case rtc::PeerConnection::IceState::New:
		return IceConnectionState::New;
	case rtc::PeerConnection::IceState::Checking:
		return IceConnectionState::Checking;
	case rtc::PeerConnection::IceState::Connected:
		return IceConnectionState::Connected;
	case rtc::PeerConnection::IceState::Completed:
		return IceConnectionState::Completed;
	case rtc::PeerConnection::IceState::Disconnected:
		return IceConnectionState::Disconnected;
	case rtc::PeerConnection::IceState::Failed:
		return IceConnectionState::Failed;
	case rtc::PeerConnection::IceState::Closed:
		return IceConnectionState::Closed;
	}
	return IceConnectionState::Closed;
}

GatheringState toGatheringState(rtc::PeerConnection::GatheringState state)
{
	switch (state) {
	case rtc::PeerConnection::GatheringState::New:
		return GatheringState::New;
	case rtc::PeerConnection::GatheringState::InProgress:
		return GatheringState::InProgress;
	case rtc::PeerConnection::GatheringState::Complete:
		return GatheringState::Complete;
	}
	return GatheringState::New;
}

} // namespace

RtcTransport::RtcTransport(const std::string &peerId, const RtcTransportConfig &config, TransportEventSink sink)
    : peerId_(peerId), sink_(std::move(sink))
{
	std::random_device rd;
	std::mt19937 gen(rd());
	std::uniform_int_distribution<uint32_t> dis(1, 0xFFFFFFFE);
	audioSsrc_ = dis(gen);
	videoSsrc_ = dis(gen);
	while (videoSsrc_ == audioSsrc_) {
		videoSsrc_ = dis(gen);
	}

	pc_ = std::make_shared<rtc::PeerConnection>(buildRtcConfig(config));
	setupCallbacks();
	logDebug("Created transport for %s (audio SSRC %u, video SSRC %u)", peerId_.c_str(), audioSsrc_, videoSsrc_);
}

RtcTransport::~RtcTransport()
{
	close();
}

void RtcTransport::emit(const TransportEvent &event)
{
	if (closed_ || !sink_) {
		return;
	}
	sink_(event);
}

void RtcTransport::setupCallbacks()
{
	pc_->onLocalCandidate([this](rtc::Candidate candidate) {
		TransportEvent event;
		event.type = TransportEventType::LocalCandidate;
		event.candidate.candidate = std::string(candidate);
		event.candidate.mid = candidate.mid();
		emit(event);
	});

	pc_->onGatheringStateChange([this](rtc::PeerConnection::GatheringState state) {
		TransportEvent event;
		event.type = TransportEventType::GatheringStateChange;
		event.gatheringState = toGatheringState(state);
		emit(event);
	});

	pc_->onStateChange([this](rtc::PeerConnection::State state) {
		TransportEvent event;
		event.type = TransportEventType::ConnectionStateChange;
		event.connectionState = toConnectionState(state);
		emit(event);
	});

	pc_->onIceStateChange([this](rtc::PeerConnection::IceState state) {
		TransportEvent event;
		event.type = TransportEventType::IceStateChange;
		event.iceState = toIceState(state);
		emit(event);
	});

	pc_->onTrack([this](std::shared_ptr<rtc::Track> track) {
		if (closed_) {
			return;
		}

		const TrackKind kind = track->description().type() == "audio" ? TrackKind::Audio : TrackKind::Video;
		auto media = std::make_shared<MediaTrack>(kind, peerId_ + "-" + track->mid());

		std::weak_ptr<MediaTrack> weakMedia = media;
		track->onMessage([weakMedia](rtc::message_variant data) {
			auto target = weakMedia.lock();
			if (!target || !std::holds_alternative<rtc::binary>(data)) {
				return;
			}
			const auto &packet = std::get<rtc::binary>(data);
			target->deliver(reinterpret_cast<const uint8_t *>(packet.data()), packet.size());
		});
		track->onClosed([weakMedia]() {
			if (auto target = weakMedia.lock()) {
				target->stop();
			}
		});

		{
			std::lock_guard<std::mutex> lock(sendersMutex_);
			remoteTracks_.push_back(track);
			remoteMedia_.push_back(media);
		}

		TransportEvent event;
		event.type = TransportEventType::RemoteTrack;
		event.track = media;
		emit(event);
	});
}

void RtcTransport::clearCallbacks()
{
	if (!pc_) {
		return;
	}

	try {
		pc_->onLocalCandidate(nullptr);
		pc_->onGatheringStateChange(nullptr);
		pc_->onStateChange(nullptr);
		pc_->onIceStateChange(nullptr);
		pc_->onTrack(nullptr);
	} catch (const std::exception &e) {
		logDebug("Clearing callbacks for %s: %s", peerId_.c_str(), e.what());
	}
}

SessionDescription RtcTransport::generateLocal(bool offer, bool iceRestart)
{
	const auto type = offer ? rtc::Description::Type::Offer : rtc::Description::Type::Answer;

	if (iceRestart) {
		// Fresh credentials force new ICE checks on both sides.
		rtc::LocalDescriptionInit init;
		init.iceUfrag = randomIceToken(8);
		init.icePwd = randomIceToken(24);
		pc_->setLocalDescription(type, init);
	} else {
		pc_->setLocalDescription(type);
	}

	auto local = pc_->localDescription();
	if (!local) {
		throw std::runtime_error("Engine produced no local description");
	}
	return {local->typeString(), std::string(*local)};
}

SessionDescription RtcTransport::createOffer(bool iceRestart)
{
	if (closed_) {
		throw std::runtime_error("Transport is closed");
	}
	return generateLocal(true, iceRestart);
}

SessionDescription RtcTransport::createAnswer()
{
	if (closed_) {
		throw std::runtime_error("Transport is closed");
	}
	return generateLocal(false, false);
}

void RtcTransport::setLocalDescription(const SessionDescription &description)
{
	// The engine applies its own description when generating it.
	logDebug("Local %s applied for %s", description.type.c_str(), peerId_.c_str());
}

void RtcTransport::setRemoteDescription(const SessionDescription &description)
{
	if (closed_) {
		throw std::runtime_error("Transport is closed");
	}
	pc_->setRemoteDescription(rtc::Description(description.sdp, description.type));
}

void RtcTransport::addIceCandidate(const IceCandidate &candidate)
{
	if (closed_) {
		throw std::runtime_error("Transport is closed");
	}
	pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.mid));
}

SessionDescription RtcTransport::localDescription() const
{
	auto local = pc_->localDescription();
	if (!local) {
		throw std::runtime_error("No local description");
	}
	return {local->typeString(), std::string(*local)};
}

bool RtcTransport::hasRemoteDescription() const
{
	return !closed_ && pc_->remoteDescription().has_value();
}

GatheringState RtcTransport::gatheringState() const
{
	return toGatheringState(pc_->gatheringState());
}

std::shared_ptr<rtc::Track> RtcTransport::createSendTrack(TrackKind kind)
{
	if (kind == TrackKind::Video) {
		rtc::Description::Video videoDesc("video", rtc::Description::Direction::SendOnly);
		videoDesc.addH264Codec(96);
		videoDesc.addSSRC(videoSsrc_, "video-stream");
		return pc_->addTrack(videoDesc);
	}

	rtc::Description::Audio audioDesc("audio", rtc::Description::Direction::SendOnly);
	audioDesc.addOpusCodec(111);
	audioDesc.addSSRC(audioSsrc_, "audio-stream");
	return pc_->addTrack(audioDesc);
}

bool RtcTransport::hasSender(TrackKind kind) const
{
	std::lock_guard<std::mutex> lock(sendersMutex_);
	return senders_.count(kind) > 0;
}

void RtcTransport::addTrack(const std::shared_ptr<MediaTrack> &track)
{
	if (!track) {
		return;
	}
	if (closed_) {
		throw std::runtime_error("Transport is closed");
	}

	std::lock_guard<std::mutex> lock(sendersMutex_);
	if (senders_.count(track->kind())) {
		throw std::runtime_error(std::string("A ") + trackKindToString(track->kind()) + " sender already exists");
	}

	Sender sender;
	sender.rtcTrack = createSendTrack(track->kind());
	attachSourceLocked(sender, track);
	senders_[track->kind()] = std::move(sender);
	logInfo("Added %s sender for %s", trackKindToString(track->kind()), peerId_.c_str());
}

void RtcTransport::replaceTrack(TrackKind kind, const std::shared_ptr<MediaTrack> &track)
{
	std::lock_guard<std::mutex> lock(sendersMutex_);
	auto it = senders_.find(kind);
	if (it == senders_.end()) {
		throw std::runtime_error(std::string("No ") + trackKindToString(kind) + " sender to replace");
	}

	detachSourceLocked(it->second);
	if (track) {
		attachSourceLocked(it->second, track);
	}
	logDebug("Replaced %s source for %s", trackKindToString(kind), peerId_.c_str());
}

void RtcTransport::attachSourceLocked(Sender &sender, const std::shared_ptr<MediaTrack> &track)
{
	std::weak_ptr<rtc::Track> weakRtc = sender.rtcTrack;
	const std::string peerId = peerId_;
	sender.source = track;
	sender.sinkId = track->addSink([weakRtc, peerId](const uint8_t *data, size_t size) {
		auto rtcTrack = weakRtc.lock();
		if (!rtcTrack || !rtcTrack->isOpen()) {
			return;
		}
		try {
			rtcTrack->send(reinterpret_cast<const rtc::byte *>(data), size);
		} catch (const std::exception &e) {
			logDebug("RTP send to %s failed: %s", peerId.c_str(), e.what());
		}
	});
}

void RtcTransport::detachSourceLocked(Sender &sender)
{
	if (sender.source) {
		sender.source->removeSink(sender.sinkId);
	}
	sender.source.reset();
	sender.sinkId = 0;
}

void RtcTransport::close()
{
	if (closed_.exchange(true)) {
		return;
	}

	clearCallbacks();

	std::vector<std::shared_ptr<rtc::Track>> remoteTracks;
	std::vector<std::shared_ptr<MediaTrack>> remoteMedia;
	{
		std::lock_guard<std::mutex> lock(sendersMutex_);
		for (auto &pair : senders_) {
			detachSourceLocked(pair.second);
		}
		senders_.clear();
		remoteTracks.swap(remoteTracks_);
		remoteMedia.swap(remoteMedia_);
	}

	for (const auto &track : remoteTracks) {
		try {
			track->onMessage(nullptr);
			track->onClosed(nullptr);
		} catch (const std::exception &e) {
			logDebug("Clearing remote track callbacks for %s: %s", peerId_.c_str(), e.what());
		}
	}

	for (const auto &media : remoteMedia) {
		media->stop();
	}

	try {
		pc_->close();
	} catch (const std::exception &e) {
		logWarning("Error closing peer connection %s: %s", peerId_.c_str(), e.what());
	}
	logDebug("Closed transport for %s", peerId_.c_str());
}

RtcTransportFactory::RtcTransportFactory(RtcTransportConfig config) : config_(std::move(config)) {}

std::unique_ptr<PeerTransport> RtcTransportFactory::create(const std::string &peerId, TransportEventSink sink)
{
	return std::unique_ptr<PeerTransport>(new RtcTransport(peerId, config_, std::move(sink)));
}

} // namespace roomcast
