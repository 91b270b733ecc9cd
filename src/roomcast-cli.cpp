/*
 * Roomcast
 * Command-line client: joins a room as broadcaster or viewer
 *
 * Usage: roomcast-cli <settings.json> [camera|screen]
 *
 * A broadcaster publishes RTP received on the configured ingest ports. A
 * viewer logs the remote tracks it receives and counts their packets.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "roomcast-orchestrator.h"
#include "roomcast-rtc-transport.h"
#include "roomcast-rtp-ingest.h"
#include "roomcast-settings.h"
#include "roomcast-signaling.h"
#include "roomcast-utils.h"

using namespace roomcast;

namespace
{

std::atomic<bool> gRunning{true};

void handleSignal(int)
{
	gRunning = false;
}

void printUsage(const char *argv0)
{
	std::fprintf(stderr, "Usage: %s <settings.json> [camera|screen]\n", argv0);
}

} // namespace

int main(int argc, char *argv[])
{
	if (argc < 2 || argc > 3) {
		printUsage(argv[0]);
		return 2;
	}

	StreamKind kind = StreamKind::Camera;
	if (argc == 3 && !parseStreamKind(argv[2], kind)) {
		printUsage(argv[0]);
		return 2;
	}

	OrchestratorSettings settings;
	try {
		settings = loadSettingsFile(argv[1]);
	} catch (const RoomcastError &e) {
		logError("%s", e.what());
		return 1;
	}
	setVerboseLogging(settings.verboseLogging);

	std::signal(SIGINT, handleSignal);
	std::signal(SIGTERM, handleSignal);

	RtcTransportConfig rtcConfig;
	rtcConfig.iceServers = settings.iceServers;
	rtcConfig.forceTurn = settings.forceTurn;

	WebSocketSignaling signaling;
	RtcTransportFactory transports(rtcConfig);
	RtpIngestDevice ingest(ingestConfigFromSettings(settings));
	LocalMediaController media(&ingest);
	PeerOrchestrator orchestrator(signaling, transports, media, settings);

	std::mutex countersMutex;
	std::map<std::string, std::shared_ptr<std::atomic<uint64_t>>> packetCounters;

	orchestrator.setOnUserJoined([](const RoomMember &member) {
		logInfo("%s %s is in the room", roleToString(member.role), member.userId.c_str());
	});
	orchestrator.setOnUserLeft([](const std::string &peerId) { logInfo("%s left the room", peerId.c_str()); });
	orchestrator.setOnPeerStateChanged([](const std::string &peerId, ConnectionState state) {
		logInfo("Connection to %s is %s", peerId.c_str(), connectionStateToString(state));
	});
	orchestrator.setOnSignalingLost([]() { logWarning("Signaling relay is gone; press Ctrl+C to exit"); });
	orchestrator.setOnRemoteTrack([&](const std::string &peerId, const std::shared_ptr<MediaTrack> &track) {
		auto counter = std::make_shared<std::atomic<uint64_t>>(0);
		{
			std::lock_guard<std::mutex> lock(countersMutex);
			packetCounters[peerId + "/" + track->id()] = counter;
		}
		track->addSink([counter](const uint8_t *, size_t) { (*counter)++; });
	});

	if (settings.role == Role::Broadcaster) {
		try {
			orchestrator.startLocalStream(kind);
		} catch (const RoomcastError &e) {
			logError("Cannot start %s capture: %s", streamKindToString(kind), e.what());
			return 1;
		}
	}

	try {
		orchestrator.start();
	} catch (const RoomcastError &e) {
		logError("Failed to join room: %s", e.what());
		return 1;
	}

	auto lastReport = std::chrono::steady_clock::now();
	while (gRunning) {
		std::this_thread::sleep_for(std::chrono::milliseconds(200));

		const auto now = std::chrono::steady_clock::now();
		if (now - lastReport < std::chrono::seconds(10)) {
			continue;
		}
		lastReport = now;

		for (const auto &peerId : orchestrator.peerIds()) {
			PeerSnapshot snapshot;
			if (orchestrator.peerSnapshot(peerId, snapshot)) {
				logInfo("Peer %s: %s, ICE %s, retries %d%s", peerId.c_str(),
				        connectionStateToString(snapshot.state), iceConnectionStateToString(snapshot.iceState),
				        snapshot.retryCount, snapshot.permanentlyFailed ? " (failed)" : "");
			}
		}

		std::lock_guard<std::mutex> lock(countersMutex);
		for (const auto &pair : packetCounters) {
			logInfo("Track %s: %llu packets", pair.first.c_str(),
			        static_cast<unsigned long long>(pair.second->load()));
		}
	}

	orchestrator.shutdown();
	return 0;
}
