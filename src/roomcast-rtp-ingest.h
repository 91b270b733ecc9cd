/*
 * Roomcast
 * Capture device fed by RTP over local UDP ports
 *
 * An external encoder (ffmpeg, gstreamer, a camera pipeline) pushes H264 and
 * Opus RTP to the configured ports; every datagram is delivered unchanged to
 * the matching MediaTrack.
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "roomcast-media.h"

namespace roomcast
{

struct RtpIngestPorts {
	int video = 0;
	int audio = 0;
};

struct RtpIngestConfig {
	std::string bindAddress = DEFAULT_INGEST_BIND_ADDRESS;
	RtpIngestPorts camera;
	RtpIngestPorts screen;
};

RtpIngestConfig ingestConfigFromSettings(const OrchestratorSettings &settings);

class RtpIngestSession;

class RtpIngestDevice : public CaptureDevice
{
public:
	explicit RtpIngestDevice(RtpIngestConfig config);
	~RtpIngestDevice() override;

	std::shared_ptr<MediaStream> open(StreamKind kind) override;

private:
	RtpIngestConfig config_;
	std::mutex mutex_;
	std::vector<std::shared_ptr<RtpIngestSession>> sessions_;
};

// Receive loop for one stream's sockets. Stops once every track is stopped.
class RtpIngestSession : public std::enable_shared_from_this<RtpIngestSession>
{
public:
	RtpIngestSession() = default;
	~RtpIngestSession();

	void addSocket(int fd, const std::shared_ptr<MediaTrack> &track);
	void start();
	void stop();
	bool isRunning() const { return running_; }

private:
	void receiveLoop();
	void closeSockets();

	std::mutex mutex_;
	std::map<int, std::weak_ptr<MediaTrack>> sockets_;
	std::atomic<bool> running_{false};
	std::thread thread_;
};

} // namespace roomcast
