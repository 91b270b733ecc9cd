/*
 * Roomcast
 * Capture device fed by RTP over local UDP ports
 */

#include "roomcast-rtp-ingest.h"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "roomcast-utils.h"

namespace roomcast
{

namespace
{

constexpr int INGEST_POLL_INTERVAL_MS = 100;
constexpr size_t MAX_RTP_PACKET_SIZE = 2048;

int openUdpSocket(const std::string &bindAddress, int port)
{
	int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
	if (fd < 0) {
		throw RoomcastError(ErrorCode::CaptureUnavailable,
		                    std::string("Failed to create UDP socket: ") + std::strerror(errno));
	}

	int reuse = 1;
	::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

	sockaddr_in addr;
	std::memset(&addr, 0, sizeof(addr));
	addr.sin_family = AF_INET;
	addr.sin_port = htons(static_cast<uint16_t>(port));
	if (::inet_pton(AF_INET, bindAddress.c_str(), &addr.sin_addr) != 1) {
		::close(fd);
		throw RoomcastError(ErrorCode::CaptureUnavailable, "Invalid ingest bind address " + bindAddress);
	}

	if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
		const int err = errno;
		::close(fd);
		throw RoomcastError(ErrorCode::CaptureUnavailable, "Cannot bind RTP ingest port " + std::to_string(port) +
		                                                       ": " + std::strerror(err));
	}

	return fd;
}

} // namespace

RtpIngestConfig ingestConfigFromSettings(const OrchestratorSettings &settings)
{
	RtpIngestConfig config;
	config.bindAddress = settings.ingestBindAddress;
	config.camera.video = settings.cameraVideoPort;
	config.camera.audio = settings.cameraAudioPort;
	config.screen.video = settings.screenVideoPort;
	config.screen.audio = settings.screenAudioPort;
	return config;
}

// ---------------------------------------------------------------------------
// RtpIngestSession
// ---------------------------------------------------------------------------

RtpIngestSession::~RtpIngestSession()
{
	stop();
	closeSockets();
}

void RtpIngestSession::addSocket(int fd, const std::shared_ptr<MediaTrack> &track)
{
	std::lock_guard<std::mutex> lock(mutex_);
	sockets_[fd] = track;
}

void RtpIngestSession::start()
{
	running_ = true;
	// The loop holds a reference so the session outlives the device's copy.
	auto self = shared_from_this();
	thread_ = std::thread([self]() { self->receiveLoop(); });
}

void RtpIngestSession::stop()
{
	running_ = false;
	if (!thread_.joinable()) {
		return;
	}

	if (thread_.get_id() == std::this_thread::get_id()) {
		// Stopped from inside the loop; it exits on its own.
		thread_.detach();
		return;
	}
	thread_.join();
	closeSockets();
}

void RtpIngestSession::closeSockets()
{
	std::lock_guard<std::mutex> lock(mutex_);
	for (const auto &pair : sockets_) {
		::close(pair.first);
	}
	sockets_.clear();
}

void RtpIngestSession::receiveLoop()
{
	std::vector<pollfd> fds;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		for (const auto &pair : sockets_) {
			fds.push_back({pair.first, POLLIN, 0});
		}
	}

	std::vector<uint8_t> buffer(MAX_RTP_PACKET_SIZE);
	while (running_) {
		int ready = ::poll(fds.data(), fds.size(), INGEST_POLL_INTERVAL_MS);
		if (ready < 0) {
			if (errno == EINTR) {
				continue;
			}
			logError("RTP ingest poll failed: %s", std::strerror(errno));
			running_ = false;
			break;
		}
		if (ready == 0) {
			continue;
		}

		for (auto &pfd : fds) {
			if (!(pfd.revents & POLLIN)) {
				continue;
			}

			ssize_t received = ::recv(pfd.fd, buffer.data(), buffer.size(), 0);
			if (received <= 0) {
				continue;
			}

			std::shared_ptr<MediaTrack> track;
			{
				std::lock_guard<std::mutex> lock(mutex_);
				auto it = sockets_.find(pfd.fd);
				if (it != sockets_.end()) {
					track = it->second.lock();
				}
			}
			if (track) {
				track->deliver(buffer.data(), static_cast<size_t>(received));
			}
		}
	}

	logDebug("RTP ingest loop stopped");
}

// ---------------------------------------------------------------------------
// RtpIngestDevice
// ---------------------------------------------------------------------------

RtpIngestDevice::RtpIngestDevice(RtpIngestConfig config) : config_(std::move(config)) {}

RtpIngestDevice::~RtpIngestDevice()
{
	std::lock_guard<std::mutex> lock(mutex_);
	for (const auto &session : sessions_) {
		session->stop();
	}
	sessions_.clear();
}

std::shared_ptr<MediaStream> RtpIngestDevice::open(StreamKind kind)
{
	const RtpIngestPorts &ports = kind == StreamKind::Camera ? config_.camera : config_.screen;
	if (ports.video <= 0 && ports.audio <= 0) {
		throw RoomcastError(ErrorCode::CaptureUnavailable,
		                    std::string("No RTP ingest ports configured for ") + streamKindToString(kind));
	}

	auto session = std::make_shared<RtpIngestSession>();
	std::vector<std::shared_ptr<MediaTrack>> tracks;

	// On a failed bind the session destructor closes what was already opened.
	if (ports.video > 0) {
		auto track = std::make_shared<MediaTrack>(TrackKind::Video, generateUUID());
		session->addSocket(openUdpSocket(config_.bindAddress, ports.video), track);
		tracks.push_back(track);
	}
	if (ports.audio > 0) {
		auto track = std::make_shared<MediaTrack>(TrackKind::Audio, generateUUID());
		session->addSocket(openUdpSocket(config_.bindAddress, ports.audio), track);
		tracks.push_back(track);
	}

	auto live = std::make_shared<std::atomic<int>>(static_cast<int>(tracks.size()));
	std::weak_ptr<RtpIngestSession> weakSession = session;
	for (const auto &track : tracks) {
		track->setOnStopped([weakSession, live]() {
			if (--(*live) > 0) {
				return;
			}
			if (auto s = weakSession.lock()) {
				s->stop();
			}
		});
	}

	session->start();
	{
		std::lock_guard<std::mutex> lock(mutex_);
		sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
		                               [](const std::shared_ptr<RtpIngestSession> &s) { return !s->isRunning(); }),
		                sessions_.end());
		sessions_.push_back(session);
	}

	logInfo("RTP ingest for %s listening on %s (video %d, audio %d)", streamKindToString(kind),
	        config_.bindAddress.c_str(), ports.video, ports.audio);
	return std::make_shared<MediaStream>(kind, tracks);
}

} // namespace roomcast
