/*
 * Roomcast
 * Local media model and capture stream lifecycle
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "roomcast-common.h"

namespace roomcast
{

// A single audio or video track. Producers push RTP packets through
// deliver(); transports subscribe as sinks to forward them to peers.
class MediaTrack
{
public:
	using PacketSink = std::function<void(const uint8_t *data, size_t size)>;

	MediaTrack(TrackKind kind, std::string id);
	~MediaTrack();

	TrackKind kind() const { return kind_; }
	const std::string &id() const { return id_; }

	bool isLive() const { return live_; }
	void stop();
	void setOnStopped(std::function<void()> callback);

	int addSink(PacketSink sink);
	void removeSink(int sinkId);
	size_t sinkCount() const;

	void deliver(const uint8_t *data, size_t size);

private:
	const TrackKind kind_;
	const std::string id_;
	std::atomic<bool> live_{true};

	mutable std::mutex mutex_;
	std::map<int, PacketSink> sinks_;
	int nextSinkId_ = 1;
	std::function<void()> onStopped_;
};

class MediaStream
{
public:
	MediaStream(StreamKind kind, std::vector<std::shared_ptr<MediaTrack>> tracks);

	const std::string &id() const { return id_; }
	StreamKind kind() const { return kind_; }
	const std::vector<std::shared_ptr<MediaTrack>> &tracks() const { return tracks_; }
	std::shared_ptr<MediaTrack> track(TrackKind kind) const;

	void stop();

private:
	std::string id_;
	StreamKind kind_;
	std::vector<std::shared_ptr<MediaTrack>> tracks_;
};

// Platform capture capability. open() throws RoomcastError(CaptureUnavailable)
// when the requested kind is denied or missing.
class CaptureDevice
{
public:
	virtual ~CaptureDevice() = default;
	virtual std::shared_ptr<MediaStream> open(StreamKind kind) = 0;
};

using OnLocalStreamChangedCallback = std::function<void(const std::shared_ptr<MediaStream> &stream)>;

class LocalMediaController
{
public:
	explicit LocalMediaController(CaptureDevice *device);
	~LocalMediaController();

	std::shared_ptr<MediaStream> acquire(StreamKind kind);
	void release();
	std::shared_ptr<MediaStream> switchTo(StreamKind kind);
	void adopt(std::shared_ptr<MediaStream> stream);

	std::shared_ptr<MediaStream> current() const;
	bool hasStream() const;

	// Invoked once per completed stream change, outside the controller lock.
	void setOnStreamChanged(OnLocalStreamChangedCallback callback);

private:
	void notifyChanged(const std::shared_ptr<MediaStream> &stream);
	std::shared_ptr<MediaStream> openLocked(StreamKind kind);

	CaptureDevice *device_;
	mutable std::mutex mutex_;
	std::shared_ptr<MediaStream> stream_;

	std::mutex callbackMutex_;
	OnLocalStreamChangedCallback onStreamChanged_;
};

} // namespace roomcast
