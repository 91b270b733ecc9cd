/*
 * Roomcast
 * Local media model and capture stream lifecycle
 */

#include "roomcast-media.h"

#include <utility>

#include "roomcast-utils.h"

namespace roomcast
{

MediaTrack::MediaTrack(TrackKind kind, std::string id) : kind_(kind), id_(std::move(id)) {}

MediaTrack::~MediaTrack()
{
	stop();
}

void MediaTrack::stop()
{
	if (!live_.exchange(false)) {
		return;
	}

	std::function<void()> cb;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		cb = std::move(onStopped_);
		onStopped_ = nullptr;
	}
	if (cb) {
		cb();
	}
	logDebug("Stopped %s track %s", trackKindToString(kind_), id_.c_str());
}

void MediaTrack::setOnStopped(std::function<void()> callback)
{
	std::lock_guard<std::mutex> lock(mutex_);
	onStopped_ = std::move(callback);
}

int MediaTrack::addSink(PacketSink sink)
{
	std::lock_guard<std::mutex> lock(mutex_);
	const int sinkId = nextSinkId_++;
	sinks_[sinkId] = std::move(sink);
	return sinkId;
}

void MediaTrack::removeSink(int sinkId)
{
	std::lock_guard<std::mutex> lock(mutex_);
	sinks_.erase(sinkId);
}

size_t MediaTrack::sinkCount() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return sinks_.size();
}

void MediaTrack::deliver(const uint8_t *data, size_t size)
{
	if (!live_ || !data || size == 0) {
		return;
	}

	std::vector<PacketSink> sinks;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		sinks.reserve(sinks_.size());
		for (const auto &pair : sinks_) {
			sinks.push_back(pair.second);
		}
	}

	for (const auto &sink : sinks) {
		sink(data, size);
	}
}

MediaStream::MediaStream(StreamKind kind, std::vector<std::shared_ptr<MediaTrack>> tracks)
    : id_(generateUUID()), kind_(kind), tracks_(std::move(tracks))
{
}

std::shared_ptr<MediaTrack> MediaStream::track(TrackKind kind) const
{
	for (const auto &track : tracks_) {
		if (track && track->kind() == kind) {
			return track;
		}
	}
	return nullptr;
}

void MediaStream::stop()
{
	for (const auto &track : tracks_) {
		if (track) {
			track->stop();
		}
	}
}

LocalMediaController::LocalMediaController(CaptureDevice *device) : device_(device) {}

LocalMediaController::~LocalMediaController()
{
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		onStreamChanged_ = nullptr;
	}
	std::lock_guard<std::mutex> lock(mutex_);
	if (stream_) {
		stream_->stop();
		stream_.reset();
	}
}

std::shared_ptr<MediaStream> LocalMediaController::openLocked(StreamKind kind)
{
	if (!device_) {
		throw RoomcastError(ErrorCode::CaptureUnavailable, "No capture device is available");
	}

	std::shared_ptr<MediaStream> stream;
	try {
		stream = device_->open(kind);
	} catch (const RoomcastError &) {
		throw;
	} catch (const std::exception &e) {
		throw RoomcastError(ErrorCode::CaptureUnavailable, e.what());
	}
	if (!stream || stream->tracks().empty()) {
		throw RoomcastError(ErrorCode::CaptureUnavailable,
		                    std::string("Capture returned no tracks for ") + streamKindToString(kind));
	}
	return stream;
}

std::shared_ptr<MediaStream> LocalMediaController::acquire(StreamKind kind)
{
	std::shared_ptr<MediaStream> acquired;
	bool released = false;
	try {
		std::lock_guard<std::mutex> lock(mutex_);

		// The previous capture is released before opening the next one so
		// exclusive devices can be reopened.
		if (stream_) {
			stream_->stop();
			stream_.reset();
			released = true;
		}

		acquired = openLocked(kind);
		stream_ = acquired;
	} catch (const RoomcastError &e) {
		logError("Failed to acquire %s stream: %s", streamKindToString(kind), e.what());
		if (released) {
			notifyChanged(nullptr);
		}
		throw;
	}

	logInfo("Acquired %s stream %s with %zu track(s)", streamKindToString(kind), acquired->id().c_str(),
	        acquired->tracks().size());
	notifyChanged(acquired);
	return acquired;
}

void LocalMediaController::release()
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (!stream_) {
			return;
		}
		stream_->stop();
		stream_.reset();
	}

	logInfo("Released local stream");
	notifyChanged(nullptr);
}

std::shared_ptr<MediaStream> LocalMediaController::switchTo(StreamKind kind)
{
	logInfo("Switching local stream to %s", streamKindToString(kind));
	return acquire(kind);
}

void LocalMediaController::adopt(std::shared_ptr<MediaStream> stream)
{
	if (!stream) {
		release();
		return;
	}

	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (stream_ == stream) {
			return;
		}
		if (stream_) {
			stream_->stop();
		}
		stream_ = stream;
	}

	logInfo("Adopted %s stream %s", streamKindToString(stream->kind()), stream->id().c_str());
	notifyChanged(stream);
}

std::shared_ptr<MediaStream> LocalMediaController::current() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return stream_;
}

bool LocalMediaController::hasStream() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return stream_ != nullptr;
}

void LocalMediaController::setOnStreamChanged(OnLocalStreamChangedCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onStreamChanged_ = std::move(callback);
}

void LocalMediaController::notifyChanged(const std::shared_ptr<MediaStream> &stream)
{
	OnLocalStreamChangedCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onStreamChanged_;
	}
	if (cb) {
		cb(stream);
	}
}

} // namespace roomcast
