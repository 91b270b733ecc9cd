/*
 * Roomcast
 * WebSocket signaling link implementation
 *
 * Uses libdatachannel's WebSocket client. Outbound envelopes are queued and
 * written by a dedicated send thread so callers never block on the socket.
 */

#include "roomcast-signaling.h"

#include <rtc/rtc.hpp>

#include <chrono>

#include "roomcast-utils.h"

namespace roomcast
{

WebSocketSignaling::WebSocketSignaling() = default;

WebSocketSignaling::~WebSocketSignaling()
{
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		onMessage_ = nullptr;
		onClosed_ = nullptr;
	}
	disconnect();
}

void WebSocketSignaling::setConnectTimeoutMs(int timeoutMs)
{
	connectTimeoutMs_ = timeoutMs;
}

bool WebSocketSignaling::connect(const std::string &url)
{
	if (connected_) {
		logWarning("Already connected to signaling relay");
		return true;
	}

	url_ = url;
	failed_ = false;
	shouldRun_ = true;
	logInfo("Connecting to signaling relay: %s", url_.c_str());

	try {
		ws_ = std::make_shared<rtc::WebSocket>();

		ws_->onOpen([this]() {
			logInfo("WebSocket connected to signaling relay");
			{
				std::lock_guard<std::mutex> lock(openMutex_);
				connected_ = true;
			}
			openCv_.notify_all();
		});

		ws_->onClosed([this]() {
			const bool wasConnected = connected_.exchange(false);
			{
				std::lock_guard<std::mutex> lock(openMutex_);
				failed_ = true;
			}
			openCv_.notify_all();
			sendCv_.notify_all();

			if (!wasConnected || !shouldRun_) {
				return;
			}

			logWarning("Signaling relay connection lost");
			OnSignalingClosedCallback cb;
			{
				std::lock_guard<std::mutex> lock(callbackMutex_);
				cb = onClosed_;
			}
			if (cb) {
				cb();
			}
		});

		ws_->onError([this](const std::string &error) {
			logError("WebSocket error: %s", error.c_str());
			{
				std::lock_guard<std::mutex> lock(openMutex_);
				failed_ = true;
			}
			openCv_.notify_all();
		});

		ws_->onMessage([this](auto data) {
			if (std::holds_alternative<std::string>(data)) {
				processMessage(std::get<std::string>(data));
			}
		});

		ws_->open(url_);
	} catch (const std::exception &e) {
		logError("Failed to open signaling relay %s: %s", url_.c_str(), e.what());
		shouldRun_ = false;
		ws_.reset();
		return false;
	}

	{
		std::unique_lock<std::mutex> lock(openMutex_);
		openCv_.wait_for(lock, std::chrono::milliseconds(connectTimeoutMs_),
		                 [this] { return connected_.load() || failed_.load(); });
	}

	if (!connected_) {
		logError("Could not reach signaling relay %s", url_.c_str());
		shouldRun_ = false;
		try {
			ws_->close();
		} catch (const std::exception &e) {
			logDebug("Closing failed WebSocket: %s", e.what());
		}
		ws_.reset();
		return false;
	}

	sendThread_ = std::thread(&WebSocketSignaling::sendThreadFunc, this);
	return true;
}

void WebSocketSignaling::disconnect()
{
	shouldRun_ = false;

	{
		std::lock_guard<std::mutex> lock(sendMutex_);
		sendCv_.notify_all();
	}

	if (sendThread_.joinable()) {
		sendThread_.join();
	}

	if (ws_) {
		try {
			ws_->close();
		} catch (const std::exception &e) {
			logWarning("Error closing signaling WebSocket: %s", e.what());
		}
		ws_.reset();
	}

	connected_ = false;

	std::lock_guard<std::mutex> lock(sendMutex_);
	std::queue<std::string>().swap(sendQueue_);
}

bool WebSocketSignaling::isConnected() const
{
	return connected_;
}

void WebSocketSignaling::sendThreadFunc()
{
	// Drain the send queue until disconnect() or the socket closes.
	while (shouldRun_ && connected_) {
		std::unique_lock<std::mutex> lock(sendMutex_);
		sendCv_.wait_for(lock, std::chrono::milliseconds(100),
		                 [this] { return !sendQueue_.empty() || !shouldRun_ || !connected_; });

		while (!sendQueue_.empty() && connected_) {
			std::string msg = std::move(sendQueue_.front());
			sendQueue_.pop();
			lock.unlock();

			try {
				ws_->send(msg);
				logDebug("Sent: %s", msg.c_str());
			} catch (const std::exception &e) {
				logError("Failed to send message: %s", e.what());
			}

			lock.lock();
		}
	}
}

void WebSocketSignaling::processMessage(const std::string &message)
{
	logDebug("Received: %s", message.c_str());

	SignalMessage parsed;
	std::string error;
	if (!parseSignalingMessage(message, parsed, &error)) {
		logError("Failed to parse message: %s", error.c_str());
		return;
	}

	OnSignalMessageCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onMessage_;
	}
	if (cb) {
		cb(parsed);
	}
}

bool WebSocketSignaling::send(const SignalMessage &message)
{
	if (!connected_) {
		logWarning("Cannot send %s - signaling link is down", signalKindToType(message.kind));
		return false;
	}

	std::lock_guard<std::mutex> lock(sendMutex_);
	sendQueue_.push(serializeSignalingMessage(message));
	sendCv_.notify_one();
	return true;
}

void WebSocketSignaling::setOnMessage(OnSignalMessageCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onMessage_ = callback;
}

void WebSocketSignaling::setOnClosed(OnSignalingClosedCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onClosed_ = callback;
}

} // namespace roomcast
