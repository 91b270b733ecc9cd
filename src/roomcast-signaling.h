/*
 * Roomcast
 * Signaling relay link
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "roomcast-signaling-protocol.h"

namespace rtc
{
class WebSocket;
}

namespace roomcast
{

using OnSignalMessageCallback = std::function<void(const SignalMessage &message)>;
using OnSignalingClosedCallback = std::function<void()>;

// Addressed messaging channel to the room relay.
class SignalingLink
{
public:
	virtual ~SignalingLink() = default;

	// Blocks until the link is open or the attempt fails.
	virtual bool connect(const std::string &url) = 0;
	virtual void disconnect() = 0;
	virtual bool isConnected() const = 0;

	// Queues an envelope for delivery. Returns false when the link is down.
	virtual bool send(const SignalMessage &message) = 0;

	virtual void setOnMessage(OnSignalMessageCallback callback) = 0;
	// Fired when an open link drops without disconnect() being called.
	virtual void setOnClosed(OnSignalingClosedCallback callback) = 0;
};

// SignalingLink over a WebSocket carrying one JSON envelope per text frame.
class WebSocketSignaling : public SignalingLink
{
public:
	WebSocketSignaling();
	~WebSocketSignaling() override;

	bool connect(const std::string &url) override;
	void disconnect() override;
	bool isConnected() const override;
	bool send(const SignalMessage &message) override;
	void setOnMessage(OnSignalMessageCallback callback) override;
	void setOnClosed(OnSignalingClosedCallback callback) override;

	void setConnectTimeoutMs(int timeoutMs);

private:
	void sendThreadFunc();
	void processMessage(const std::string &message);

	std::string url_;
	std::shared_ptr<rtc::WebSocket> ws_;
	std::atomic<bool> connected_{false};
	std::atomic<bool> shouldRun_{false};
	std::atomic<bool> failed_{false};
	int connectTimeoutMs_ = 5000;

	std::thread sendThread_;
	std::mutex sendMutex_;
	std::condition_variable sendCv_;
	std::queue<std::string> sendQueue_;

	std::mutex openMutex_;
	std::condition_variable openCv_;

	std::mutex callbackMutex_;
	OnSignalMessageCallback onMessage_;
	OnSignalingClosedCallback onClosed_;
};

} // namespace roomcast
