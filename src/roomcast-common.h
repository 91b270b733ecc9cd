/*
 * Roomcast
 * Common types, constants and error codes
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace roomcast
{

// Defaults
constexpr int DEFAULT_ICE_GATHERING_TIMEOUT_MS = 5000;
constexpr int DEFAULT_MAX_RETRY_ATTEMPTS = 5;
constexpr int DEFAULT_RETRY_BASE_DELAY_MS = 1000;
constexpr const char *DEFAULT_SIGNALING_URL = "ws://localhost:3001";
constexpr const char *DEFAULT_INGEST_BIND_ADDRESS = "127.0.0.1";

const std::vector<std::string> DEFAULT_STUN_SERVERS = {"stun:stun.l.google.com:19302",
                                                       "stun:stun1.l.google.com:19302"};

enum class Role { Broadcaster, Viewer };

enum class StreamKind { Camera, Screen };

enum class TrackKind { Audio, Video };

enum class ConnectionState { New, Connecting, Connected, Disconnected, Failed, Closed };

enum class IceConnectionState { New, Checking, Connected, Completed, Disconnected, Failed, Closed };

enum class GatheringState { New, InProgress, Complete };

enum class ErrorCode { SignalingUnavailable, AlreadyStarted, ShutDown, CaptureUnavailable, InvalidSettings };

class RoomcastError : public std::runtime_error
{
public:
	RoomcastError(ErrorCode code, const std::string &message) : std::runtime_error(message), code_(code) {}

	ErrorCode code() const { return code_; }

private:
	ErrorCode code_;
};

struct SessionDescription {
	std::string type; // "offer" or "answer"
	std::string sdp;
};

struct IceCandidate {
	std::string candidate;
	std::string mid;
};

struct IceServer {
	std::string urls;
	std::string username;
	std::string credential;
};

struct RoomMember {
	std::string userId;
	Role role = Role::Viewer;
};

struct OrchestratorSettings {
	std::string signalingUrl = DEFAULT_SIGNALING_URL;
	std::string roomId;
	std::string userId;
	Role role = Role::Viewer;

	int iceGatheringTimeoutMs = DEFAULT_ICE_GATHERING_TIMEOUT_MS;
	int maxRetryAttempts = DEFAULT_MAX_RETRY_ATTEMPTS;
	int retryBaseDelayMs = DEFAULT_RETRY_BASE_DELAY_MS;
	bool enableRecovery = true;
	bool verboseLogging = false;

	std::vector<IceServer> iceServers;
	bool forceTurn = false;

	// RTP ingest ports for local capture, 0 disables the track.
	std::string ingestBindAddress = DEFAULT_INGEST_BIND_ADDRESS;
	int cameraVideoPort = 0;
	int cameraAudioPort = 0;
	int screenVideoPort = 0;
	int screenAudioPort = 0;
};

} // namespace roomcast
