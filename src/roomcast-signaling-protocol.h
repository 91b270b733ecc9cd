/*
 * Roomcast
 * Signaling envelope encoding and decoding
 */

#pragma once

#include <string>
#include <vector>

#include "roomcast-common.h"

namespace roomcast
{

enum class SignalKind {
	Unknown,
	JoinRoom,
	RoomUsers,
	UserJoined,
	UserLeft,
	Offer,
	Answer,
	IceCandidate,
	PeerConnectionState,
	LeaveRoom,
	StreamType,
	Error
};

struct SignalMessage {
	SignalKind kind = SignalKind::Unknown;
	std::string type; // event name as seen on the wire
	std::string roomId;
	std::string senderId; // stamped by the relay on delivery
	std::string targetUserId;

	// join-room, user-joined, user-left, peer-connection-state (observer)
	std::string userId;
	Role userRole = Role::Viewer;

	std::vector<RoomMember> users;
	SessionDescription description;
	IceCandidate candidate;
	std::string connectionState;
	std::string iceConnectionState;
	StreamKind streamKind = StreamKind::Camera;
	std::string message;

	// Identity of the remote participant this envelope concerns.
	std::string peerId() const;
};

const char *signalKindToType(SignalKind kind);

bool parseSignalingMessage(const std::string &raw, SignalMessage &parsed, std::string *error = nullptr);
std::string serializeSignalingMessage(const SignalMessage &message);

// Outbound envelope constructors
SignalMessage makeJoinRoom(const std::string &roomId, const std::string &userId, Role role);
SignalMessage makeLeaveRoom(const std::string &roomId);
SignalMessage makeOffer(const std::string &roomId, const std::string &targetUserId, const std::string &sdp);
SignalMessage makeAnswer(const std::string &roomId, const std::string &targetUserId, const std::string &sdp);
SignalMessage makeIceCandidate(const std::string &roomId, const std::string &targetUserId,
                               const IceCandidate &candidate);
SignalMessage makePeerConnectionState(const std::string &roomId, const std::string &observerId,
                                      const std::string &targetUserId, ConnectionState state,
                                      IceConnectionState iceState);
SignalMessage makeStreamType(const std::string &roomId, StreamKind kind);

} // namespace roomcast
