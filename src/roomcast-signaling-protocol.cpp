/*
 * Roomcast
 * Signaling envelope encoding and decoding
 */

#include "roomcast-signaling-protocol.h"

#include <initializer_list>

#include "roomcast-utils.h"

namespace roomcast
{

namespace
{

struct KindName {
	SignalKind kind;
	const char *type;
};

const KindName kKindNames[] = {
    {SignalKind::JoinRoom, "join-room"},
    {SignalKind::RoomUsers, "room-users"},
    {SignalKind::UserJoined, "user-joined"},
    {SignalKind::UserLeft, "user-left"},
    {SignalKind::Offer, "offer"},
    {SignalKind::Answer, "answer"},
    {SignalKind::IceCandidate, "ice-candidate"},
    {SignalKind::PeerConnectionState, "peer-connection-state"},
    {SignalKind::LeaveRoom, "leave-room"},
    {SignalKind::StreamType, "stream-type"},
    {SignalKind::Error, "error"},
};

SignalKind kindFromType(const std::string &type)
{
	const std::string lower = asciiLower(type);
	for (const auto &entry : kKindNames) {
		if (lower == entry.type) {
			return entry.kind;
		}
	}
	return SignalKind::Unknown;
}

std::string getAnyString(const JsonParser &json, const std::initializer_list<const char *> &keys)
{
	for (const char *key : keys) {
		if (json.hasKey(key)) {
			return json.getString(key);
		}
	}
	return "";
}

Role roleOrViewer(const std::string &value)
{
	Role role = Role::Viewer;
	parseRole(value, role);
	return role;
}

void parseDescription(const JsonParser &json, const char *field, const char *expectedType,
                      SessionDescription &description)
{
	const std::string raw = json.getRaw(field);
	if (!raw.empty() && raw[0] == '{') {
		JsonParser desc(raw);
		description.type = getAnyString(desc, {"type", "Type"});
		description.sdp = getAnyString(desc, {"sdp"});
	} else {
		description.type = getAnyString(json, {"sdpType"});
		description.sdp = raw.empty() ? getAnyString(json, {"sdp"}) : raw;
	}
	if (description.type.empty()) {
		description.type = expectedType;
	}
}

void parseCandidate(const JsonParser &json, IceCandidate &candidate)
{
	const std::string raw = json.getRaw("candidate");
	if (!raw.empty() && raw[0] == '{') {
		JsonParser candidateJson(raw);
		candidate.candidate = getAnyString(candidateJson, {"candidate"});
		candidate.mid = getAnyString(candidateJson, {"sdpMid", "mid"});
	} else {
		candidate.candidate = raw;
		candidate.mid = getAnyString(json, {"sdpMid", "mid"});
	}
}

void parseUsers(const JsonParser &json, std::vector<RoomMember> &users)
{
	for (const auto &entry : json.getArray("users")) {
		if (entry.empty() || entry[0] != '{') {
			continue;
		}
		JsonParser member(entry);
		RoomMember parsed;
		parsed.userId = getAnyString(member, {"userId", "id"});
		parsed.role = roleOrViewer(getAnyString(member, {"userType", "type"}));
		if (!parsed.userId.empty()) {
			users.push_back(parsed);
		}
	}
}

std::string describe(const SessionDescription &description)
{
	JsonBuilder desc;
	desc.add("type", description.type);
	desc.add("sdp", description.sdp);
	return desc.build();
}

} // namespace

std::string SignalMessage::peerId() const
{
	if (!senderId.empty()) {
		return senderId;
	}
	return userId;
}

const char *signalKindToType(SignalKind kind)
{
	for (const auto &entry : kKindNames) {
		if (entry.kind == kind) {
			return entry.type;
		}
	}
	return "unknown";
}

bool parseSignalingMessage(const std::string &raw, SignalMessage &parsed, std::string *error)
{
	const std::string body = trim(raw);
	if (body.empty() || body[0] != '{') {
		if (error) {
			*error = "envelope is not a JSON object";
		}
		return false;
	}

	JsonParser json(body);
	parsed.type = getAnyString(json, {"type", "event"});
	if (parsed.type.empty()) {
		if (error) {
			*error = "envelope has no type";
		}
		return false;
	}

	parsed.kind = kindFromType(parsed.type);
	parsed.roomId = getAnyString(json, {"roomId"});
	parsed.senderId = getAnyString(json, {"senderId", "from"});
	parsed.targetUserId = getAnyString(json, {"targetUserId", "to"});
	parsed.userId = getAnyString(json, {"userId"});
	parsed.userRole = roleOrViewer(getAnyString(json, {"userType"}));

	switch (parsed.kind) {
	case SignalKind::RoomUsers:
		parseUsers(json, parsed.users);
		break;
	case SignalKind::Offer:
		parseDescription(json, "offer", "offer", parsed.description);
		break;
	case SignalKind::Answer:
		parseDescription(json, "answer", "answer", parsed.description);
		break;
	case SignalKind::IceCandidate:
		parseCandidate(json, parsed.candidate);
		break;
	case SignalKind::PeerConnectionState:
		parsed.connectionState = getAnyString(json, {"connectionState"});
		parsed.iceConnectionState = getAnyString(json, {"iceConnectionState"});
		break;
	case SignalKind::StreamType:
		parseStreamKind(getAnyString(json, {"streamType"}), parsed.streamKind);
		break;
	case SignalKind::Error:
		parsed.message = getAnyString(json, {"message", "error"});
		break;
	default:
		break;
	}

	return true;
}

std::string serializeSignalingMessage(const SignalMessage &message)
{
	JsonBuilder msg;
	msg.add("type", message.type.empty() ? signalKindToType(message.kind) : message.type.c_str());

	switch (message.kind) {
	case SignalKind::JoinRoom:
		msg.add("roomId", message.roomId);
		msg.add("userId", message.userId);
		msg.add("userType", roleToString(message.userRole));
		break;
	case SignalKind::LeaveRoom:
		msg.add("roomId", message.roomId);
		break;
	case SignalKind::Offer:
		msg.addRaw("offer", describe(message.description));
		msg.add("targetUserId", message.targetUserId);
		msg.add("roomId", message.roomId);
		break;
	case SignalKind::Answer:
		msg.addRaw("answer", describe(message.description));
		msg.add("targetUserId", message.targetUserId);
		msg.add("roomId", message.roomId);
		break;
	case SignalKind::IceCandidate: {
		JsonBuilder candidate;
		candidate.add("candidate", message.candidate.candidate);
		candidate.add("sdpMid", message.candidate.mid);
		msg.addRaw("candidate", candidate.build());
		msg.add("targetUserId", message.targetUserId);
		msg.add("roomId", message.roomId);
		break;
	}
	case SignalKind::PeerConnectionState:
		msg.add("userId", message.userId);
		msg.add("targetUserId", message.targetUserId);
		msg.add("roomId", message.roomId);
		msg.add("connectionState", message.connectionState);
		msg.add("iceConnectionState", message.iceConnectionState);
		break;
	case SignalKind::StreamType:
		msg.add("streamType", streamKindToString(message.streamKind));
		msg.add("roomId", message.roomId);
		break;
	case SignalKind::UserJoined:
		msg.add("userId", message.userId);
		msg.add("userType", roleToString(message.userRole));
		break;
	case SignalKind::UserLeft:
		msg.add("userId", message.userId);
		break;
	case SignalKind::Error:
		msg.add("message", message.message);
		break;
	default:
		if (!message.roomId.empty()) {
			msg.add("roomId", message.roomId);
		}
		break;
	}

	if (!message.senderId.empty()) {
		msg.add("senderId", message.senderId);
	}

	return msg.build();
}

SignalMessage makeJoinRoom(const std::string &roomId, const std::string &userId, Role role)
{
	SignalMessage msg;
	msg.kind = SignalKind::JoinRoom;
	msg.roomId = roomId;
	msg.userId = userId;
	msg.userRole = role;
	return msg;
}

SignalMessage makeLeaveRoom(const std::string &roomId)
{
	SignalMessage msg;
	msg.kind = SignalKind::LeaveRoom;
	msg.roomId = roomId;
	return msg;
}

SignalMessage makeOffer(const std::string &roomId, const std::string &targetUserId, const std::string &sdp)
{
	SignalMessage msg;
	msg.kind = SignalKind::Offer;
	msg.roomId = roomId;
	msg.targetUserId = targetUserId;
	msg.description = {"offer", sdp};
	return msg;
}

SignalMessage makeAnswer(const std::string &roomId, const std::string &targetUserId, const std::string &sdp)
{
	SignalMessage msg;
	msg.kind = SignalKind::Answer;
	msg.roomId = roomId;
	msg.targetUserId = targetUserId;
	msg.description = {"answer", sdp};
	return msg;
}

SignalMessage makeIceCandidate(const std::string &roomId, const std::string &targetUserId,
                               const IceCandidate &candidate)
{
	SignalMessage msg;
	msg.kind = SignalKind::IceCandidate;
	msg.roomId = roomId;
	msg.targetUserId = targetUserId;
	msg.candidate = candidate;
	return msg;
}

SignalMessage makePeerConnectionState(const std::string &roomId, const std::string &observerId,
                                      const std::string &targetUserId, ConnectionState state,
                                      IceConnectionState iceState)
{
	SignalMessage msg;
	msg.kind = SignalKind::PeerConnectionState;
	msg.roomId = roomId;
	msg.userId = observerId;
	msg.targetUserId = targetUserId;
	msg.connectionState = connectionStateToString(state);
	msg.iceConnectionState = iceConnectionStateToString(iceState);
	return msg;
}

SignalMessage makeStreamType(const std::string &roomId, StreamKind kind)
{
	SignalMessage msg;
	msg.kind = SignalKind::StreamType;
	msg.roomId = roomId;
	msg.streamKind = kind;
	return msg;
}

} // namespace roomcast
