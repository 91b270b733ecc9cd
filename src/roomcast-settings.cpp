/*
 * Roomcast
 * Settings loading through obs_data
 */

#include "roomcast-settings.h"

#include <cstdlib>

#include "roomcast-utils.h"

namespace roomcast
{

namespace
{

std::string envOr(const char *name, const std::string &fallback)
{
	const char *value = std::getenv(name);
	if (value && *value) {
		return value;
	}
	return fallback;
}

int readNonNegative(obs_data_t *settings, const char *key)
{
	const long long value = obs_data_get_int(settings, key);
	if (value < 0 || value > 0x7FFFFFFF) {
		throw RoomcastError(ErrorCode::InvalidSettings, std::string("Setting '") + key + "' is out of range");
	}
	return static_cast<int>(value);
}

int readPort(obs_data_t *settings, const char *key)
{
	const int port = readNonNegative(settings, key);
	if (port > 65535) {
		throw RoomcastError(ErrorCode::InvalidSettings, std::string("Setting '") + key + "' is not a valid port");
	}
	return port;
}

} // namespace

void roomcastSettingsDefaults(obs_data_t *settings)
{
	obs_data_set_default_string(settings, "signaling_url", DEFAULT_SIGNALING_URL);
	obs_data_set_default_string(settings, "room_id", "");
	obs_data_set_default_string(settings, "user_id", "");
	obs_data_set_default_string(settings, "user_type", "viewer");
	obs_data_set_default_int(settings, "ice_gathering_timeout_ms", DEFAULT_ICE_GATHERING_TIMEOUT_MS);
	obs_data_set_default_int(settings, "max_retry_attempts", DEFAULT_MAX_RETRY_ATTEMPTS);
	obs_data_set_default_int(settings, "retry_base_delay_ms", DEFAULT_RETRY_BASE_DELAY_MS);
	obs_data_set_default_bool(settings, "enable_recovery", true);
	obs_data_set_default_bool(settings, "verbose_logging", false);
	obs_data_set_default_string(settings, "custom_ice_servers", "");
	obs_data_set_default_string(settings, "turn_server_url", "");
	obs_data_set_default_string(settings, "turn_username", "");
	obs_data_set_default_string(settings, "turn_credential", "");
	obs_data_set_default_bool(settings, "force_turn", false);
	obs_data_set_default_string(settings, "ingest_bind_address", DEFAULT_INGEST_BIND_ADDRESS);
	obs_data_set_default_int(settings, "camera_video_port", 0);
	obs_data_set_default_int(settings, "camera_audio_port", 0);
	obs_data_set_default_int(settings, "screen_video_port", 0);
	obs_data_set_default_int(settings, "screen_audio_port", 0);
}

OrchestratorSettings settingsFromData(obs_data_t *settings)
{
	if (!settings) {
		throw RoomcastError(ErrorCode::InvalidSettings, "No settings data");
	}

	roomcastSettingsDefaults(settings);

	OrchestratorSettings result;
	result.signalingUrl = trim(obs_data_get_string(settings, "signaling_url"));
	result.roomId = trim(obs_data_get_string(settings, "room_id"));
	result.userId = trim(obs_data_get_string(settings, "user_id"));

	const std::string userType = obs_data_get_string(settings, "user_type");
	if (!parseRole(userType, result.role)) {
		throw RoomcastError(ErrorCode::InvalidSettings, "Unknown user_type '" + userType + "'");
	}

	if (result.signalingUrl.empty()) {
		throw RoomcastError(ErrorCode::InvalidSettings, "signaling_url must not be empty");
	}
	if (result.roomId.empty()) {
		throw RoomcastError(ErrorCode::InvalidSettings, "room_id must not be empty");
	}
	if (result.userId.empty()) {
		result.userId = std::string(roleToString(result.role)) + "-" + generateSessionId();
		logInfo("No user_id configured, using %s", result.userId.c_str());
	}

	result.iceGatheringTimeoutMs = readNonNegative(settings, "ice_gathering_timeout_ms");
	result.maxRetryAttempts = readNonNegative(settings, "max_retry_attempts");
	result.retryBaseDelayMs = readNonNegative(settings, "retry_base_delay_ms");
	result.enableRecovery = obs_data_get_bool(settings, "enable_recovery");
	result.verboseLogging = obs_data_get_bool(settings, "verbose_logging");
	result.forceTurn = obs_data_get_bool(settings, "force_turn");

	result.iceServers = parseIceServers(obs_data_get_string(settings, "custom_ice_servers"));

	const std::string turnUrl = envOr("ROOMCAST_TURN_SERVER_URL", obs_data_get_string(settings, "turn_server_url"));
	const std::string turnUser = envOr("ROOMCAST_TURN_USERNAME", obs_data_get_string(settings, "turn_username"));
	const std::string turnCredential =
	    envOr("ROOMCAST_TURN_CREDENTIAL", obs_data_get_string(settings, "turn_credential"));
	for (auto &server : buildTurnServers(turnUrl, turnUser, turnCredential)) {
		result.iceServers.push_back(std::move(server));
	}

	result.ingestBindAddress = trim(obs_data_get_string(settings, "ingest_bind_address"));
	result.cameraVideoPort = readPort(settings, "camera_video_port");
	result.cameraAudioPort = readPort(settings, "camera_audio_port");
	result.screenVideoPort = readPort(settings, "screen_video_port");
	result.screenAudioPort = readPort(settings, "screen_audio_port");

	return result;
}

OrchestratorSettings loadSettingsJson(const std::string &json)
{
	obs_data_t *settings = obs_data_create_from_json(json.c_str());
	if (!settings) {
		throw RoomcastError(ErrorCode::InvalidSettings, "Settings are not valid JSON");
	}

	try {
		OrchestratorSettings result = settingsFromData(settings);
		obs_data_release(settings);
		return result;
	} catch (const RoomcastError &) {
		obs_data_release(settings);
		throw;
	}
}

OrchestratorSettings loadSettingsFile(const std::string &path)
{
	obs_data_t *settings = obs_data_create_from_json_file_safe(path.c_str(), "bak");
	if (!settings) {
		throw RoomcastError(ErrorCode::InvalidSettings, "Cannot read settings file " + path);
	}

	try {
		OrchestratorSettings result = settingsFromData(settings);
		obs_data_release(settings);
		logInfo("Loaded settings from %s", path.c_str());
		return result;
	} catch (const RoomcastError &) {
		obs_data_release(settings);
		throw;
	}
}

} // namespace roomcast
