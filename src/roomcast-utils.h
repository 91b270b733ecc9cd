/*
 * Roomcast
 * Utility helpers: identifiers, JSON, ICE server parsing, logging
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "roomcast-common.h"

namespace roomcast
{

// Identifiers
std::string generateUUID();
std::string generateSessionId();

// Minimal JSON object builder. Values added with add() are escaped, addRaw()
// inserts pre-serialized JSON.
class JsonBuilder
{
public:
	JsonBuilder &add(const std::string &key, const std::string &value);
	JsonBuilder &add(const std::string &key, const char *value);
	JsonBuilder &add(const std::string &key, int value);
	JsonBuilder &add(const std::string &key, int64_t value);
	JsonBuilder &add(const std::string &key, bool value);
	JsonBuilder &addRaw(const std::string &key, const std::string &rawJson);
	std::string build() const;

private:
	std::vector<std::pair<std::string, std::string>> entries_;
};

// Flat JSON object reader. Nested objects and arrays are kept as raw text and
// can be fed into another JsonParser.
class JsonParser
{
public:
	explicit JsonParser(const std::string &json);

	bool hasKey(const std::string &key) const;
	std::string getString(const std::string &key, const std::string &defaultValue = "") const;
	int getInt(const std::string &key, int defaultValue = 0) const;
	bool getBool(const std::string &key, bool defaultValue = false) const;
	std::string getRaw(const std::string &key) const;
	std::string getObject(const std::string &key) const;
	std::vector<std::string> getArray(const std::string &key) const;

private:
	void parse();

	std::string json_;
	std::map<std::string, std::string> values_;
};

// String utilities
std::string trim(const std::string &str);
std::vector<std::string> split(const std::string &str, char delimiter);
std::string asciiLower(std::string value);

// ICE server configuration
std::vector<IceServer> parseIceServers(const std::string &config);
std::vector<IceServer> buildTurnServers(const std::string &turnUrls, const std::string &username,
                                        const std::string &credential);
bool hasTurnScheme(const std::string &url);

// Enum <-> wire string conversions
const char *roleToString(Role role);
bool parseRole(const std::string &value, Role &role);
const char *streamKindToString(StreamKind kind);
bool parseStreamKind(const std::string &value, StreamKind &kind);
const char *trackKindToString(TrackKind kind);
const char *connectionStateToString(ConnectionState state);
ConnectionState parseConnectionState(const std::string &value);
const char *iceConnectionStateToString(IceConnectionState state);
IceConnectionState parseIceConnectionState(const std::string &value);

// Time utilities
int64_t currentTimeMs();

// Logging
void setVerboseLogging(bool enable);
bool isVerboseLogging();
void logInfo(const char *format, ...);
void logWarning(const char *format, ...);
void logError(const char *format, ...);
void logDebug(const char *format, ...);

} // namespace roomcast
