/*
 * Roomcast
 * Utility function implementations
 */

#include "roomcast-utils.h"

#include <util/base.h>

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <random>
#include <stdexcept>

namespace roomcast
{

namespace
{

std::atomic<bool> verboseLogging{false};

std::mt19937_64 &randomEngine()
{
	thread_local std::mt19937_64 engine{std::random_device{}()};
	return engine;
}

bool isSpace(char c)
{
	return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool hasPrefixNoCase(const std::string &value, const std::string &prefix)
{
	return value.size() >= prefix.size() && asciiLower(value.substr(0, prefix.size())) == prefix;
}

bool isIceUrl(const std::string &url)
{
	static const char *const schemes[] = {"stun:", "stuns:", "turn:", "turns:"};
	for (const char *scheme : schemes) {
		if (hasPrefixNoCase(url, scheme))
			return true;
	}
	return false;
}

void appendUtf8(std::string &out, uint32_t cp)
{
	if (cp < 0x80) {
		out += static_cast<char>(cp);
	} else if (cp < 0x800) {
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else {
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

std::string quoteJson(const std::string &value)
{
	std::string out = "\"";
	for (const char c : value) {
		const char *replacement = nullptr;
		switch (c) {
		case '"': replacement = "\\\""; break;
		case '\\': replacement = "\\\\"; break;
		case '\n': replacement = "\\n"; break;
		case '\r': replacement = "\\r"; break;
		case '\t': replacement = "\\t"; break;
		case '\b': replacement = "\\b"; break;
		case '\f': replacement = "\\f"; break;
		default: break;
		}

		if (replacement) {
			out += replacement;
		} else if (static_cast<unsigned char>(c) < 0x20) {
			char code[8];
			snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(c));
			out += code;
		} else {
			out += c;
		}
	}
	out += '"';
	return out;
}

// Forward-only reader over a JSON text. Strings are decoded, objects and arrays
// are returned verbatim so callers can parse them lazily.
class JsonScanner
{
public:
	explicit JsonScanner(const std::string &text) : text_(text) {}

	bool atEnd() const { return pos_ >= text_.size(); }

	char peek()
	{
		skipSpace();
		return atEnd() ? '\0' : text_[pos_];
	}

	bool accept(char expected)
	{
		if (peek() != expected)
			return false;
		pos_++;
		return true;
	}

	bool readString(std::string &out)
	{
		if (!accept('"'))
			return false;
		out.clear();
		while (!atEnd()) {
			const char c = text_[pos_++];
			if (c == '"')
				return true;
			if (c != '\\' || atEnd()) {
				out += c;
				continue;
			}
			const char esc = text_[pos_++];
			switch (esc) {
			case 'n': out += '\n'; break;
			case 'r': out += '\r'; break;
			case 't': out += '\t'; break;
			case 'b': out += '\b'; break;
			case 'f': out += '\f'; break;
			case 'u': {
				if (pos_ + 4 > text_.size())
					return false;
				try {
					appendUtf8(out, static_cast<uint32_t>(std::stoul(text_.substr(pos_, 4), nullptr, 16)));
				} catch (const std::exception &) {
					return false;
				}
				pos_ += 4;
				break;
			}
			default: out += esc; break;
			}
		}
		return false;
	}

	// Reads any value. Null becomes an empty string.
	bool readValue(std::string &out)
	{
		const char c = peek();
		if (c == '"')
			return readString(out);
		if (c == '{' || c == '[')
			return readComposite(out);

		const size_t start = pos_;
		while (!atEnd() && text_[pos_] != ',' && text_[pos_] != '}' && text_[pos_] != ']' && !isSpace(text_[pos_]))
			pos_++;
		out = text_.substr(start, pos_ - start);
		if (out == "null")
			out.clear();
		return pos_ > start;
	}

private:
	void skipSpace()
	{
		while (!atEnd() && isSpace(text_[pos_]))
			pos_++;
	}

	bool readComposite(std::string &out)
	{
		const size_t start = pos_;
		int depth = 0;
		bool quoted = false;
		while (!atEnd()) {
			const char c = text_[pos_++];
			if (quoted) {
				if (c == '\\')
					pos_++;
				else if (c == '"')
					quoted = false;
			} else if (c == '"') {
				quoted = true;
			} else if (c == '{' || c == '[') {
				depth++;
			} else if ((c == '}' || c == ']') && --depth == 0) {
				out = text_.substr(start, pos_ - start);
				return true;
			}
		}
		return false;
	}

	const std::string &text_;
	size_t pos_ = 0;
};

void logMessage(int level, const char *format, va_list args)
{
	char buffer[4096];
	vsnprintf(buffer, sizeof(buffer), format, args);
	blog(level, "[Roomcast] %s", buffer);
}

} // namespace

std::string generateUUID()
{
	std::array<uint8_t, 16> bytes;
	std::uniform_int_distribution<int> byteDist(0, 255);
	for (auto &b : bytes)
		b = static_cast<uint8_t>(byteDist(randomEngine()));

	// RFC 4122 version 4, variant 10xx
	bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
	bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

	std::string out;
	out.reserve(36);
	char hex[3];
	for (size_t i = 0; i < bytes.size(); ++i) {
		if (i == 4 || i == 6 || i == 8 || i == 10)
			out += '-';
		snprintf(hex, sizeof(hex), "%02x", bytes[i]);
		out += hex;
	}
	return out;
}

std::string generateSessionId()
{
	static const std::string alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
	std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);

	std::string id(8, '0');
	for (char &c : id)
		c = alphabet[pick(randomEngine())];
	return id;
}

JsonBuilder &JsonBuilder::add(const std::string &key, const std::string &value)
{
	return addRaw(key, quoteJson(value));
}

JsonBuilder &JsonBuilder::add(const std::string &key, const char *value)
{
	return addRaw(key, quoteJson(value ? value : ""));
}

JsonBuilder &JsonBuilder::add(const std::string &key, int value)
{
	return addRaw(key, std::to_string(value));
}

JsonBuilder &JsonBuilder::add(const std::string &key, int64_t value)
{
	return addRaw(key, std::to_string(value));
}

JsonBuilder &JsonBuilder::add(const std::string &key, bool value)
{
	return addRaw(key, value ? "true" : "false");
}

JsonBuilder &JsonBuilder::addRaw(const std::string &key, const std::string &rawJson)
{
	entries_.push_back({key, rawJson.empty() ? std::string("null") : rawJson});
	return *this;
}

std::string JsonBuilder::build() const
{
	std::string out = "{";
	for (const auto &entry : entries_) {
		if (out.size() > 1)
			out += ',';
		out += quoteJson(entry.first);
		out += ':';
		out += entry.second;
	}
	return out + "}";
}

JsonParser::JsonParser(const std::string &json) : json_(json)
{
	parse();
}

void JsonParser::parse()
{
	JsonScanner scanner(json_);
	if (!scanner.accept('{'))
		return;

	std::string key;
	std::string value;
	while (scanner.readString(key)) {
		if (!scanner.accept(':') || !scanner.readValue(value))
			break;
		values_[key] = value;
		if (!scanner.accept(','))
			break;
	}
}

bool JsonParser::hasKey(const std::string &key) const
{
	return values_.count(key) > 0;
}

std::string JsonParser::getString(const std::string &key, const std::string &defaultValue) const
{
	const auto it = values_.find(key);
	return it == values_.end() ? defaultValue : it->second;
}

int JsonParser::getInt(const std::string &key, int defaultValue) const
{
	const auto it = values_.find(key);
	if (it == values_.end() || it->second.empty())
		return defaultValue;
	try {
		return std::stoi(it->second);
	} catch (const std::exception &) {
		return defaultValue;
	}
}

bool JsonParser::getBool(const std::string &key, bool defaultValue) const
{
	const auto it = values_.find(key);
	if (it == values_.end() || it->second.empty())
		return defaultValue;
	return it->second == "true";
}

std::string JsonParser::getRaw(const std::string &key) const
{
	return getString(key);
}

std::string JsonParser::getObject(const std::string &key) const
{
	std::string raw = getRaw(key);
	return !raw.empty() && raw.front() == '{' ? raw : std::string();
}

std::vector<std::string> JsonParser::getArray(const std::string &key) const
{
	std::vector<std::string> items;
	const std::string raw = getRaw(key);
	JsonScanner scanner(raw);
	if (!scanner.accept('[') || scanner.accept(']'))
		return items;

	std::string item;
	do {
		if (!scanner.readValue(item))
			break;
		if (!item.empty())
			items.push_back(item);
	} while (scanner.accept(','));
	return items;
}

std::string trim(const std::string &str)
{
	size_t first = 0;
	size_t last = str.size();
	while (first < last && isSpace(str[first]))
		++first;
	while (last > first && isSpace(str[last - 1]))
		--last;
	return str.substr(first, last - first);
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
	std::vector<std::string> parts;
	size_t start = 0;
	for (;;) {
		const size_t end = str.find(delimiter, start);
		if (end == std::string::npos) {
			parts.push_back(str.substr(start));
			return parts;
		}
		parts.push_back(str.substr(start, end - start));
		start = end + 1;
	}
}

std::string asciiLower(std::string value)
{
	for (char &c : value)
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	return value;
}

bool hasTurnScheme(const std::string &url)
{
	return hasPrefixNoCase(url, "turn:") || hasPrefixNoCase(url, "turns:");
}

namespace
{

// One server entry: "url|user|pass", "url,user,pass" or "url user=.. credential=..".
bool parseIceEntry(const std::string &entry, IceServer &server)
{
	std::vector<std::string> fields;
	const size_t pipe = entry.find('|');
	if (pipe != std::string::npos || entry.find(',') != std::string::npos) {
		fields = split(entry, pipe != std::string::npos ? '|' : ',');
	} else {
		size_t pos = 0;
		while (pos < entry.size()) {
			while (pos < entry.size() && isSpace(entry[pos]))
				++pos;
			const size_t start = pos;
			while (pos < entry.size() && !isSpace(entry[pos]))
				++pos;
			if (pos > start)
				fields.push_back(entry.substr(start, pos - start));
		}
	}

	if (fields.empty())
		return false;

	server.urls = trim(fields[0]);
	std::vector<std::string> positional;
	for (size_t i = 1; i < fields.size(); ++i) {
		const std::string field = trim(fields[i]);
		const size_t eq = field.find('=');
		const std::string name = eq == std::string::npos ? std::string() : asciiLower(field.substr(0, eq));
		if (name == "username" || name == "user")
			server.username = field.substr(eq + 1);
		else if (name == "credential" || name == "password" || name == "pass")
			server.credential = field.substr(eq + 1);
		else
			positional.push_back(field);
	}

	if (server.username.empty() && !positional.empty())
		server.username = positional[0];
	if (server.credential.empty() && positional.size() > 1)
		server.credential = positional[1];

	return isIceUrl(server.urls);
}

} // namespace

std::vector<IceServer> parseIceServers(const std::string &config)
{
	std::vector<IceServer> servers;
	std::string normalized = config;
	for (char &c : normalized) {
		if (c == '\n' || c == '\r')
			c = ';';
	}

	for (const std::string &raw : split(normalized, ';')) {
		const std::string entry = trim(raw);
		if (entry.empty() || entry[0] == '#' || entry.compare(0, 2, "//") == 0)
			continue;

		IceServer server;
		if (parseIceEntry(entry, server))
			servers.push_back(std::move(server));
		else
			logDebug("Ignoring ICE server entry: %s", entry.c_str());
	}
	return servers;
}

std::vector<IceServer> buildTurnServers(const std::string &turnUrls, const std::string &username,
                                        const std::string &credential)
{
	std::vector<IceServer> servers;
	if (trim(turnUrls).empty()) {
		return servers;
	}

	for (const auto &rawUrl : split(turnUrls, ',')) {
		const std::string url = trim(rawUrl);
		if (url.empty()) {
			continue;
		}

		if (hasTurnScheme(url)) {
			servers.push_back({url, username, credential});
			continue;
		}

		// A bare host gets both transports.
		std::string host = url;
		const size_t schemeEnd = host.find("://");
		if (schemeEnd != std::string::npos) {
			host = host.substr(schemeEnd + 3);
		}
		servers.push_back({"turn:" + host + "?transport=udp", username, credential});
		servers.push_back({"turn:" + host + "?transport=tcp", username, credential});
	}

	return servers;
}

const char *roleToString(Role role)
{
	switch (role) {
	case Role::Broadcaster:
		return "broadcaster";
	case Role::Viewer:
	default:
		return "viewer";
	}
}

bool parseRole(const std::string &value, Role &role)
{
	const std::string lower = asciiLower(trim(value));
	if (lower == "broadcaster") {
		role = Role::Broadcaster;
		return true;
	}
	if (lower == "viewer") {
		role = Role::Viewer;
		return true;
	}
	return false;
}

const char *streamKindToString(StreamKind kind)
{
	switch (kind) {
	case StreamKind::Screen:
		return "screen";
	case StreamKind::Camera:
	default:
		return "camera";
	}
}

bool parseStreamKind(const std::string &value, StreamKind &kind)
{
	const std::string lower = asciiLower(trim(value));
	if (lower == "camera") {
		kind = StreamKind::Camera;
		return true;
	}
	if (lower == "screen") {
		kind = StreamKind::Screen;
		return true;
	}
	return false;
}

const char *trackKindToString(TrackKind kind)
{
	return kind == TrackKind::Audio ? "audio" : "video";
}

const char *connectionStateToString(ConnectionState state)
{
	switch (state) {
	case ConnectionState::New:
		return "new";
	case ConnectionState::Connecting:
		return "connecting";
	case ConnectionState::Connected:
		return "connected";
	case ConnectionState::Disconnected:
		return "disconnected";
	case ConnectionState::Failed:
		return "failed";
	case ConnectionState::Closed:
	default:
		return "closed";
	}
}

ConnectionState parseConnectionState(const std::string &value)
{
	const std::string lower = asciiLower(value);
	if (lower == "new")
		return ConnectionState::New;
	if (lower == "connecting")
		return ConnectionState::Connecting;
	if (lower == "connected")
		return ConnectionState::Connected;
	if (lower == "disconnected")
		return ConnectionState::Disconnected;
	if (lower == "failed")
		return ConnectionState::Failed;
	return ConnectionState::Closed;
}

const char *iceConnectionStateToString(IceConnectionState state)
{
	switch (state) {
	case IceConnectionState::New:
		return "new";
	case IceConnectionState::Checking:
		return "checking";
	case IceConnectionState::Connected:
		return "connected";
	case IceConnectionState::Completed:
		return "completed";
	case IceConnectionState::Disconnected:
		return "disconnected";
	case IceConnectionState::Failed:
		return "failed";
	case IceConnectionState::Closed:
	default:
		return "closed";
	}
}

IceConnectionState parseIceConnectionState(const std::string &value)
{
	const std::string lower = asciiLower(value);
	if (lower == "new")
		return IceConnectionState::New;
	if (lower == "checking")
		return IceConnectionState::Checking;
	if (lower == "connected")
		return IceConnectionState::Connected;
	if (lower == "completed")
		return IceConnectionState::Completed;
	if (lower == "disconnected")
		return IceConnectionState::Disconnected;
	if (lower == "failed")
		return IceConnectionState::Failed;
	return IceConnectionState::Closed;
}


int64_t currentTimeMs()
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(
		       std::chrono::system_clock::now().time_since_epoch())
		.count();
}

void setVerboseLogging(bool enable)
{
	verboseLogging.store(enable);
}

bool isVerboseLogging()
{
	return verboseLogging.load();
}

void logInfo(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logMessage(LOG_INFO, format, args);
	va_end(args);
}

void logWarning(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logMessage(LOG_WARNING, format, args);
	va_end(args);
}

void logError(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logMessage(LOG_ERROR, format, args);
	va_end(args);
}

void logDebug(const char *format, ...)
{
	if (!verboseLogging.load())
		return;

	va_list args;
	va_start(args, format);
	logMessage(LOG_DEBUG, format, args);
	va_end(args);
}

} // namespace roomcast
