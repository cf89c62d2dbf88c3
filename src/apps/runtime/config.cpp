#include "wordsmith/config.hpp"

#include <charconv>
#include <format>
#include <functional>
#include <limits>
#include <map>
#include <stdexcept>
#include <string_view>

namespace wordsmith::app {

namespace {

template <class T>
T parseNumber(std::string_view key, std::string_view value) {
	T parsed{};
	const auto* end      = value.data() + value.size();
	const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
	if (value.empty() || ec != std::errc() || ptr != end) {
		throw std::invalid_argument(std::format("Option '--{}' expects a number, got '{}'.", key, value));
	}
	return parsed;
}

bool parseBool(std::string_view key, std::string_view value) {
	if (value == "1" || value == "true" || value == "on") {
		return true;
	}
	if (value == "0" || value == "false" || value == "off") {
		return false;
	}
	throw std::invalid_argument(std::format("Option '--{}' expects true or false, got '{}'.", key, value));
}

Duration parseMillis(std::string_view key, std::string_view value) {
	const auto millis = parseNumber<Duration::rep>(key, value);
	if (millis < 0) {
		throw std::invalid_argument(std::format("Option '--{}' expects a non-negative duration, got '{}'.", key, value));
	}
	return Duration{millis};
}

using Setter = std::function<void(ServerConfig&, std::string_view key, std::string_view value)>;

const std::map<std::string_view, Setter>& setters() {
	static const std::map<std::string_view, Setter> options{
	        {"port",
	         [](ServerConfig& c, std::string_view k, std::string_view v) {
		         const auto port = parseNumber<unsigned>(k, v);
		         if (port > std::numeric_limits<std::uint16_t>::max()) {
			         throw std::invalid_argument(std::format("Port {} out of range.", port));
		         }
		         c.port = static_cast<std::uint16_t>(port);
	         }},
	        {"workers",
	         [](ServerConfig& c, std::string_view k, std::string_view v) {
		         c.workerThreads = parseNumber<unsigned>(k, v);
		         if (c.workerThreads == 0u) {
			         throw std::invalid_argument("At least one worker thread is required.");
		         }
	         }},
	        {"bot-threads",
	         [](ServerConfig& c, std::string_view k, std::string_view v) {
		         c.botThreads = parseNumber<unsigned>(k, v);
		         if (c.botThreads == 0u) {
			         throw std::invalid_argument("At least one bot thread is required.");
		         }
	         }},
	        {"tick-ms", [](ServerConfig& c, std::string_view k, std::string_view v) { c.tickInterval = parseMillis(k, v); }},
	        {"finished-grace-ms", [](ServerConfig& c, std::string_view k, std::string_view v) { c.finishedRoomGrace = parseMillis(k, v); }},
	        {"time-ms", [](ServerConfig& c, std::string_view k, std::string_view v) { c.initialTime = parseMillis(k, v); }},
	        {"pass-limit", [](ServerConfig& c, std::string_view k, std::string_view v) { c.passLimit = parseNumber<unsigned>(k, v); }},
	        {"disconnect-grace-ms", [](ServerConfig& c, std::string_view k, std::string_view v) { c.disconnectGrace = parseMillis(k, v); }},
	        {"auto-start", [](ServerConfig& c, std::string_view k, std::string_view v) { c.autoStart = parseBool(k, v); }},
	        {"dictionary", [](ServerConfig& c, std::string_view k, std::string_view v) { c.dictionaryId = parseNumber<DictionaryId>(k, v); }},
	        {"board", [](ServerConfig& c, std::string_view k, std::string_view v) { c.boardConfigId = parseNumber<BoardConfigId>(k, v); }},
	        {"language", [](ServerConfig& c, std::string_view, std::string_view v) { c.language = std::string(v); }},
	        {"oracle-cache", [](ServerConfig& c, std::string_view k, std::string_view v) { c.oracleCacheCapacity = parseNumber<std::size_t>(k, v); }},
	        {"oracle-timeout-ms", [](ServerConfig& c, std::string_view k, std::string_view v) { c.oracleTimeout = parseMillis(k, v); }},
	};
	return options;
}

} // namespace

RoomSettings ServerConfig::roomSettings() const {
	RoomSettings settings;
	settings.initialTime     = initialTime;
	settings.passLimit       = passLimit;
	settings.disconnectGrace = disconnectGrace;
	settings.dictionaryId    = dictionaryId;
	settings.boardConfigId   = boardConfigId;
	settings.language        = language;
	settings.autoStart       = autoStart;
	return settings;
}

ServerConfig parseArguments(const std::vector<std::string>& args) {
	ServerConfig config;
	for (const std::string_view arg: args) {
		if (!arg.starts_with("--")) {
			throw std::invalid_argument(std::format("Unexpected argument '{}'.", arg));
		}

		const auto option = arg.substr(2u);
		const auto eq     = option.find('=');
		if (eq == std::string_view::npos) {
			throw std::invalid_argument(std::format("Option '{}' needs a value: --key=value.", arg));
		}

		const auto key = option.substr(0u, eq);
		const auto it  = setters().find(key);
		if (it == setters().end()) {
			throw std::invalid_argument(std::format("Unknown option '--{}'.", key));
		}
		it->second(config, key, option.substr(eq + 1u));
	}
	return config;
}

std::string usage(const std::string& program) {
	const ServerConfig defaults;
	return std::format("Usage: {} [--key=value ...]\n"
	                   "  --port=<n>                 listening port ({})\n"
	                   "  --workers=<n>              worker threads ({})\n"
	                   "  --bot-threads=<n>          bot search threads ({})\n"
	                   "  --tick-ms=<ms>             timer sync interval ({})\n"
	                   "  --finished-grace-ms=<ms>   keep finished rooms ({})\n"
	                   "  --time-ms=<ms>             time per player ({})\n"
	                   "  --pass-limit=<n>           scoreless turns ending a game ({})\n"
	                   "  --disconnect-grace-ms=<ms> absence before forfeit ({})\n"
	                   "  --auto-start=<bool>        start when the second player joins ({})\n"
	                   "  --dictionary=<id>          dictionary id ({})\n"
	                   "  --board=<id>               board layout id ({})\n"
	                   "  --language=<id>            tile distribution ({})\n"
	                   "  --oracle-cache=<n>         cached word lookups ({})\n"
	                   "  --oracle-timeout-ms=<ms>   dictionary lookup timeout ({})\n",
	                   program, defaults.port, defaults.workerThreads, defaults.botThreads, defaults.tickInterval.count(), defaults.finishedRoomGrace.count(),
	                   defaults.initialTime.count(), defaults.passLimit, defaults.disconnectGrace.count(), defaults.autoStart, defaults.dictionaryId,
	                   defaults.boardConfigId, defaults.language, defaults.oracleCacheCapacity, defaults.oracleTimeout.count());
}

} // namespace wordsmith::app
