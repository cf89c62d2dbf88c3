#pragma once

#include "core/roomSettings.hpp"
#include "core/wordOracle.hpp"
#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace wordsmith::app {

inline constexpr unsigned DEFAULT_WORKER_THREADS = 2u;
inline constexpr unsigned DEFAULT_BOT_THREADS    = 2u;          //!< Threads searching bot moves, apart from the workers.
inline constexpr Duration DEFAULT_TICK_INTERVAL{5000};          //!< Timer sync cadence of running rooms.
inline constexpr Duration DEFAULT_FINISHED_ROOM_GRACE{300000}; //!< Finished rooms stay queryable this long.

//! Settings of a server process. Defaults are usable as is.
struct ServerConfig {
	std::uint16_t port{network::DEFAULT_PORT};
	unsigned workerThreads{DEFAULT_WORKER_THREADS};
	unsigned botThreads{DEFAULT_BOT_THREADS};
	Duration tickInterval{DEFAULT_TICK_INTERVAL};
	Duration finishedRoomGrace{DEFAULT_FINISHED_ROOM_GRACE};

	Duration initialTime{DEFAULT_INITIAL_TIME};
	unsigned passLimit{DEFAULT_PASS_LIMIT};
	Duration disconnectGrace{DEFAULT_DISCONNECT_GRACE};
	bool autoStart{true};

	DictionaryId dictionaryId{DEFAULT_DICTIONARY_ID};
	BoardConfigId boardConfigId{STANDARD_BOARD_ID};
	std::string language{DEFAULT_LANGUAGE};

	std::size_t oracleCacheCapacity{DEFAULT_ORACLE_CACHE_CAPACITY};
	Duration oracleTimeout{DEFAULT_ORACLE_TIMEOUT};

	RoomSettings roomSettings() const; //!< Settings every room of this server is created with.
};

//! Apply "--key=value" options on top of the defaults.
//! \note Throws std::invalid_argument for unknown keys and malformed values.
ServerConfig parseArguments(const std::vector<std::string>& args);

//! Option summary printed for malformed command lines.
std::string usage(const std::string& program);

} // namespace wordsmith::app
