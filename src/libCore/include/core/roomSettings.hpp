#pragma once

#include "core/turnStateMachine.hpp"
#include "core/types.hpp"
#include "data/memoryStore.hpp"
#include "data/persistence.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace wordsmith {

inline constexpr Duration DEFAULT_INITIAL_TIME{600000};             //!< Per side time control.
inline constexpr std::chrono::seconds DEFAULT_DISCONNECT_GRACE{60}; //!< Absence before a player forfeits.

using TimeSource = std::function<TimePoint()>;

//! Creation parameters of a game room.
struct RoomSettings {
	Duration initialTime{DEFAULT_INITIAL_TIME};
	unsigned passLimit{DEFAULT_PASS_LIMIT};
	Duration disconnectGrace{DEFAULT_DISCONNECT_GRACE};

	DictionaryId dictionaryId{DEFAULT_DICTIONARY_ID};
	BoardConfigId boardConfigId{STANDARD_BOARD_ID};
	std::string language{DEFAULT_LANGUAGE};

	bool autoStart{true};               //!< Activate as soon as the second player joins.
	bool shuffleBag{true};              //!< False deals the distribution in order.
	std::optional<unsigned> seed{};     //!< Fixed seed for the bag and the starting side.
	std::optional<Side> startingSide{}; //!< Overrides the random starting side.

	TimeSource now{[] { return std::chrono::steady_clock::now(); }};
};

} // namespace wordsmith
