#pragma once

#include "core/types.hpp"

#include <array>
#include <optional>

namespace wordsmith {

//! Absolute time control for the two sides of a room. Never replenished.
//! Counters are whole milliseconds; the current time is passed in by the caller.
class Clock {
public:
	enum class State { Stopped, Running, Paused };

	struct Snapshot {
		State state;
		Side running;
		Duration first;  //!< Remaining time of slot 0.
		Duration second; //!< Remaining time of slot 1.

		Duration remaining(Side side) const {
			return side == Side::First ? first : second;
		}
	};

public:
	explicit Clock(Duration initial);

	void start(Side toMove, TimePoint now); //!< Run the clock for the given side.
	void switchSide(TimePoint now);         //!< Finalise the running side, then run the other one.
	void pause(TimePoint now);
	void resume(TimePoint now);
	void stop(TimePoint now);

	//! Charge the elapsed time to the running side.
	//! Returns a side that reached zero; every side is reported exactly once.
	std::optional<Side> tick(TimePoint now);

	Snapshot snapshot() const;              //!< Counters as of the last update.
	Snapshot snapshot(TimePoint now) const; //!< Counters projected to now without charging.

	State state() const;
	Side running() const;
	Duration initial() const;
	bool expired(Side side) const; //!< True once the side's counter reached zero.

private:
	void updateElapsed(TimePoint now);

private:
	Duration m_initial;
	std::array<Duration, 2> m_remaining;
	std::array<bool, 2> m_expiryReported{false, false};

	State m_state{State::Stopped};
	Side m_running{Side::First};
	TimePoint m_lastTick{};
};

} // namespace wordsmith
