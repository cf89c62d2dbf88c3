#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"

#include <optional>

namespace wordsmith {

inline constexpr unsigned DEFAULT_PASS_LIMIT = 6u; //!< Consecutive scoreless turns that end the game.

//! Room status plus the nested turn cursor. Drives the clock on every transition.
//! WaitingForPlayers -> Active <-> Paused -> {Completed, Abandoned}. Terminal states never change.
class TurnStateMachine {
public:
	TurnStateMachine(Clock& clock, unsigned passLimit = DEFAULT_PASS_LIMIT);

	//! Second player joined: start the game and the clock of the starting side.
	void activate(Side starting, TimePoint now);

	//! A move was committed by the side to move. Updates the pass counter and hands the turn over.
	//! Play and exchange reset the counter; pass and a failed challenge increment it.
	//! \return The number of the committed move.
	unsigned commit(MoveType type, TimePoint now);

	//! A challenge reverted the previous play. The challenger keeps the turn and the counter is unchanged.
	unsigned commitWithoutHandover(TimePoint now);

	void pause(TimePoint now);
	void resume(TimePoint now);

	//! Terminal transitions. The loser is recorded when the game ended by timeout, resignation or forfeit.
	void complete(EndReason reason, std::optional<Side> loser, TimePoint now);
	void abandon(EndReason reason, std::optional<Side> loser, TimePoint now);

	RoomStatus status() const;
	Side current() const;
	unsigned consecutivePasses() const;
	unsigned moveNumber() const;
	unsigned passLimit() const;
	bool passLimitReached() const;
	EndReason endReason() const;
	std::optional<Side> loser() const;

	//! \note Throws RoomCorrupted when the cursor, status and clock disagree.
	void checkInvariants() const;

private:
	void requireStatus(RoomStatus expected, const char* transition) const;
	void finish(RoomStatus status, EndReason reason, std::optional<Side> loser, TimePoint now);

private:
	Clock& m_clock;
	const unsigned m_passLimit;

	RoomStatus m_status{RoomStatus::Waiting};
	Side m_current{Side::First};
	unsigned m_consecutivePasses{0u};
	unsigned m_moveNumber{0u};

	EndReason m_endReason{EndReason::None};
	std::optional<Side> m_loser{};
};

} // namespace wordsmith
