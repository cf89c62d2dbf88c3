#include "core/turnStateMachine.hpp"

#include "core/errors.hpp"

#include <format>

namespace wordsmith {

static const char* toString(RoomStatus status) {
	switch (status) {
	case RoomStatus::Waiting:
		return "waiting";
	case RoomStatus::Active:
		return "active";
	case RoomStatus::Paused:
		return "paused";
	case RoomStatus::Completed:
		return "completed";
	case RoomStatus::Abandoned:
		return "abandoned";
	}
	return "unknown";
}

TurnStateMachine::TurnStateMachine(Clock& clock, unsigned passLimit) : m_clock(clock), m_passLimit(passLimit) {
}

void TurnStateMachine::activate(Side starting, TimePoint now) {
	requireStatus(RoomStatus::Waiting, "activate");

	m_status  = RoomStatus::Active;
	m_current = starting;
	m_clock.start(starting, now);
}

unsigned TurnStateMachine::commit(MoveType type, TimePoint now) {
	requireStatus(RoomStatus::Active, "commit");

	switch (type) {
	case MoveType::Play:
	case MoveType::Exchange:
		m_consecutivePasses = 0u;
		break;
	case MoveType::Pass:
	case MoveType::Challenge:
		++m_consecutivePasses;
		break;
	}

	m_current = opponent(m_current);
	m_clock.switchSide(now);
	return ++m_moveNumber;
}

unsigned TurnStateMachine::commitWithoutHandover(TimePoint) {
	requireStatus(RoomStatus::Active, "commit");
	return ++m_moveNumber;
}

void TurnStateMachine::pause(TimePoint now) {
	requireStatus(RoomStatus::Active, "pause");

	m_status = RoomStatus::Paused;
	m_clock.pause(now);
}

void TurnStateMachine::resume(TimePoint now) {
	requireStatus(RoomStatus::Paused, "resume");

	m_status = RoomStatus::Active;
	m_clock.resume(now);
}

void TurnStateMachine::complete(EndReason reason, std::optional<Side> loser, TimePoint now) {
	finish(RoomStatus::Completed, reason, loser, now);
}

void TurnStateMachine::abandon(EndReason reason, std::optional<Side> loser, TimePoint now) {
	finish(RoomStatus::Abandoned, reason, loser, now);
}

RoomStatus TurnStateMachine::status() const {
	return m_status;
}

Side TurnStateMachine::current() const {
	return m_current;
}

unsigned TurnStateMachine::consecutivePasses() const {
	return m_consecutivePasses;
}

unsigned TurnStateMachine::moveNumber() const {
	return m_moveNumber;
}

unsigned TurnStateMachine::passLimit() const {
	return m_passLimit;
}

bool TurnStateMachine::passLimitReached() const {
	return m_consecutivePasses >= m_passLimit;
}

EndReason TurnStateMachine::endReason() const {
	return m_endReason;
}

std::optional<Side> TurnStateMachine::loser() const {
	return m_loser;
}

void TurnStateMachine::checkInvariants() const {
	if (index(m_current) > 1u) {
		throw RoomCorrupted(std::format("Turn cursor {} out of range.", index(m_current)));
	}

	const auto snapshot = m_clock.snapshot();
	if (snapshot.first < Duration::zero() || snapshot.second < Duration::zero()) {
		throw RoomCorrupted("Negative remaining time.");
	}

	switch (m_status) {
	case RoomStatus::Active:
		if (snapshot.state != Clock::State::Running || snapshot.running != m_current) {
			throw RoomCorrupted("Active room without exactly the current side's clock running.");
		}
		break;
	case RoomStatus::Paused:
		if (snapshot.state != Clock::State::Paused) {
			throw RoomCorrupted("Paused room with a running clock.");
		}
		break;
	case RoomStatus::Waiting:
	case RoomStatus::Completed:
	case RoomStatus::Abandoned:
		if (snapshot.state == Clock::State::Running) {
			throw RoomCorrupted(std::format("Clock running while the room is {}.", toString(m_status)));
		}
		break;
	}
}

void TurnStateMachine::requireStatus(RoomStatus expected, const char* transition) const {
	if (m_status != expected) {
		throw RoomCorrupted(std::format("Transition '{}' requires a {} room, room is {}.", transition, toString(expected), toString(m_status)));
	}
}

void TurnStateMachine::finish(RoomStatus status, EndReason reason, std::optional<Side> loser, TimePoint now) {
	if (isTerminal(m_status)) {
		throw RoomCorrupted(std::format("Room already {}.", toString(m_status)));
	}

	m_clock.stop(now);
	m_status    = status;
	m_endReason = reason;
	m_loser     = loser;
}

} // namespace wordsmith
