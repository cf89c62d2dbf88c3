#include "core/clock.hpp"

#include <algorithm>
#include <chrono>
#include <initializer_list>

namespace wordsmith {

Clock::Clock(Duration initial) : m_initial(std::max(Duration::zero(), initial)), m_remaining{m_initial, m_initial} {
}

void Clock::start(Side toMove, TimePoint now) {
	if (m_state == State::Running) {
		updateElapsed(now);
	}
	m_running  = toMove;
	m_lastTick = now;
	m_state    = State::Running;
}

void Clock::switchSide(TimePoint now) {
	if (m_state != State::Running) {
		m_running = opponent(m_running);
		return;
	}

	updateElapsed(now);
	m_running  = opponent(m_running);
	m_lastTick = now;
}

void Clock::pause(TimePoint now) {
	if (m_state == State::Running) {
		updateElapsed(now);
		m_state = State::Paused;
	}
}

void Clock::resume(TimePoint now) {
	if (m_state == State::Paused) {
		m_lastTick = now;
		m_state    = State::Running;
	}
}

void Clock::stop(TimePoint now) {
	if (m_state == State::Running) {
		updateElapsed(now);
	}
	m_state = State::Stopped;
}

std::optional<Side> Clock::tick(TimePoint now) {
	if (m_state == State::Running) {
		updateElapsed(now);
	}

	for (const auto side: {Side::First, Side::Second}) {
		if (m_remaining[index(side)] == Duration::zero() && !m_expiryReported[index(side)]) {
			m_expiryReported[index(side)] = true;
			return side;
		}
	}
	return std::nullopt;
}

Clock::Snapshot Clock::snapshot() const {
	return {m_state, m_running, m_remaining[0], m_remaining[1]};
}

Clock::Snapshot Clock::snapshot(TimePoint now) const {
	auto remaining = m_remaining;
	if (m_state == State::Running) {
		const auto elapsed = std::chrono::duration_cast<Duration>(now - m_lastTick);
		if (elapsed > Duration::zero()) {
			auto& counter = remaining[index(m_running)];
			counter       = std::max(counter - elapsed, Duration::zero());
		}
	}
	return {m_state, m_running, remaining[0], remaining[1]};
}

Clock::State Clock::state() const {
	return m_state;
}

Side Clock::running() const {
	return m_running;
}

Duration Clock::initial() const {
	return m_initial;
}

bool Clock::expired(Side side) const {
	return m_remaining[index(side)] == Duration::zero();
}

void Clock::updateElapsed(TimePoint now) {
	const auto elapsed = std::chrono::duration_cast<Duration>(now - m_lastTick);
	if (elapsed <= Duration::zero()) {
		return;
	}

	// Only whole milliseconds are charged; the sub-millisecond rest stays in m_lastTick.
	auto& remaining = m_remaining[index(m_running)];
	remaining       = std::max(remaining - elapsed, Duration::zero());
	m_lastTick += elapsed;
}

} // namespace wordsmith
