#include "core/gameRoom.hpp"

#include <algorithm>
#include <format>
#include <initializer_list>

namespace wordsmith {

namespace {

WallTime wallClock() {
	return std::chrono::system_clock::now();
}

//! Winner of a finished game. Empty for a draw or an aborted room.
std::optional<Side> decideWinner(const GameState& state, EndReason reason, std::optional<Side> loser) {
	if (loser) {
		return state.players[index(opponent(*loser))] ? std::optional<Side>{opponent(*loser)} : std::nullopt;
	}
	if (reason == EndReason::Aborted || !state.players[0] || !state.players[1]) {
		return std::nullopt;
	}

	const auto& first  = state.player(Side::First);
	const auto& second = state.player(Side::Second);
	if (first.score != second.score) {
		return first.score > second.score ? Side::First : Side::Second;
	}

	// Tie: the lower remaining rack value wins.
	const auto firstLeft  = rackValue(first.rack);
	const auto secondLeft = rackValue(second.rack);
	if (firstLeft != secondLeft) {
		return firstLeft < secondLeft ? Side::First : Side::Second;
	}
	return std::nullopt;
}

} // namespace

GameRoom::GameRoom(RoomId id, IPersistence& persistence, WordOracle& oracle, RoomSettings settings)
    : m_id(std::move(id)), m_settings(std::move(settings)), m_rng(m_settings.seed ? *m_settings.seed : std::random_device{}()),
      m_state{
              .board = Board(persistence.loadBoardConfig(m_settings.boardConfigId)),
              .bag   = TileBag(persistence.loadTileDistribution(m_settings.language), m_settings.shuffleBag ? &m_rng : nullptr),
      },
      m_clock(m_settings.initialTime), m_turns(m_clock, m_settings.passLimit), m_validator(oracle, m_settings.dictionaryId),
      m_createdAt(wallClock()) {
}

template <class Fn>
RoomUpdate GameRoom::guarded(Fn&& body) {
	RoomUpdate update;
	try {
		body(update);
		checkInvariants();
	} catch (const RoomCorrupted& e) {
		abortRoom(e.what(), update);
	}
	return update;
}

RoomUpdate GameRoom::join(const PlayerRef& player) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return guarded([&](RoomUpdate& update) { admit(player, std::nullopt, update); });
}

RoomUpdate GameRoom::attachBot(const BotProfile& profile) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return guarded([&](RoomUpdate& update) { admit(profile.ref(), profile, update); });
}

RoomUpdate GameRoom::start() {
	std::lock_guard<std::mutex> lock(m_mutex);
	return guarded([&](RoomUpdate& update) {
		switch (m_turns.status()) {
		case RoomStatus::Waiting:
			if (!m_state.players[0] || !m_state.players[1]) {
				update.error = MoveError{MoveErrorCode::GameNotActive};
				return;
			}
			activate(m_settings.now(), update);
			return;
		case RoomStatus::Active:
		case RoomStatus::Paused:
			return;
		case RoomStatus::Completed:
		case RoomStatus::Abandoned:
			update.error = MoveError{MoveErrorCode::GameNotActive};
			return;
		}
	});
}

RoomUpdate GameRoom::submitMove(const PlayerId& playerId, const Move& move, std::optional<Epoch> expectedEpoch) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return guarded([&](RoomUpdate& update) {
		if ((expectedEpoch && *expectedEpoch != m_epoch) || m_turns.status() != RoomStatus::Active) {
			update.error = MoveError{MoveErrorCode::GameNotActive};
			return;
		}

		const auto side = sideOf(playerId);
		if (!side) {
			update.error = MoveError{MoveErrorCode::NotYourTurn};
			return;
		}

		// Time is charged before the move: a move arriving after expiry is too late.
		const auto now = m_settings.now();
		if (const auto expired = m_clock.tick(now)) {
			expire(*expired, now, update);
			update.error = MoveError{MoveErrorCode::GameNotActive};
			return;
		}

		auto validated = m_validator.validate(m_state, m_turns.current(), *side, move);
		if (!validated) {
			update.error = validated.error();
			return;
		}

		auto& accepted = validated.value();
		switch (accepted.type) {
		case MoveType::Play:
			applyPlay(accepted, now, update);
			break;
		case MoveType::Exchange:
			applyExchange(accepted, now, update);
			break;
		case MoveType::Pass:
			applyPass(accepted, now, update);
			break;
		case MoveType::Challenge:
			applyChallenge(accepted, now, update);
			break;
		}
	});
}

RoomUpdate GameRoom::tick() {
	std::lock_guard<std::mutex> lock(m_mutex);
	return guarded([&](RoomUpdate& update) {
		const auto now    = m_settings.now();
		const auto status = m_turns.status();
		if (status == RoomStatus::Active) {
			if (const auto expired = m_clock.tick(now)) {
				expire(*expired, now, update);
				return;
			}
		}
		if (status != RoomStatus::Active && status != RoomStatus::Paused) {
			return;
		}

		for (const auto side: {Side::First, Side::Second}) {
			const auto& player = m_state.players[index(side)];
			if (player && !player->connected && player->disconnectedAt && now - *player->disconnectedAt >= m_settings.disconnectGrace) {
				finish(RoomStatus::Abandoned, EndReason::Disconnect, side, std::nullopt, now, update);
				return;
			}
		}
		update.events.push_back(timerSync(now));
	});
}

RoomUpdate GameRoom::disconnect(const PlayerId& playerId) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return guarded([&](RoomUpdate& update) {
		const auto side = sideOf(playerId);
		if (!side) {
			update.error = MoveError{MoveErrorCode::RoomNotFound};
			return;
		}

		if (m_turns.status() == RoomStatus::Waiting) {
			// Nothing was played yet: free the slot for the next joiner.
			auto& slot = m_state.players[index(*side)];
			m_state.bag.exchange(std::move(slot->rack));
			slot.reset();
			m_bots[index(*side)].reset();
			++m_epoch;
			update.events.push_back(StateSnapshotEvent{snapshotLocked(m_settings.now())});
			return;
		}

		auto& player = m_state.player(*side);
		if (!player.connected) {
			return;
		}
		player.connected      = false;
		player.disconnectedAt = m_settings.now();
		if (!isTerminal(m_turns.status())) {
			update.events.push_back(StateSnapshotEvent{snapshotLocked(*player.disconnectedAt)});
		}
	});
}

RoomUpdate GameRoom::reconnect(const PlayerId& playerId) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return guarded([&](RoomUpdate& update) {
		const auto side = sideOf(playerId);
		if (!side) {
			update.error = MoveError{MoveErrorCode::RoomNotFound};
			return;
		}

		auto& player = m_state.player(*side);
		if (player.connected) {
			return;
		}
		player.connected = true;
		player.disconnectedAt.reset();
		update.events.push_back(StateSnapshotEvent{snapshotLocked(m_settings.now())});
	});
}

RoomUpdate GameRoom::resign(const PlayerId& playerId) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return guarded([&](RoomUpdate& update) {
		const auto status = m_turns.status();
		if (status != RoomStatus::Active && status != RoomStatus::Paused) {
			update.error = MoveError{MoveErrorCode::GameNotActive};
			return;
		}

		const auto side = sideOf(playerId);
		if (!side) {
			update.error = MoveError{MoveErrorCode::NotYourTurn};
			return;
		}
		finish(RoomStatus::Completed, EndReason::Resignation, side, std::nullopt, m_settings.now(), update);
	});
}

RoomUpdate GameRoom::pause() {
	std::lock_guard<std::mutex> lock(m_mutex);
	return guarded([&](RoomUpdate& update) {
		if (m_turns.status() != RoomStatus::Active) {
			update.error = MoveError{MoveErrorCode::GameNotActive};
			return;
		}

		const auto now = m_settings.now();
		m_turns.pause(now);
		++m_epoch;
		update.events.push_back(timerSync(now));
		update.events.push_back(StateSnapshotEvent{snapshotLocked(now)});
	});
}

RoomUpdate GameRoom::resume() {
	std::lock_guard<std::mutex> lock(m_mutex);
	return guarded([&](RoomUpdate& update) {
		if (m_turns.status() != RoomStatus::Paused) {
			update.error = MoveError{MoveErrorCode::GameNotActive};
			return;
		}

		const auto now = m_settings.now();
		m_turns.resume(now);
		++m_epoch;
		update.events.push_back(timerSync(now));
		announceTurn(update);
	});
}

RoomSnapshot GameRoom::snapshot() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return snapshotLocked(m_settings.now());
}

std::optional<BotTurn> GameRoom::botTurn() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_turns.status() != RoomStatus::Active) {
		return std::nullopt;
	}

	const auto side = m_turns.current();
	if (!m_bots[index(side)]) {
		return std::nullopt;
	}

	const auto& own   = m_state.player(side);
	const auto& other = m_state.player(opponent(side));
	return BotTurn{
	        .profile = *m_bots[index(side)],
	        .epoch   = m_epoch,
	        .view =
	                BotView{
	                        .board             = m_state.board,
	                        .rack              = own.rack,
	                        .bagCount          = m_state.bag.size(),
	                        .opponentRackCount = other.rack.size(),
	                        .ownScore          = own.score,
	                        .opponentScore     = other.score,
	                        .dictionaryId      = m_settings.dictionaryId,
	                },
	};
}

std::optional<Duration> GameRoom::timeUntilExpiry() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_turns.status() != RoomStatus::Active) {
		return std::nullopt;
	}
	return m_clock.snapshot(m_settings.now()).remaining(m_turns.current());
}

const RoomId& GameRoom::id() const {
	return m_id;
}

RoomStatus GameRoom::status() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_turns.status();
}

Epoch GameRoom::epoch() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_epoch;
}

bool GameRoom::isJoinable() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_turns.status() == RoomStatus::Waiting && (!m_state.players[0] || !m_state.players[1]);
}

bool GameRoom::hasPlayer(const PlayerId& playerId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return sideOf(playerId).has_value();
}

bool GameRoom::hasPlayer(const PlayerRef& player) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	const auto side = sideOf(player.id);
	return side && m_state.player(*side).ref.kind == player.kind;
}

std::optional<TimePoint> GameRoom::endedAt() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_endedAt;
}

void GameRoom::admit(const PlayerRef& player, const std::optional<BotProfile>& bot, RoomUpdate& update) {
	if (isTerminal(m_turns.status())) {
		update.error = MoveError{MoveErrorCode::GameNotActive};
		return;
	}

	if (const auto side = sideOf(player.id)) {
		auto& present = m_state.player(*side);
		if (present.ref.kind != player.kind) {
			// The id is taken by a player of the other kind.
			update.error = MoveError{MoveErrorCode::RoomFull};
			return;
		}
		present.connected = true;
		present.disconnectedAt.reset();
		update.events.push_back(StateSnapshotEvent{snapshotLocked(m_settings.now())});
		return;
	}

	const auto side = !m_state.players[0] ? Side::First : Side::Second;
	if (m_state.players[index(side)]) {
		update.error = MoveError{MoveErrorCode::RoomFull};
		return;
	}

	m_state.players[index(side)] = PlayerState{.ref = player, .rack = m_state.bag.draw(RACK_SIZE)};
	m_bots[index(side)]          = bot;
	++m_epoch;

	if (m_settings.autoStart && m_state.players[0] && m_state.players[1]) {
		activate(m_settings.now(), update);
		return;
	}
	update.events.push_back(StateSnapshotEvent{snapshotLocked(m_settings.now())});
}

void GameRoom::activate(TimePoint now, RoomUpdate& update) {
	auto starting = Side::First;
	if (m_settings.startingSide) {
		starting = *m_settings.startingSide;
	} else if (std::uniform_int_distribution<int>(0, 1)(m_rng) == 1) {
		starting = Side::Second;
	}

	m_turns.activate(starting, now);
	++m_epoch;
	announceTurn(update);
}

void GameRoom::applyPlay(ValidatedMove& move, TimePoint now, RoomUpdate& update) {
	auto& player = m_state.player(move.side);
	for (std::size_t i = 0; i < move.placements.size(); ++i) {
		m_state.board.setAt(move.placements[i].position, move.placedTiles[i]);
	}

	player.rack      = std::move(move.remainingRack);
	const auto drawn = m_state.bag.draw(RACK_SIZE - player.rack.size());
	player.rack.insert(player.rack.end(), drawn.begin(), drawn.end());
	player.score += move.score;

	const auto number = m_turns.commit(MoveType::Play, now);
	m_state.history.push_back(CommittedMove{
	        .moveNumber     = number,
	        .type           = MoveType::Play,
	        .side           = move.side,
	        .player         = player.ref.id,
	        .placements     = move.placements,
	        .exchangedCount = 0u,
	        .words          = move.words,
	        .score          = move.score,
	        .timestamp      = wallClock(),
	});
	m_state.challengeable = m_state.history.size() - 1u;
	m_state.lastDraw      = drawn;
	++m_epoch;
	update.events.push_back(MoveCommittedEvent{m_state.history.back()});

	if (m_state.bag.empty() && player.rack.empty()) {
		finish(RoomStatus::Completed, EndReason::OutOfTiles, std::nullopt, move.side, now, update);
		return;
	}
	announceTurn(update);
}

void GameRoom::applyExchange(ValidatedMove& move, TimePoint now, RoomUpdate& update) {
	auto& player     = m_state.player(move.side);
	const auto count = move.exchangedTiles.size();
	player.rack      = std::move(move.remainingRack);
	const auto drawn = m_state.bag.draw(count);
	player.rack.insert(player.rack.end(), drawn.begin(), drawn.end());
	m_state.bag.exchange(std::move(move.exchangedTiles));

	const auto number = m_turns.commit(MoveType::Exchange, now);
	m_state.challengeable.reset();
	m_state.lastDraw.clear();
	m_state.history.push_back(CommittedMove{
	        .moveNumber     = number,
	        .type           = MoveType::Exchange,
	        .side           = move.side,
	        .player         = player.ref.id,
	        .placements     = {},
	        .exchangedCount = count,
	        .words          = {},
	        .score          = 0,
	        .timestamp      = wallClock(),
	});
	++m_epoch;
	update.events.push_back(MoveCommittedEvent{m_state.history.back()});
	announceTurn(update);
}

void GameRoom::applyPass(const ValidatedMove& move, TimePoint now, RoomUpdate& update) {
	const auto number = m_turns.commit(MoveType::Pass, now);
	m_state.challengeable.reset();
	m_state.lastDraw.clear();
	m_state.history.push_back(CommittedMove{
	        .moveNumber     = number,
	        .type           = MoveType::Pass,
	        .side           = move.side,
	        .player         = m_state.player(move.side).ref.id,
	        .placements     = {},
	        .exchangedCount = 0u,
	        .words          = {},
	        .score          = 0,
	        .timestamp      = wallClock(),
	});
	++m_epoch;
	update.events.push_back(MoveCommittedEvent{m_state.history.back()});

	if (m_turns.passLimitReached()) {
		finish(RoomStatus::Completed, EndReason::PassLimit, std::nullopt, std::nullopt, now, update);
		return;
	}
	announceTurn(update);
}

void GameRoom::applyChallenge(const ValidatedMove& move, TimePoint now, RoomUpdate& update) {
	const auto challenged = m_state.history.at(m_state.challengeable.value());

	int removed     = 0;
	unsigned number = 0u;
	if (move.challengeUpheld) {
		removed = revertPlay(challenged);
		number  = m_turns.commitWithoutHandover(now);
	} else {
		number = m_turns.commit(MoveType::Challenge, now);
	}

	m_state.challengeable.reset();
	m_state.lastDraw.clear();
	m_state.history.push_back(CommittedMove{
	        .moveNumber     = number,
	        .type           = MoveType::Challenge,
	        .side           = move.side,
	        .player         = m_state.player(move.side).ref.id,
	        .placements     = {},
	        .exchangedCount = 0u,
	        .words          = move.words,
	        .score          = 0,
	        .timestamp      = wallClock(),
	});
	++m_epoch;
	update.events.push_back(MoveCommittedEvent{m_state.history.back()});
	update.events.push_back(ChallengeResolvedEvent{
	        .challenger     = move.side,
	        .upheld         = move.challengeUpheld,
	        .challengedMove = challenged.moveNumber,
	        .invalidWord    = move.invalidWord,
	        .scoreRemoved   = removed,
	});

	if (!move.challengeUpheld && m_turns.passLimitReached()) {
		finish(RoomStatus::Completed, EndReason::PassLimit, std::nullopt, std::nullopt, now, update);
		return;
	}
	announceTurn(update);
}

int GameRoom::revertPlay(const CommittedMove& play) {
	auto& owner = m_state.player(play.side);

	// Put the replacement tiles back first so the bag deals them again in the same order.
	for (const auto& tile: m_state.lastDraw) {
		const auto it = std::find(owner.rack.begin(), owner.rack.end(), tile);
		if (it == owner.rack.end()) {
			throw RoomCorrupted(std::format("Tile '{}' drawn after move {} is missing from the rack.", tile.letter, play.moveNumber));
		}
		owner.rack.erase(it);
	}
	m_state.bag.restore(m_state.lastDraw);

	for (const auto& placement: play.placements) {
		const auto tile = m_state.board.getAt(placement.position);
		if (!tile) {
			throw RoomCorrupted(std::format("Cell ({}, {}) of move {} is empty.", placement.position.row, placement.position.col, play.moveNumber));
		}
		m_state.board.clearAt(placement.position);
		owner.rack.push_back(tile->isBlank ? makeTile(BLANK_LETTER, 0u) : *tile);
	}

	const auto removed = std::min(play.score, owner.score);
	owner.score -= removed;
	return removed;
}

void GameRoom::expire(Side side, TimePoint now, RoomUpdate& update) {
	update.events.push_back(TimerExpiredEvent{side, m_state.player(side).ref.id});
	finish(RoomStatus::Completed, EndReason::Timeout, side, std::nullopt, now, update);
}

void GameRoom::finish(RoomStatus status, EndReason reason, std::optional<Side> loser, std::optional<Side> wentOut, TimePoint now,
                      RoomUpdate& update) {
	if (reason == EndReason::PassLimit) {
		for (auto& player: m_state.players) {
			if (player) {
				player->score = std::max(0, player->score - rackValue(player->rack));
			}
		}
	} else if (reason == EndReason::OutOfTiles && wentOut) {
		auto& out       = m_state.player(*wentOut);
		auto& other     = m_state.player(opponent(*wentOut));
		const auto left = rackValue(other.rack);
		out.score += left;
		other.score = std::max(0, other.score - left);
	}

	if (status == RoomStatus::Completed) {
		m_turns.complete(reason, loser, now);
	} else {
		m_turns.abandon(reason, loser, now);
	}
	m_endedAt = now;
	m_winner  = decideWinner(m_state, reason, loser);
	++m_epoch;

	const auto scoreOf = [&](Side side) { return m_state.players[index(side)] ? m_state.player(side).score : 0; };
	update.events.push_back(GameCompletedEvent{
	        .status   = status,
	        .reason   = reason,
	        .winner   = m_winner,
	        .winnerId = m_winner ? m_state.player(*m_winner).ref.id : PlayerId{},
	        .scores   = {scoreOf(Side::First), scoreOf(Side::Second)},
	        .detail   = m_abortDetail,
	});
	update.events.push_back(StateSnapshotEvent{snapshotLocked(now)});
}

void GameRoom::abortRoom(const std::string& detail, RoomUpdate& update) {
	// Nothing produced by the failed operation is trustworthy.
	m_abortDetail = detail;
	update.error.reset();
	update.events.clear();
	if (isTerminal(m_turns.status())) {
		return;
	}
	finish(RoomStatus::Abandoned, EndReason::Aborted, std::nullopt, std::nullopt, m_settings.now(), update);
}

void GameRoom::announceTurn(RoomUpdate& update) const {
	const auto side = m_turns.current();
	update.events.push_back(TurnChangedEvent{side, m_state.player(side).ref.id});
	update.events.push_back(StateSnapshotEvent{snapshotLocked(m_settings.now())});
}

TimerSyncEvent GameRoom::timerSync(TimePoint now) const {
	const auto clock = m_clock.snapshot(now);
	return TimerSyncEvent{
	        .first   = clock.first,
	        .second  = clock.second,
	        .running = clock.running,
	        .paused  = m_turns.status() == RoomStatus::Paused,
	};
}

RoomSnapshot GameRoom::snapshotLocked(TimePoint now) const {
	const auto status = m_turns.status();
	RoomSnapshot snapshot{
	        .id                = m_id,
	        .status            = status,
	        .board             = m_state.board.cells(),
	        .players           = {},
	        .current           = m_turns.current(),
	        .consecutivePasses = m_turns.consecutivePasses(),
	        .moveNumber        = m_turns.moveNumber(),
	        .bagCount          = m_state.bag.size(),
	        .epoch             = m_epoch,
	        .endReason         = m_turns.endReason(),
	        .winner            = m_winner,
	        .createdAt         = m_createdAt,
	};

	const auto clock   = m_clock.snapshot(now);
	const bool running = status == RoomStatus::Active || status == RoomStatus::Paused;
	for (const auto side: {Side::First, Side::Second}) {
		const auto& player = m_state.players[index(side)];
		if (!player) {
			continue;
		}
		snapshot.players[index(side)] = PlayerView{
		        .ref           = player->ref,
		        .score         = player->score,
		        .timeRemaining = clock.remaining(side),
		        .isCurrentTurn = running && m_turns.current() == side,
		        .connected     = player->connected,
		        .rack          = player->rack,
		};
	}
	return snapshot;
}

std::optional<Side> GameRoom::sideOf(const PlayerId& playerId) const {
	for (const auto side: {Side::First, Side::Second}) {
		const auto& player = m_state.players[index(side)];
		if (player && player->ref.id == playerId) {
			return side;
		}
	}
	return std::nullopt;
}

void GameRoom::checkInvariants() const {
	m_turns.checkInvariants();

	for (const auto& player: m_state.players) {
		if (!player) {
			continue;
		}
		if (player->rack.size() > RACK_SIZE) {
			throw RoomCorrupted(std::format("Rack of '{}' holds {} tiles.", player->ref.id, player->rack.size()));
		}
		if (player->score < 0) {
			throw RoomCorrupted(std::format("Negative score for '{}'.", player->ref.id));
		}
	}

	const auto status = m_turns.status();
	if ((status == RoomStatus::Active || status == RoomStatus::Paused) && (!m_state.players[0] || !m_state.players[1])) {
		throw RoomCorrupted("Running room with an empty player slot.");
	}
}

} // namespace wordsmith
