#pragma once

#include "core/botProfile.hpp"
#include "core/clock.hpp"
#include "core/gameState.hpp"
#include "core/moveValidator.hpp"
#include "core/roomEvent.hpp"
#include "core/roomSettings.hpp"
#include "core/turnStateMachine.hpp"
#include "core/wordOracle.hpp"
#include "data/persistence.hpp"

#include <array>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace wordsmith {

//! Snapshot handed to the bot scheduler when a bot has the turn.
struct BotTurn {
	BotProfile profile;
	Epoch epoch; //!< Room epoch the view was taken at. Submissions with another epoch are stale.
	BotView view;
};

//! Authoritative game session of two players.
//! Single writer: every operation takes the room mutex and runs validation and mutation under it.
class GameRoom {
public:
	//! Loads board layout and tile distribution from the persistence collaborator.
	//! \note Throws std::runtime_error when either cannot be loaded.
	GameRoom(RoomId id, IPersistence& persistence, WordOracle& oracle, RoomSettings settings = {});

	GameRoom(const GameRoom&)            = delete;
	GameRoom& operator=(const GameRoom&) = delete;

	RoomUpdate join(const PlayerRef& player);         //!< Occupy a free slot. Joining again with the same id and kind only reconnects.
	RoomUpdate attachBot(const BotProfile& profile); //!< Occupy a free slot with a bot.
	RoomUpdate start();                              //!< Activate a full waiting room. No-op for a running room.

	//! Validate and commit a move of the given player.
	//! \param expectedEpoch Set by deferred submitters. A mismatch rejects the move as GameNotActive.
	RoomUpdate submitMove(const PlayerId& playerId, const Move& move, std::optional<Epoch> expectedEpoch = std::nullopt);

	//! Charge elapsed time, then report expiry, forfeit by disconnect or a timer sync.
	RoomUpdate tick();

	RoomUpdate disconnect(const PlayerId& playerId);
	RoomUpdate reconnect(const PlayerId& playerId); //!< Also used as heartbeat.
	RoomUpdate resign(const PlayerId& playerId);
	RoomUpdate pause();
	RoomUpdate resume();

	RoomSnapshot snapshot() const;
	std::optional<BotTurn> botTurn() const; //!< Set while a bot is to move in an active room.

	//! Time until the side to move runs out. Empty unless the room is active.
	std::optional<Duration> timeUntilExpiry() const;

	const RoomId& id() const;
	RoomStatus status() const;
	Epoch epoch() const;
	bool isJoinable() const; //!< Waiting and a slot is free.
	bool hasPlayer(const PlayerId& playerId) const;
	bool hasPlayer(const PlayerRef& player) const; //!< Seated with the same id and kind.
	std::optional<TimePoint> endedAt() const;

private:
	template <class Fn>
	RoomUpdate guarded(Fn&& body);

	void admit(const PlayerRef& player, const std::optional<BotProfile>& bot, RoomUpdate& update);
	void activate(TimePoint now, RoomUpdate& update);

	void applyPlay(ValidatedMove& move, TimePoint now, RoomUpdate& update);
	void applyExchange(ValidatedMove& move, TimePoint now, RoomUpdate& update);
	void applyPass(const ValidatedMove& move, TimePoint now, RoomUpdate& update);
	void applyChallenge(const ValidatedMove& move, TimePoint now, RoomUpdate& update);
	int revertPlay(const CommittedMove& play);

	void expire(Side side, TimePoint now, RoomUpdate& update);
	void finish(RoomStatus status, EndReason reason, std::optional<Side> loser, std::optional<Side> wentOut, TimePoint now,
	            RoomUpdate& update);
	void abortRoom(const std::string& detail, RoomUpdate& update); //!< Fatal invariant violation: end the session.

	void announceTurn(RoomUpdate& update) const;
	TimerSyncEvent timerSync(TimePoint now) const;
	RoomSnapshot snapshotLocked(TimePoint now) const;
	std::optional<Side> sideOf(const PlayerId& playerId) const;
	void checkInvariants() const;

private:
	const RoomId m_id;
	const RoomSettings m_settings;
	mutable std::mutex m_mutex;

	std::mt19937 m_rng; //!< Seeds the bag. Declared before the state that points to it.
	GameState m_state;
	Clock m_clock;
	TurnStateMachine m_turns;
	MoveValidator m_validator;

	std::array<std::optional<BotProfile>, 2> m_bots{};
	Epoch m_epoch{0u};

	WallTime m_createdAt;
	std::optional<TimePoint> m_endedAt{};
	std::optional<Side> m_winner{};
	std::string m_abortDetail{};
};

} // namespace wordsmith
