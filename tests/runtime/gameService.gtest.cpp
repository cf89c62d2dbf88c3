#include "runtime/recordingSink.hpp"
#include "wordsmith/gameService.hpp"

#include "data/memoryStore.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace wordsmith::gtest {

using namespace std::chrono_literals;

namespace {

const PlayerRef ALICE{.kind = PlayerRef::Kind::Human, .id = "alice", .name = "Alice"};
const PlayerRef BOB{.kind = PlayerRef::Kind::Human, .id = "bob", .name = "Bob"};

//! Dictionary that takes its time with every word.
class SlowDictionary : public MemoryStore {
public:
	bool loadDictionaryEntry(DictionaryId dictionaryId, const std::string& word) override {
		std::this_thread::sleep_for(20ms);
		return MemoryStore::loadDictionaryEntry(dictionaryId, word);
	}
};

class GameServiceTest : public ::testing::Test {
protected:
	~GameServiceTest() override {
		if (m_service) {
			m_service->stop();
		}
	}

	app::GameService& startService(app::ServerConfig config = testConfig(), std::shared_ptr<IPersistence> store = std::make_shared<MemoryStore>()) {
		m_service = std::make_unique<app::GameService>(std::move(config), std::move(store), m_sink);
		m_service->start();
		return *m_service;
	}

	static app::ServerConfig testConfig() {
		app::ServerConfig config;
		config.workerThreads = 2u;
		config.tickInterval  = Duration{50};
		return config;
	}

	//! Both players seated. Returns the room id.
	RoomId startGame() {
		const auto first = m_service->join(ALICE);
		EXPECT_TRUE(first.update.ok());
		const auto second = m_service->join(BOB);
		EXPECT_TRUE(second.update.ok());
		EXPECT_EQ(first.room, second.room);
		return first.room->id();
	}

	PlayerId toMove(const RoomId& roomId) {
		const auto snapshot = m_service->snapshot(roomId);
		EXPECT_TRUE(snapshot.has_value());
		return snapshot->players[index(snapshot->current)]->ref.id;
	}

	//! Alice against a bot, the bot to move. Returns the room id.
	RoomId startBotGame(std::string_view botId) {
		const auto first = m_service->join(ALICE);
		EXPECT_TRUE(first.update.ok());
		const auto roomId = first.room->id();
		EXPECT_TRUE(m_service->attachBot(roomId, botId).ok());
		if (toMove(roomId) == "alice") {
			EXPECT_TRUE(m_service->submitMove(roomId, "alice", Move::pass()).ok());
		}
		return roomId;
	}

	bool waitForNoBotTurns(Duration timeout = Duration{1000}) {
		const auto deadline = std::chrono::steady_clock::now() + timeout;
		while (m_service->pendingBotTurns() != 0u) {
			if (std::chrono::steady_clock::now() > deadline) {
				return false;
			}
			std::this_thread::sleep_for(5ms);
		}
		return true;
	}

	RecordingSink m_sink;
	std::unique_ptr<app::GameService> m_service;
};

} // namespace

TEST_F(GameServiceTest, UnknownRoom) {
	auto& service = startService();

	EXPECT_EQ(service.submitMove("nowhere", "alice", Move::pass()).error->code, MoveErrorCode::RoomNotFound);
	EXPECT_EQ(service.startGame("nowhere").error->code, MoveErrorCode::RoomNotFound);
	EXPECT_EQ(service.resign("nowhere", "alice").error->code, MoveErrorCode::RoomNotFound);
	EXPECT_EQ(service.disconnect("nowhere", "alice").error->code, MoveErrorCode::RoomNotFound);
	EXPECT_EQ(service.heartbeat("nowhere", "alice").error->code, MoveErrorCode::RoomNotFound);
	EXPECT_EQ(service.pause("nowhere").error->code, MoveErrorCode::RoomNotFound);
	EXPECT_EQ(service.attachBot("nowhere", "bot-easy").error->code, MoveErrorCode::RoomNotFound);
	EXPECT_EQ(service.join(ALICE, RoomId{"nowhere"}).update.error->code, MoveErrorCode::RoomNotFound);
	EXPECT_FALSE(service.snapshot("nowhere").has_value());
}

TEST_F(GameServiceTest, MovesAreBroadcast) {
	auto& service     = startService();
	const auto roomId = startGame();

	const auto turn = m_sink.waitFor<TurnChangedEvent>([](const TurnChangedEvent&) { return true; });
	ASSERT_TRUE(turn.has_value());

	const auto mover = toMove(roomId);
	EXPECT_EQ(turn->player, mover);
	const auto other = mover == "alice" ? PlayerId{"bob"} : PlayerId{"alice"};

	const auto rejected = service.submitMove(roomId, other, Move::pass());
	ASSERT_FALSE(rejected.ok());
	EXPECT_EQ(rejected.error->code, MoveErrorCode::NotYourTurn);
	EXPECT_EQ(m_sink.count<MoveCommittedEvent>(roomId), 0u);

	ASSERT_TRUE(service.submitMove(roomId, mover, Move::pass()).ok());
	const auto committed = m_sink.waitFor<MoveCommittedEvent>([&](const MoveCommittedEvent& e) { return e.move.player == mover; });
	ASSERT_TRUE(committed.has_value());
	EXPECT_EQ(committed->move.type, MoveType::Pass);
	EXPECT_EQ(toMove(roomId), other);
}

TEST_F(GameServiceTest, ClockExpiryEndsTheGame) {
	auto config         = testConfig();
	config.initialTime  = Duration{300};
	config.tickInterval = Duration{1000};
	auto& service       = startService(config);
	const auto roomId   = startGame();
	const auto mover    = toMove(roomId);

	// The tick is scheduled for the expiry, not the regular cadence.
	const auto expired = m_sink.waitFor<TimerExpiredEvent>([](const TimerExpiredEvent&) { return true; }, Duration{900});
	ASSERT_TRUE(expired.has_value());
	EXPECT_EQ(expired->player, mover);

	const auto completed = m_sink.waitFor<GameCompletedEvent>([](const GameCompletedEvent&) { return true; });
	ASSERT_TRUE(completed.has_value());
	EXPECT_EQ(completed->reason, EndReason::Timeout);
	EXPECT_NE(completed->winnerId, mover);
	EXPECT_EQ(service.snapshot(roomId)->status, RoomStatus::Completed);
	EXPECT_EQ(service.submitMove(roomId, mover, Move::pass()).error->code, MoveErrorCode::GameNotActive);
}

TEST_F(GameServiceTest, PausedRoomsDoNotExpire) {
	auto config        = testConfig();
	config.initialTime = Duration{300};
	auto& service      = startService(config);
	const auto roomId  = startGame();

	ASSERT_TRUE(service.pause(roomId).ok());
	std::this_thread::sleep_for(500ms);
	EXPECT_EQ(service.snapshot(roomId)->status, RoomStatus::Paused);
	EXPECT_EQ(m_sink.count<GameCompletedEvent>(roomId), 0u);
	EXPECT_GT(m_sink.count<TimerSyncEvent>(roomId), 0u);

	ASSERT_TRUE(service.resume(roomId).ok());
	const auto completed = m_sink.waitFor<GameCompletedEvent>([](const GameCompletedEvent&) { return true; });
	ASSERT_TRUE(completed.has_value());
	EXPECT_EQ(completed->reason, EndReason::Timeout);
}

TEST_F(GameServiceTest, HeartbeatReconnects) {
	auto& service     = startService();
	const auto roomId = startGame();

	ASSERT_TRUE(service.disconnect(roomId, "bob").ok());
	EXPECT_FALSE(service.snapshot(roomId)->players[1]->connected);
	ASSERT_TRUE(service.heartbeat(roomId, "bob").ok());
	EXPECT_TRUE(service.snapshot(roomId)->players[1]->connected);
}

TEST_F(GameServiceTest, FinishedRoomsArePurged) {
	auto config              = testConfig();
	config.finishedRoomGrace = Duration{50};
	auto& service            = startService(config);
	const auto roomId        = startGame();

	ASSERT_TRUE(service.resign(roomId, "alice").ok());
	ASSERT_TRUE(m_sink.waitForRemoval(roomId));
	EXPECT_EQ(service.registry().find(roomId), nullptr);
	EXPECT_FALSE(service.snapshot(roomId).has_value());
}

TEST_F(GameServiceTest, ExplicitStart) {
	auto config       = testConfig();
	config.autoStart  = false;
	auto& service     = startService(config);
	const auto roomId = startGame();

	EXPECT_EQ(service.snapshot(roomId)->status, RoomStatus::Waiting);
	ASSERT_TRUE(service.startGame(roomId).ok());
	EXPECT_EQ(service.snapshot(roomId)->status, RoomStatus::Active);
	EXPECT_EQ(m_sink.count<TurnChangedEvent>(roomId), 1u);
}

TEST_F(GameServiceTest, BotTakesItsTurn) {
	auto& service    = startService();
	const auto first = service.join(ALICE);
	ASSERT_TRUE(first.update.ok());
	const auto roomId = first.room->id();

	EXPECT_EQ(service.attachBot(roomId, "bot-unknown").error->code, MoveErrorCode::UnknownBot);
	ASSERT_TRUE(service.attachBot(roomId, "bot-beginner").ok());
	EXPECT_EQ(service.snapshot(roomId)->status, RoomStatus::Active);

	if (toMove(roomId) == "alice") {
		ASSERT_TRUE(service.submitMove(roomId, "alice", Move::pass()).ok());
	}

	const auto botMove = m_sink.waitFor<MoveCommittedEvent>([](const MoveCommittedEvent& e) { return e.move.player == "bot-beginner"; },
	                                                        Duration{10000});
	ASSERT_TRUE(botMove.has_value());
	EXPECT_EQ(botMove->move.side, Side::Second);
	EXPECT_EQ(toMove(roomId), "alice");
}

TEST_F(GameServiceTest, ResignCancelsTheThinkingBot) {
	auto& service     = startService();
	const auto roomId = startBotGame("bot-beginner");
	EXPECT_EQ(toMove(roomId), "bot-beginner");
	EXPECT_EQ(service.pendingBotTurns(), 1u);

	ASSERT_TRUE(service.resign(roomId, "alice").ok());
	EXPECT_EQ(service.snapshot(roomId)->status, RoomStatus::Completed);
	EXPECT_TRUE(waitForNoBotTurns());

	// Longer than the bot's think time.
	const auto botMove = m_sink.waitFor<MoveCommittedEvent>([](const MoveCommittedEvent& e) { return e.move.player == "bot-beginner"; },
	                                                        Duration{3500});
	EXPECT_FALSE(botMove.has_value());
	EXPECT_EQ(service.pendingBotTurns(), 0u);
}

TEST_F(GameServiceTest, ExpiryCancelsTheThinkingBot) {
	auto config         = testConfig();
	config.initialTime  = Duration{300};
	config.tickInterval = Duration{1000};
	auto& service       = startService(config);
	const auto roomId   = startBotGame("bot-beginner");

	// The clock runs out long before the bot is done thinking.
	const auto expired = m_sink.waitFor<TimerExpiredEvent>([](const TimerExpiredEvent&) { return true; }, Duration{900});
	ASSERT_TRUE(expired.has_value());
	EXPECT_EQ(expired->player, "bot-beginner");

	const auto completed = m_sink.waitFor<GameCompletedEvent>([](const GameCompletedEvent&) { return true; });
	ASSERT_TRUE(completed.has_value());
	EXPECT_EQ(completed->reason, EndReason::Timeout);
	EXPECT_EQ(completed->winnerId, "alice");
	EXPECT_TRUE(waitForNoBotTurns());

	const auto botMove = m_sink.waitFor<MoveCommittedEvent>([](const MoveCommittedEvent& e) { return e.move.player == "bot-beginner"; },
	                                                        Duration{3500});
	EXPECT_FALSE(botMove.has_value());
	EXPECT_EQ(m_sink.count<GameCompletedEvent>(roomId), 1u);
	EXPECT_EQ(service.pendingBotTurns(), 0u);
}

TEST_F(GameServiceTest, BotSearchDoesNotHoldTheTimers) {
	auto config          = testConfig();
	config.workerThreads = 1u;
	auto& service        = startService(config, std::make_shared<SlowDictionary>());
	const auto roomId    = startBotGame("bot-master");
	EXPECT_EQ(service.pendingBotTurns(), 1u);

	// The search runs into its budget on the slow dictionary while the only worker keeps ticking.
	std::this_thread::sleep_for(100ms);
	const auto before = m_sink.count<TimerSyncEvent>(roomId);
	std::this_thread::sleep_for(500ms);
	EXPECT_GE(m_sink.count<TimerSyncEvent>(roomId), before + 4u);
	EXPECT_EQ(service.snapshot(roomId)->status, RoomStatus::Active);
}

} // namespace wordsmith::gtest
