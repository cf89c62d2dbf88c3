#include "wordsmith/nwEvents.hpp"

#include "data/memoryStore.hpp"

#include <gtest/gtest.h>

#include <optional>

namespace wordsmith::gtest {

TEST(WordsmithMessages, ClientToMessage) {
	EXPECT_EQ(app::toMessage(app::ClientJoin{"alice", std::nullopt}), "JOIN:alice");
	EXPECT_EQ(app::toMessage(app::ClientJoin{"alice", "room-3"}), "JOIN:alice,room-3");
	EXPECT_EQ(app::toMessage(app::ClientStart{}), "START");
	EXPECT_EQ(app::toMessage(app::ClientPlay{{{{7u, 7u}, 'C', false}, {{7u, 8u}, 'A', true}}}), "PLAY:7,7,C;7,8,a");
	EXPECT_EQ(app::toMessage(app::ClientExchange{{'Q', BLANK_LETTER}}), "EXCHANGE:Q_");
	EXPECT_EQ(app::toMessage(app::ClientPass{}), "PASS");
	EXPECT_EQ(app::toMessage(app::ClientChallenge{}), "CHALLENGE");
	EXPECT_EQ(app::toMessage(app::ClientResign{}), "RESIGN");
	EXPECT_EQ(app::toMessage(app::ClientBot{"bot-easy"}), "BOT:bot-easy");
	EXPECT_EQ(app::toMessage(app::ClientPing{}), "PING");
}

TEST(WordsmithMessages, ClientFromMessageValid) {
	const auto join = app::fromClientMessage("JOIN:alice,room-3");
	ASSERT_TRUE(join.has_value());
	ASSERT_TRUE(std::holds_alternative<app::ClientJoin>(*join));
	const auto joinEvent = std::get<app::ClientJoin>(*join);
	EXPECT_EQ(joinEvent.userId, "alice");
	EXPECT_EQ(joinEvent.roomId, std::optional<RoomId>{"room-3"});

	const auto matchmaking = app::fromClientMessage("JOIN:bob");
	ASSERT_TRUE(matchmaking.has_value());
	EXPECT_FALSE(std::get<app::ClientJoin>(*matchmaking).roomId.has_value());

	const auto play = app::fromClientMessage("PLAY:7,7,C;7,8,a;7,9,T");
	ASSERT_TRUE(play.has_value());
	ASSERT_TRUE(std::holds_alternative<app::ClientPlay>(*play));
	const auto& placements = std::get<app::ClientPlay>(*play).placements;
	ASSERT_EQ(placements.size(), 3u);
	EXPECT_EQ(placements[0], (Placement{{7u, 7u}, 'C', false}));
	EXPECT_EQ(placements[1], (Placement{{7u, 8u}, 'A', true}));
	EXPECT_EQ(placements[2], (Placement{{7u, 9u}, 'T', false}));

	const auto exchange = app::fromClientMessage("EXCHANGE:QV_");
	ASSERT_TRUE(exchange.has_value());
	ASSERT_TRUE(std::holds_alternative<app::ClientExchange>(*exchange));
	EXPECT_EQ(std::get<app::ClientExchange>(*exchange).letters, (std::vector<char>{'Q', 'V', BLANK_LETTER}));

	const auto bot = app::fromClientMessage("BOT:bot-master");
	ASSERT_TRUE(bot.has_value());
	ASSERT_TRUE(std::holds_alternative<app::ClientBot>(*bot));
	EXPECT_EQ(std::get<app::ClientBot>(*bot).botId, "bot-master");

	EXPECT_TRUE(std::holds_alternative<app::ClientStart>(app::fromClientMessage("START").value()));
	EXPECT_TRUE(std::holds_alternative<app::ClientPass>(app::fromClientMessage("PASS").value()));
	EXPECT_TRUE(std::holds_alternative<app::ClientChallenge>(app::fromClientMessage("CHALLENGE").value()));
	EXPECT_TRUE(std::holds_alternative<app::ClientResign>(app::fromClientMessage("RESIGN").value()));
	EXPECT_TRUE(std::holds_alternative<app::ClientPing>(app::fromClientMessage("PING").value()));
}

TEST(WordsmithMessages, ClientRoundTrip) {
	const app::ClientPlay play{{{{0u, 14u}, 'Z', false}, {{1u, 14u}, 'O', true}}};
	const auto parsed = app::fromClientMessage(app::toMessage(play));
	ASSERT_TRUE(parsed.has_value());
	EXPECT_EQ(std::get<app::ClientPlay>(*parsed).placements, play.placements);
}

TEST(WordsmithMessages, ClientFromMessageInvalid) {
	EXPECT_FALSE(app::fromClientMessage("").has_value());
	EXPECT_FALSE(app::fromClientMessage("UNKNOWN").has_value());
	EXPECT_FALSE(app::fromClientMessage("pass").has_value());
	EXPECT_FALSE(app::fromClientMessage("PASS:now").has_value());

	EXPECT_FALSE(app::fromClientMessage("JOIN:").has_value());
	EXPECT_FALSE(app::fromClientMessage("JOIN:alice,").has_value());
	EXPECT_FALSE(app::fromClientMessage("JOIN:alice,room,2").has_value());
	EXPECT_FALSE(app::fromClientMessage("JOIN:al|ice").has_value());
	EXPECT_FALSE(app::fromClientMessage("JOIN:a=b").has_value());

	EXPECT_FALSE(app::fromClientMessage("PLAY:").has_value());
	EXPECT_FALSE(app::fromClientMessage("PLAY:7,7").has_value());
	EXPECT_FALSE(app::fromClientMessage("PLAY:7,7,AB").has_value());
	EXPECT_FALSE(app::fromClientMessage("PLAY:7,x,A").has_value());
	EXPECT_FALSE(app::fromClientMessage("PLAY:-1,7,A").has_value());
	EXPECT_FALSE(app::fromClientMessage("PLAY:7,7,1").has_value());
	EXPECT_FALSE(app::fromClientMessage("PLAY:7,7,A;").has_value());

	EXPECT_FALSE(app::fromClientMessage("EXCHANGE:").has_value());
	EXPECT_FALSE(app::fromClientMessage("EXCHANGE:qv").has_value());
	EXPECT_FALSE(app::fromClientMessage("EXCHANGE:Q1").has_value());

	EXPECT_FALSE(app::fromClientMessage("BOT:").has_value());
	EXPECT_FALSE(app::fromClientMessage("BOT:bot;easy").has_value());
}

TEST(WordsmithMessages, ServerToMessage) {
	EXPECT_EQ(app::toMessage(app::ServerJoined{"room-1", Side::Second}), "JOINED:room-1,1");
	EXPECT_EQ(app::toMessage(app::ServerError{MoveError{MoveErrorCode::NotYourTurn}}), "ERROR:NOT_YOUR_TURN");
	EXPECT_EQ(app::toMessage(app::ServerError{MoveError{MoveErrorCode::InvalidWord, "TAC"}}), "ERROR:INVALID_WORD,TAC");
	EXPECT_EQ(app::toMessage(app::ServerError{std::nullopt}), "ERROR:MALFORMED");
	EXPECT_EQ(app::toMessage(app::ServerPong{}), "PONG");
}

TEST(WordsmithMessages, RoomEventToMessage) {
	const CommittedMove move{
	        .moveNumber     = 3u,
	        .type           = MoveType::Play,
	        .side           = Side::First,
	        .player         = "alice",
	        .placements     = {{{7u, 7u}, 'C', false}, {{7u, 8u}, 'A', true}},
	        .exchangedCount = 0u,
	        .words          = {"CA", "AT"},
	        .score          = 5,
	        .timestamp      = WallTime{},
	};
	EXPECT_EQ(app::toMessage(MoveCommittedEvent{move}), "MOVE:n=3,side=0,player=alice,type=play,score=5,words=CA;AT,tiles=7,7,C;7,8,a,exchanged=0");

	EXPECT_EQ(app::toMessage(TurnChangedEvent{Side::Second, "bot-easy"}), "TURN:1,bot-easy");
	EXPECT_EQ(app::toMessage(TimerSyncEvent{Duration{598000}, Duration{600000}, Side::First, false}), "TIMER:598000,600000,0,0");
	EXPECT_EQ(app::toMessage(TimerExpiredEvent{Side::First, "alice"}), "EXPIRED:0,alice");
	EXPECT_EQ(app::toMessage(ChallengeResolvedEvent{Side::Second, true, 3u, "CA", 5}), "CHALLENGE:challenger=1,upheld=1,move=3,word=CA,removed=5");

	EXPECT_EQ(app::toMessage(GameCompletedEvent{
	                  .status   = RoomStatus::Completed,
	                  .reason   = EndReason::Timeout,
	                  .winner   = Side::Second,
	                  .winnerId = "bob",
	                  .scores   = {12, 30},
	                  .detail   = {},
	          }),
	          "COMPLETED:status=completed,reason=timeout,winner=1,winnerId=bob,scores=12|30");
	EXPECT_EQ(app::toMessage(GameCompletedEvent{
	                  .status   = RoomStatus::Abandoned,
	                  .reason   = EndReason::Aborted,
	                  .winner   = std::nullopt,
	                  .winnerId = {},
	                  .scores   = {0, 0},
	                  .detail   = "Rack of 'a' holds 8 tiles.",
	          }),
	          "COMPLETED:status=abandoned,reason=aborted,winner=-,winnerId=,scores=0|0,detail=Rack of 'a' holds 8 tiles.");
}

TEST(WordsmithMessages, SnapshotOnlyRevealsTheViewersRack) {
	auto board       = makeBoardConfig({"...", ".*.", "..."});
	board[1][1].tile = Tile{'C', 3u, false};
	board[1][2].tile = Tile{'A', 0u, true};

	RoomSnapshot snapshot{
	        .id                = "room-1",
	        .status            = RoomStatus::Active,
	        .board             = board,
	        .players           = {},
	        .current           = Side::Second,
	        .consecutivePasses = 0u,
	        .moveNumber        = 1u,
	        .bagCount          = 86u,
	        .epoch             = 4u,
	        .endReason         = EndReason::None,
	        .winner            = std::nullopt,
	        .createdAt         = WallTime{},
	};
	snapshot.players[0] = PlayerView{
	        .ref           = PlayerRef{.kind = PlayerRef::Kind::Human, .id = "alice", .name = "Alice"},
	        .score         = 10,
	        .timeRemaining = Duration{590000},
	        .isCurrentTurn = false,
	        .connected     = true,
	        .rack          = {Tile{'E', 1u, false}, Tile{BLANK_LETTER, 0u, true}},
	};
	const StateSnapshotEvent event{snapshot};

	EXPECT_EQ(app::toMessage(event, PlayerId{"alice"}),
	          "STATE:room=room-1,status=active,epoch=4,move=1,passes=0,bag=86,turn=1,reason=none,winner=-,p0=alice|human|10|590000|1,rack=E_,p1=-,"
	          "board=.../.Ca/...");
	EXPECT_EQ(app::toMessage(event, PlayerId{"bob"}),
	          "STATE:room=room-1,status=active,epoch=4,move=1,passes=0,bag=86,turn=1,reason=none,winner=-,p0=alice|human|10|590000|1,p1=-,"
	          "board=.../.Ca/...");
	EXPECT_EQ(app::toMessage(event), app::toMessage(event, PlayerId{"bob"}));
}

} // namespace wordsmith::gtest
