#include "wordsmith/gameServer.hpp"

#include "data/memoryStore.hpp"
#include "network/tcpClient.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace wordsmith::gtest {

namespace {

app::ServerConfig serverConfig() {
	app::ServerConfig config;
	config.port          = 0u;
	config.workerThreads = 1u;
	config.tickInterval  = Duration{600000};
	return config;
}

bool startsWith(const std::optional<network::Message>& message, const std::string& prefix) {
	return message && message->rfind(prefix, 0) == 0;
}

class GameServerTest : public ::testing::Test {
protected:
	GameServerTest() : m_server(serverConfig(), std::make_shared<MemoryStore>()) {
		m_server.start();
	}
	~GameServerTest() override {
		m_server.stop();
	}

	void connect(network::TcpClient& client) {
		ASSERT_TRUE(client.connect("127.0.0.1", m_server.port()));
	}

	app::GameServer m_server;
};

} // namespace

TEST_F(GameServerTest, JoinPingAndMalformed) {
	network::TcpClient alice;
	connect(alice);

	ASSERT_TRUE(alice.send("JOIN:alice"));
	EXPECT_EQ(alice.read().value_or(""), "JOINED:room-1,0");
	const auto state = alice.read();
	ASSERT_TRUE(startsWith(state, "STATE:room=room-1,status=waiting,"));
	EXPECT_NE(state->find(",p0=alice|human|0|600000|1,rack="), std::string::npos);
	EXPECT_NE(state->find(",p1=-,"), std::string::npos);

	ASSERT_TRUE(alice.send("PING"));
	EXPECT_EQ(alice.read().value_or(""), "PONG");

	ASSERT_TRUE(alice.send("HELLO"));
	EXPECT_EQ(alice.read().value_or(""), "ERROR:MALFORMED");

	ASSERT_TRUE(alice.send("PASS"));
	EXPECT_EQ(alice.read().value_or(""), "ERROR:GAME_NOT_ACTIVE");

	ASSERT_TRUE(alice.send("BOT:bot-nobody"));
	EXPECT_EQ(alice.read().value_or(""), "ERROR:UNKNOWN_BOT");
}

TEST_F(GameServerTest, CommandsNeedARoom) {
	network::TcpClient carol;
	connect(carol);

	ASSERT_TRUE(carol.send("PASS"));
	EXPECT_EQ(carol.read().value_or(""), "ERROR:ROOM_NOT_FOUND");
	ASSERT_TRUE(carol.send("RESIGN"));
	EXPECT_EQ(carol.read().value_or(""), "ERROR:ROOM_NOT_FOUND");

	ASSERT_TRUE(carol.send("JOIN:carol,nowhere"));
	EXPECT_EQ(carol.read().value_or(""), "ERROR:ROOM_NOT_FOUND");

	// Pings are answered without a room.
	ASSERT_TRUE(carol.send("PING"));
	EXPECT_EQ(carol.read().value_or(""), "PONG");
}

TEST_F(GameServerTest, EventsReachBothPlayers) {
	network::TcpClient alice;
	network::TcpClient bob;
	connect(alice);
	connect(bob);

	ASSERT_TRUE(alice.send("JOIN:alice"));
	ASSERT_TRUE(startsWith(alice.read(), "JOINED:room-1,0"));
	ASSERT_TRUE(startsWith(alice.read(), "STATE:"));

	ASSERT_TRUE(bob.send("JOIN:bob,room-1"));
	EXPECT_EQ(bob.read().value_or(""), "JOINED:room-1,1");
	const auto snapshot = m_server.service().snapshot("room-1");
	ASSERT_TRUE(snapshot.has_value());
	const auto turn = snapshot->current == Side::First ? std::string{"TURN:0,alice"} : std::string{"TURN:1,bob"};
	// The joiner completing the room is told whose turn it is.
	EXPECT_EQ(bob.read().value_or(""), turn);
	const auto bobState = bob.read();
	ASSERT_TRUE(startsWith(bobState, "STATE:room=room-1,status=active,"));
	EXPECT_NE(bobState->find(",p1=bob|human|0|"), std::string::npos);
	EXPECT_GT(bobState->find(",rack="), bobState->find(",p1=bob"));
	EXPECT_EQ(bobState->find(",rack="), bobState->rfind(",rack="));

	// The first player learns about the start through the broadcast.
	EXPECT_EQ(alice.read().value_or(""), turn);
	const auto aliceState = alice.read();
	ASSERT_TRUE(startsWith(aliceState, "STATE:room=room-1,status=active,"));
	EXPECT_NE(aliceState->find(",p0=alice|human|0|"), std::string::npos);
	EXPECT_LT(aliceState->find(",rack="), aliceState->find(",p1=bob"));
	EXPECT_EQ(aliceState->find(",rack="), aliceState->rfind(",rack="));

	ASSERT_TRUE(alice.send("RESIGN"));
	EXPECT_EQ(alice.read().value_or(""), "COMPLETED:status=completed,reason=resignation,winner=1,winnerId=bob,scores=0|0");
	EXPECT_EQ(bob.read().value_or(""), "COMPLETED:status=completed,reason=resignation,winner=1,winnerId=bob,scores=0|0");
	EXPECT_TRUE(startsWith(alice.read(), "STATE:room=room-1,status=completed,"));
	EXPECT_TRUE(startsWith(bob.read(), "STATE:room=room-1,status=completed,"));
}

TEST_F(GameServerTest, DisconnectReachesTheRoom) {
	network::TcpClient alice;
	network::TcpClient bob;
	connect(alice);
	connect(bob);

	ASSERT_TRUE(alice.send("JOIN:alice"));
	ASSERT_TRUE(startsWith(alice.read(), "JOINED:"));
	ASSERT_TRUE(startsWith(alice.read(), "STATE:"));
	ASSERT_TRUE(bob.send("JOIN:bob"));
	ASSERT_TRUE(startsWith(bob.read(), "JOINED:"));
	ASSERT_TRUE(startsWith(bob.read(), "TURN:"));
	ASSERT_TRUE(startsWith(bob.read(), "STATE:"));
	ASSERT_TRUE(startsWith(alice.read(), "TURN:"));
	ASSERT_TRUE(startsWith(alice.read(), "STATE:"));

	bob.disconnect();

	// Alice sees bob's seat go offline.
	const auto state = alice.read();
	ASSERT_TRUE(startsWith(state, "STATE:"));
	EXPECT_NE(state->find(",p1=bob|human|0|"), std::string::npos);
	// The connected flag closes the entry of the seat.
	const auto board = state->find(",board=");
	ASSERT_NE(board, std::string::npos);
	EXPECT_EQ(state->at(board - 1u), '0');

	const auto snapshot = m_server.service().snapshot("room-1");
	ASSERT_TRUE(snapshot.has_value());
	EXPECT_FALSE(snapshot->players[1]->connected);
}

} // namespace wordsmith::gtest
