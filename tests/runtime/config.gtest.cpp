#include "wordsmith/config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace wordsmith::gtest {

TEST(ServerConfig, Defaults) {
	const auto config = app::parseArguments({});
	EXPECT_EQ(config.port, network::DEFAULT_PORT);
	EXPECT_EQ(config.workerThreads, app::DEFAULT_WORKER_THREADS);
	EXPECT_EQ(config.botThreads, app::DEFAULT_BOT_THREADS);
	EXPECT_EQ(config.initialTime, DEFAULT_INITIAL_TIME);
	EXPECT_EQ(config.passLimit, DEFAULT_PASS_LIMIT);
	EXPECT_TRUE(config.autoStart);

	const auto settings = config.roomSettings();
	EXPECT_EQ(settings.initialTime, DEFAULT_INITIAL_TIME);
	EXPECT_EQ(settings.language, DEFAULT_LANGUAGE);
	EXPECT_TRUE(settings.shuffleBag);
	EXPECT_FALSE(settings.seed.has_value());
}

TEST(ServerConfig, ParseArguments) {
	const auto config = app::parseArguments({"--port=0", "--workers=4", "--bot-threads=3", "--tick-ms=250", "--time-ms=90000",
	                                         "--pass-limit=4", "--disconnect-grace-ms=5000", "--auto-start=off", "--language=en", "--oracle-cache=16",
	                                         "--oracle-timeout-ms=200", "--finished-grace-ms=1000", "--dictionary=2", "--board=1"});
	EXPECT_EQ(config.port, 0u);
	EXPECT_EQ(config.workerThreads, 4u);
	EXPECT_EQ(config.botThreads, 3u);
	EXPECT_EQ(config.tickInterval, Duration{250});
	EXPECT_EQ(config.initialTime, Duration{90000});
	EXPECT_EQ(config.passLimit, 4u);
	EXPECT_EQ(config.disconnectGrace, Duration{5000});
	EXPECT_FALSE(config.autoStart);
	EXPECT_EQ(config.oracleCacheCapacity, 16u);
	EXPECT_EQ(config.oracleTimeout, Duration{200});
	EXPECT_EQ(config.finishedRoomGrace, Duration{1000});
	EXPECT_EQ(config.dictionaryId, 2u);

	const auto settings = config.roomSettings();
	EXPECT_EQ(settings.passLimit, 4u);
	EXPECT_EQ(settings.disconnectGrace, Duration{5000});
	EXPECT_EQ(settings.dictionaryId, 2u);
	EXPECT_FALSE(settings.autoStart);
}

TEST(ServerConfig, ParseArgumentsInvalid) {
	EXPECT_THROW(app::parseArguments({"port=1"}), std::invalid_argument);
	EXPECT_THROW(app::parseArguments({"--port"}), std::invalid_argument);
	EXPECT_THROW(app::parseArguments({"--colour=red"}), std::invalid_argument);
	EXPECT_THROW(app::parseArguments({"--port=70000"}), std::invalid_argument);
	EXPECT_THROW(app::parseArguments({"--port=12a"}), std::invalid_argument);
	EXPECT_THROW(app::parseArguments({"--port="}), std::invalid_argument);
	EXPECT_THROW(app::parseArguments({"--workers=0"}), std::invalid_argument);
	EXPECT_THROW(app::parseArguments({"--bot-threads=0"}), std::invalid_argument);
	EXPECT_THROW(app::parseArguments({"--auto-start=maybe"}), std::invalid_argument);
	EXPECT_THROW(app::parseArguments({"--time-ms=-5"}), std::invalid_argument);
}

TEST(ServerConfig, Usage) {
	const auto text = app::usage("wordsmith_server");
	EXPECT_EQ(text.rfind("Usage: wordsmith_server", 0), 0u);
	EXPECT_NE(text.find("--port=<n>"), std::string::npos);
	EXPECT_NE(text.find("--oracle-timeout-ms=<ms>"), std::string::npos);
}

} // namespace wordsmith::gtest
