#include "core/botPlayer.hpp"
#include "core/moveValidator.hpp"
#include "core/tileBag.hpp"
#include "data/memoryStore.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

namespace wordsmith::gtest {

namespace {

std::vector<Tile> rackOf(const std::string& letters) {
	std::vector<Tile> rack;
	for (const auto letter: letters) {
		rack.push_back(makeTile(letter, letter == BLANK_LETTER ? 0u : 1u));
	}
	return rack;
}

BotView viewOf(const std::string& rack, std::size_t bagCount) {
	return BotView{
	        .board             = Board(standardBoardConfig()),
	        .rack              = rackOf(rack),
	        .bagCount          = bagCount,
	        .opponentRackCount = RACK_SIZE,
	        .ownScore          = 0,
	        .opponentScore     = 0,
	        .dictionaryId      = DEFAULT_DICTIONARY_ID,
	};
}

class BotPlayerTest : public ::testing::Test {
protected:
	BotPlayerTest() : m_store(std::make_shared<MemoryStore>()), m_oracle(m_store) {
	}

	BotPlayer makeBot(std::string_view botId) {
		const auto profile = findBot(botId);
		EXPECT_TRUE(profile.has_value());
		return BotPlayer(*profile, m_oracle, 42u);
	}

	std::shared_ptr<MemoryStore> m_store;
	WordOracle m_oracle;
};

} // namespace

TEST(BotCatalog, Profiles) {
	const auto& catalog = botCatalog();
	ASSERT_EQ(catalog.size(), 6u);
	EXPECT_EQ(catalog.front().id, "bot-beginner");
	EXPECT_EQ(catalog.back().id, "bot-master");

	for (std::size_t i = 0; i < catalog.size(); ++i) {
		const auto& bot = catalog[i];
		EXPECT_GE(bot.minThink, MIN_BOT_THINK_TIME) << bot.id;
		EXPECT_LE(bot.maxThink, MAX_BOT_THINK_TIME) << bot.id;
		EXPECT_LE(bot.minThink, bot.maxThink) << bot.id;
		EXPECT_TRUE(bot.ref().isBot());
		if (i > 0u) {
			EXPECT_LE(bot.mistakeProbability, catalog[i - 1u].mistakeProbability) << bot.id;
		}
	}
	EXPECT_DOUBLE_EQ(catalog.back().mistakeProbability, 0.0);

	const auto medium = findBot("bot-medium");
	ASSERT_TRUE(medium.has_value());
	EXPECT_EQ(medium->difficulty, Difficulty::Medium);
	EXPECT_FALSE(findBot("bot-grandmaster").has_value());
}

TEST(BotCatalog, ClampThinkTime) {
	EXPECT_EQ(clampThinkTime(Duration{100}), MIN_BOT_THINK_TIME);
	EXPECT_EQ(clampThinkTime(Duration{60000}), MAX_BOT_THINK_TIME);
	EXPECT_EQ(clampThinkTime(Duration{4000}), Duration{4000});
}

TEST_F(BotPlayerTest, ThinkTimeStaysInsideTheProfile) {
	for (const auto& profile: botCatalog()) {
		BotPlayer bot(profile, m_oracle, 3u);
		for (int i = 0; i < 50; ++i) {
			const auto delay = bot.thinkTime();
			EXPECT_GE(delay, profile.minThink) << profile.id;
			EXPECT_LE(delay, profile.maxThink) << profile.id;
		}
	}
}

TEST_F(BotPlayerTest, OpeningPlayCoversTheCentre) {
	auto bot        = makeBot("bot-master");
	const auto view = viewOf("CATQQVV", 86u);

	const auto move = bot.chooseMove(view, Duration{5000});
	ASSERT_EQ(move.type, MoveType::Play);
	EXPECT_GT(bot.evaluated(), 0u);

	const auto center  = view.board.center();
	const bool covered = std::any_of(move.placements.begin(), move.placements.end(), [&](const Placement& p) { return p.position == center; });
	EXPECT_TRUE(covered);

	std::vector<Tile> tiles;
	for (const auto& p: move.placements) {
		tiles.push_back(makeTile(p.letter, 1u));
		EXPECT_FALSE(p.isBlank);
	}
	std::vector<std::string> words;
	EXPECT_GT(MoveValidator::scorePlacement(view.board, move.placements, tiles, &words), 0);
	ASSERT_FALSE(words.empty());
	for (const auto& word: words) {
		EXPECT_TRUE(m_oracle.isValid(word, DEFAULT_DICTIONARY_ID)) << word;
	}
}

TEST_F(BotPlayerTest, PlaysOffExistingTiles) {
	auto bot = makeBot("bot-hard");
	auto view = viewOf("OQQVVXX", 80u);
	view.board.setAt({7u, 6u}, makeTile('C', 3u));
	view.board.setAt({7u, 7u}, makeTile('A', 1u));
	view.board.setAt({7u, 8u}, makeTile('T', 1u));

	const auto move = bot.chooseMove(view, Duration{5000});
	ASSERT_EQ(move.type, MoveType::Play);

	std::vector<Tile> tiles;
	for (const auto& p: move.placements) {
		EXPECT_TRUE(view.board.isFree(p.position));
		tiles.push_back(makeTile(p.letter, 1u));
	}
	std::vector<std::string> words;
	MoveValidator::scorePlacement(view.board, move.placements, tiles, &words);
	ASSERT_FALSE(words.empty());
	for (const auto& word: words) {
		EXPECT_TRUE(m_oracle.isValid(word, DEFAULT_DICTIONARY_ID)) << word;
	}
}

TEST_F(BotPlayerTest, ExchangesWithoutAPlay) {
	auto bot = makeBot("bot-easy");

	const auto exchange = bot.chooseMove(viewOf("QQVVVWW", 20u));
	ASSERT_EQ(exchange.type, MoveType::Exchange);
	EXPECT_EQ(exchange.exchanged.size(), 7u);

	const auto pass = bot.chooseMove(viewOf("QQVVVWW", 6u));
	EXPECT_EQ(pass.type, MoveType::Pass);
}

TEST_F(BotPlayerTest, BlanksStayInTheRack) {
	auto bot = makeBot("bot-master");

	const auto move = bot.chooseMove(viewOf("_QQVVXX", 40u));
	ASSERT_EQ(move.type, MoveType::Exchange);
	EXPECT_EQ(move.exchanged.size(), 6u);
	EXPECT_EQ(std::count(move.exchanged.begin(), move.exchanged.end(), BLANK_LETTER), 0);
}

TEST(BotFallback, KeepsBlanksAndS) {
	const auto move = BotPlayer::fallbackMove(viewOf("SQ_VS", 50u));
	ASSERT_EQ(move.type, MoveType::Exchange);
	EXPECT_EQ(move.exchanged, (std::vector<char>{'Q', 'V'}));

	// Nothing left to throw back but keepers: exchange them all.
	const auto keepers = BotPlayer::fallbackMove(viewOf("SS_", 50u));
	ASSERT_EQ(keepers.type, MoveType::Exchange);
	EXPECT_EQ(keepers.exchanged, (std::vector<char>{'S', 'S', BLANK_LETTER}));

	EXPECT_EQ(BotPlayer::fallbackMove(viewOf("SQ_VS", 6u)).type, MoveType::Pass);
}

} // namespace wordsmith::gtest
