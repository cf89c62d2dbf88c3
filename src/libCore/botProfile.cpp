#include "core/botProfile.hpp"

#include <algorithm>

namespace wordsmith {

static BotProfile makeProfile(PlayerId id, std::string name, Difficulty difficulty, Duration minThink, Duration maxThink, double mistakes,
                              StrategyWeights weights) {
	const auto lower = clampThinkTime(minThink);
	const auto upper = std::max(lower, clampThinkTime(maxThink));
	return BotProfile{
	        .id                 = std::move(id),
	        .name               = std::move(name),
	        .difficulty         = difficulty,
	        .minThink           = lower,
	        .maxThink           = upper,
	        .mistakeProbability = std::clamp(mistakes, 0.0, 1.0),
	        .weights            = weights,
	};
}

const std::vector<BotProfile>& botCatalog() {
	using D = Difficulty;
	static const std::vector<BotProfile> catalog{
	        makeProfile("bot-beginner", "Robo Rookie", D::Beginner, Duration{2000}, Duration{3000}, 0.30, {1.0, 0.0, 0.0, 0.0, 0.0, 1.0}),
	        makeProfile("bot-easy", "Clevertron", D::Easy, Duration{2500}, Duration{4000}, 0.20, {2.0, 0.5, 0.5, 0.0, 0.0, 1.0}),
	        makeProfile("bot-medium", "LexiBot", D::Medium, Duration{3000}, Duration{5000}, 0.10, {3.0, 1.0, 1.0, 1.0, 1.0, 2.0}),
	        makeProfile("bot-hard", "Tournament Player", D::Hard, Duration{5000}, Duration{8000}, 0.05, {4.0, 2.0, 2.0, 2.0, 2.0, 3.0}),
	        makeProfile("bot-expert", "Expert Bot", D::Expert, Duration{6000}, Duration{10000}, 0.02, {5.0, 3.0, 3.0, 3.0, 3.0, 4.0}),
	        makeProfile("bot-master", "Scrabble Master", D::Master, Duration{8000}, Duration{15000}, 0.00, {5.0, 4.0, 4.0, 3.0, 4.0, 5.0}),
	};
	return catalog;
}

std::optional<BotProfile> findBot(std::string_view botId) {
	const auto& catalog = botCatalog();
	const auto it       = std::find_if(catalog.begin(), catalog.end(), [&](const BotProfile& p) { return p.id == botId; });
	if (it == catalog.end()) {
		return std::nullopt;
	}
	return *it;
}

Duration clampThinkTime(Duration delay) {
	return std::clamp(delay, MIN_BOT_THINK_TIME, MAX_BOT_THINK_TIME);
}

} // namespace wordsmith
