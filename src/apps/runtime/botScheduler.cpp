#include "wordsmith/botScheduler.hpp"

#include "logging.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <initializer_list>

namespace wordsmith::app {

static const char* toString(MoveType type) {
	switch (type) {
	case MoveType::Play:
		return "play";
	case MoveType::Exchange:
		return "exchange";
	case MoveType::Pass:
		return "pass";
	case MoveType::Challenge:
		return "challenge";
	}
	return "unknown";
}

BotScheduler::BotScheduler(asio::io_context& ioContext, WordOracle& oracle, UpdateHandler onUpdate, unsigned searchThreads, Duration searchBudget,
                           std::optional<unsigned> seed)
    : m_ioContext(ioContext), m_oracle(oracle), m_onUpdate(std::move(onUpdate)), m_searchBudget(searchBudget),
      m_rng(seed ? *seed : std::random_device{}()), m_searchPool(std::max(1u, searchThreads)) {
}

BotScheduler::~BotScheduler() {
	stop();
	m_searchPool.join();
}

void BotScheduler::schedule(const std::shared_ptr<GameRoom>& room) {
	const auto turn = room->botTurn();
	if (!turn) {
		return;
	}

	std::shared_ptr<Pending> pending;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		auto& slot = m_pending[room->id()];
		if (slot && slot->epoch == turn->epoch) {
			return;
		}
		if (slot) {
			asio::post(slot->strand, [old = slot] { old->timer.cancel(); });
		}
		slot    = std::make_shared<Pending>(m_ioContext, room->id(), turn->epoch);
		pending = slot;
	}

	Logger().Log(Logging::LogLevel::Debug, std::format("[BotScheduler] '{}' to move in room '{}' at epoch {}.", turn->profile.id, room->id(), turn->epoch));
	asio::post(m_searchPool, [this, weak = std::weak_ptr<GameRoom>(room), pending, turn = *turn] { compute(weak, pending, turn); });
}

void BotScheduler::cancel(const RoomId& roomId) {
	std::shared_ptr<Pending> pending;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto it = m_pending.find(roomId);
		if (it == m_pending.end()) {
			return;
		}
		pending = it->second;
		m_pending.erase(it);
	}

	asio::post(pending->strand, [pending] { pending->timer.cancel(); });
}

void BotScheduler::stop() {
	std::unordered_map<RoomId, std::shared_ptr<Pending>> pending;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		pending.swap(m_pending);
	}
	for (auto& [id, entry]: pending) {
		asio::post(entry->strand, [entry] { entry->timer.cancel(); });
	}
}

std::size_t BotScheduler::pending() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_pending.size();
}

void BotScheduler::compute(const std::weak_ptr<GameRoom>& weak, const std::shared_ptr<Pending>& pending, const BotTurn& turn) {
	if (!isCurrent(pending)) {
		return;
	}
	const auto started = std::chrono::steady_clock::now();

	BotPlayer bot(turn.profile, m_oracle, nextSeed());
	Move move;
	try {
		move = bot.chooseMove(turn.view, m_searchBudget);
	} catch (const DictionaryUnavailable& e) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[BotScheduler] Dictionary unavailable for '{}': {}", turn.profile.id, e.what()));
		move = BotPlayer::fallbackMove(turn.view);
	}

	// Thinking time already spent counts towards the delay.
	const auto spent = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
	const auto delay = std::max(Duration::zero(), bot.thinkTime() - spent);
	Logger().Log(Logging::LogLevel::Debug, std::format("[BotScheduler] '{}' chose {} after {} candidates, submitting in {} ms.", turn.profile.id,
	                                                   toString(move.type), bot.evaluated(), delay.count()));

	asio::post(pending->strand, [this, weak, pending, turn, move, delay] {
		pending->timer.expires_after(delay);
		pending->timer.async_wait(asio::bind_executor(pending->strand, [this, weak, pending, turn, move](asio::error_code ec) {
			if (ec) {
				return;
			}
			submit(weak, pending, turn, move);
		}));
	});
}

void BotScheduler::submit(const std::weak_ptr<GameRoom>& weak, const std::shared_ptr<Pending>& pending, const BotTurn& turn, const Move& move) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto it = m_pending.find(pending->roomId);
		if (it == m_pending.end() || it->second != pending) {
			return;
		}
		m_pending.erase(it);
	}

	const auto room = weak.lock();
	if (!room) {
		return;
	}

	const auto& botId = turn.profile.id;
	auto tried        = move.type;
	RoomUpdate update = room->submitMove(botId, move, turn.epoch);

	// Never leave the turn stuck: fall back to exchange, then pass.
	for (const auto& fallback: {BotPlayer::fallbackMove(turn.view), Move::pass()}) {
		if (update.ok() || update.error->code == MoveErrorCode::GameNotActive || fallback.type == tried) {
			continue;
		}
		Logger().Log(Logging::LogLevel::Warning, std::format("[BotScheduler] '{}' {} rejected in room '{}' with {}, trying {}.", botId, toString(tried),
		                                                     room->id(), toString(update.error->code), toString(fallback.type)));

		auto retry = room->submitMove(botId, fallback, turn.epoch);
		retry.events.insert(retry.events.begin(), update.events.begin(), update.events.end());
		update = std::move(retry);
		tried  = fallback.type;
	}

	if (!update.ok()) {
		Logger().Log(Logging::LogLevel::Debug,
		             std::format("[BotScheduler] Turn of '{}' in room '{}' dropped: {}", botId, room->id(), toString(update.error->code)));
	}
	m_onUpdate(room, update);
}

bool BotScheduler::isCurrent(const std::shared_ptr<Pending>& pending) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	const auto it = m_pending.find(pending->roomId);
	return it != m_pending.end() && it->second == pending;
}

unsigned BotScheduler::nextSeed() {
	std::lock_guard<std::mutex> lock(m_mutex);
	return static_cast<unsigned>(m_rng());
}

} // namespace wordsmith::app
