#include "wordsmith/nwEvents.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <string_view>

namespace wordsmith::app {

static constexpr std::string_view CLIENT_JOIN      = "JOIN:";
static constexpr std::string_view CLIENT_START     = "START";
static constexpr std::string_view CLIENT_PLAY      = "PLAY:";
static constexpr std::string_view CLIENT_EXCHANGE  = "EXCHANGE:";
static constexpr std::string_view CLIENT_PASS      = "PASS";
static constexpr std::string_view CLIENT_CHALLENGE = "CHALLENGE";
static constexpr std::string_view CLIENT_RESIGN    = "RESIGN";
static constexpr std::string_view CLIENT_BOT       = "BOT:";
static constexpr std::string_view CLIENT_PING      = "PING";

static constexpr std::string_view SERVER_JOINED    = "JOINED:";
static constexpr std::string_view SERVER_STATE     = "STATE:";
static constexpr std::string_view SERVER_MOVE      = "MOVE:";
static constexpr std::string_view SERVER_TURN      = "TURN:";
static constexpr std::string_view SERVER_TIMER     = "TIMER:";
static constexpr std::string_view SERVER_EXPIRED   = "EXPIRED:";
static constexpr std::string_view SERVER_COMPLETED = "COMPLETED:";
static constexpr std::string_view SERVER_CHALLENGE = "CHALLENGE:";
static constexpr std::string_view SERVER_ERROR     = "ERROR:";
static constexpr std::string_view SERVER_PONG      = "PONG";
static constexpr std::string_view MALFORMED        = "MALFORMED";

static constexpr std::string_view RESERVED = ",;|=:/"; //!< Separators that may not appear in ids.

static const char* toString(RoomStatus status) {
	switch (status) {
	case RoomStatus::Waiting:
		return "waiting";
	case RoomStatus::Active:
		return "active";
	case RoomStatus::Paused:
		return "paused";
	case RoomStatus::Completed:
		return "completed";
	case RoomStatus::Abandoned:
		return "abandoned";
	}
	return "unknown";
}

static const char* toString(EndReason reason) {
	switch (reason) {
	case EndReason::None:
		return "none";
	case EndReason::PassLimit:
		return "pass_limit";
	case EndReason::OutOfTiles:
		return "out_of_tiles";
	case EndReason::Timeout:
		return "timeout";
	case EndReason::Resignation:
		return "resignation";
	case EndReason::Disconnect:
		return "disconnect";
	case EndReason::Aborted:
		return "aborted";
	}
	return "unknown";
}

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

static std::string toString(std::optional<Side> side) {
	return side ? std::to_string(index(*side)) : std::string{"-"};
}

//! Board letter of a placed tile. Blanks are sent in lower case.
static char wireLetter(char letter, bool isBlank) {
	return isBlank ? static_cast<char>(std::tolower(static_cast<unsigned char>(letter))) : letter;
}

static std::string encodePlacements(const std::vector<Placement>& placements) {
	std::string out;
	for (std::size_t i = 0; i < placements.size(); ++i) {
		if (i > 0u) {
			out.push_back(';');
		}
		const auto& p = placements[i];
		out += std::format("{},{},{}", p.position.row, p.position.col, wireLetter(p.letter, p.isBlank));
	}
	return out;
}

static std::string encodeRack(const std::vector<Tile>& rack) {
	std::string out;
	out.reserve(rack.size());
	for (const auto& tile: rack) {
		out.push_back(tile.isBlank ? BLANK_LETTER : tile.letter);
	}
	return out;
}

static std::string encodeBoard(const CellGrid& board) {
	std::string out;
	out.reserve(board.size() * (board.size() + 1u));
	for (std::size_t row = 0; row < board.size(); ++row) {
		if (row > 0u) {
			out.push_back('/');
		}
		for (const auto& cell: board[row]) {
			out.push_back(cell.tile ? wireLetter(cell.tile->letter, cell.tile->isBlank) : '.');
		}
	}
	return out;
}

static std::string encodeWords(const std::vector<std::string>& words) {
	std::string out;
	for (std::size_t i = 0; i < words.size(); ++i) {
		if (i > 0u) {
			out.push_back(';');
		}
		out += words[i];
	}
	return out;
}

static std::string toMessage(const ClientJoin& e) {
	return e.roomId ? std::format("{}{},{}", CLIENT_JOIN, e.userId, *e.roomId) : std::format("{}{}", CLIENT_JOIN, e.userId);
}
static std::string toMessage(const ClientStart&) {
	return std::string{CLIENT_START};
}
static std::string toMessage(const ClientPlay& e) {
	return std::format("{}{}", CLIENT_PLAY, encodePlacements(e.placements));
}
static std::string toMessage(const ClientExchange& e) {
	return std::format("{}{}", CLIENT_EXCHANGE, std::string(e.letters.begin(), e.letters.end()));
}
static std::string toMessage(const ClientPass&) {
	return std::string{CLIENT_PASS};
}
static std::string toMessage(const ClientChallenge&) {
	return std::string{CLIENT_CHALLENGE};
}
static std::string toMessage(const ClientResign&) {
	return std::string{CLIENT_RESIGN};
}
static std::string toMessage(const ClientBot& e) {
	return std::format("{}{}", CLIENT_BOT, e.botId);
}
static std::string toMessage(const ClientPing&) {
	return std::string{CLIENT_PING};
}

std::string toMessage(ClientEvent event) {
	return std::visit([&](auto&& ev) { return toMessage(ev); }, event);
}

static std::string toMessage(const ServerJoined& e) {
	return std::format("{}{},{}", SERVER_JOINED, e.roomId, index(e.side));
}
static std::string toMessage(const ServerError& e) {
	if (!e.error) {
		return std::format("{}{}", SERVER_ERROR, MALFORMED);
	}
	if (e.error->word.empty()) {
		return std::format("{}{}", SERVER_ERROR, toString(e.error->code));
	}
	return std::format("{}{},{}", SERVER_ERROR, toString(e.error->code), e.error->word);
}
static std::string toMessage(const ServerPong&) {
	return std::string{SERVER_PONG};
}

std::string toMessage(ServerEvent event) {
	return std::visit([&](auto&& ev) { return toMessage(ev); }, event);
}

static std::string toMessage(const StateSnapshotEvent& e, const std::optional<PlayerId>& viewer) {
	const auto& s = e.snapshot;

	std::string payload;
	payload.reserve(512);
	payload += std::format("room={},status={},epoch={},move={},passes={},bag={},turn={},reason={},winner={}", s.id, toString(s.status), s.epoch,
	                       s.moveNumber, s.consecutivePasses, s.bagCount, index(s.current), toString(s.endReason), toString(s.winner));

	for (std::size_t i = 0; i < s.players.size(); ++i) {
		const auto& player = s.players[i];
		if (!player) {
			payload += std::format(",p{}=-", i);
			continue;
		}
		payload += std::format(",p{}={}|{}|{}|{}|{}", i, player->ref.id, player->ref.isBot() ? "bot" : "human", player->score,
		                       player->timeRemaining.count(), player->connected ? 1 : 0);
		if (viewer && player->ref.id == *viewer) {
			payload += std::format(",rack={}", encodeRack(player->rack));
		}
	}
	payload += std::format(",board={}", encodeBoard(s.board));

	payload.insert(0, SERVER_STATE);
	return payload;
}
static std::string toMessage(const MoveCommittedEvent& e, const std::optional<PlayerId>&) {
	const auto& m = e.move;
	return std::format("{}n={},side={},player={},type={},score={},words={},tiles={},exchanged={}", SERVER_MOVE, m.moveNumber, index(m.side), m.player,
	                   toString(m.type), m.score, encodeWords(m.words), encodePlacements(m.placements), m.exchangedCount);
}
static std::string toMessage(const TurnChangedEvent& e, const std::optional<PlayerId>&) {
	return std::format("{}{},{}", SERVER_TURN, index(e.side), e.player);
}
static std::string toMessage(const TimerSyncEvent& e, const std::optional<PlayerId>&) {
	return std::format("{}{},{},{},{}", SERVER_TIMER, e.first.count(), e.second.count(), index(e.running), e.paused ? 1 : 0);
}
static std::string toMessage(const TimerExpiredEvent& e, const std::optional<PlayerId>&) {
	return std::format("{}{},{}", SERVER_EXPIRED, index(e.side), e.player);
}
static std::string toMessage(const GameCompletedEvent& e, const std::optional<PlayerId>&) {
	auto payload = std::format("{}status={},reason={},winner={},winnerId={},scores={}|{}", SERVER_COMPLETED, toString(e.status), toString(e.reason),
	                           toString(e.winner), e.winnerId, e.scores[0], e.scores[1]);
	// Free text goes last so it may contain separators.
	if (!e.detail.empty()) {
		payload += std::format(",detail={}", e.detail);
	}
	return payload;
}
static std::string toMessage(const ChallengeResolvedEvent& e, const std::optional<PlayerId>&) {
	return std::format("{}challenger={},upheld={},move={},word={},removed={}", SERVER_CHALLENGE, index(e.challenger), e.upheld ? 1 : 0, e.challengedMove,
	                   e.invalidWord, e.scoreRemoved);
}

std::string toMessage(const RoomEvent& event, const std::optional<PlayerId>& viewer) {
	return std::visit([&](auto&& ev) { return toMessage(ev, viewer); }, event);
}

static bool parseUnsigned(std::string_view value, unsigned& out) {
	if (value.empty()) {
		return false;
	}
	const auto* end      = value.data() + value.size();
	const auto [ptr, ec] = std::from_chars(value.data(), end, out);
	return ec == std::errc() && ptr == end;
}

static bool isIdentifier(std::string_view value) {
	return !value.empty() && value.find_first_of(RESERVED) == std::string_view::npos;
}

//! Parses "r,c,L" where a lower case L marks a blank.
static std::optional<Placement> parsePlacement(std::string_view token) {
	const auto first  = token.find(',');
	const auto second = first == std::string_view::npos ? first : token.find(',', first + 1);
	if (second == std::string_view::npos) {
		return {};
	}

	Placement placement{};
	if (!parseUnsigned(token.substr(0, first), placement.position.row) || !parseUnsigned(token.substr(first + 1, second - first - 1), placement.position.col)) {
		return {};
	}

	const auto letter = token.substr(second + 1);
	if (letter.size() != 1u || !std::isalpha(static_cast<unsigned char>(letter.front()))) {
		return {};
	}
	placement.isBlank = std::islower(static_cast<unsigned char>(letter.front())) != 0;
	placement.letter  = static_cast<char>(std::toupper(static_cast<unsigned char>(letter.front())));
	return placement;
}

static std::optional<ClientEvent> fromPlayMessage(std::string_view payload) {
	ClientPlay play;
	std::size_t start = 0;
	while (start <= payload.size()) {
		const auto end       = payload.find(';', start);
		const auto token     = payload.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
		const auto placement = parsePlacement(token);
		if (!placement) {
			return {};
		}
		play.placements.push_back(*placement);
		if (end == std::string_view::npos) {
			break;
		}
		start = end + 1;
	}
	return play;
}

static std::optional<ClientEvent> fromExchangeMessage(std::string_view payload) {
	if (payload.empty()) {
		return {};
	}

	ClientExchange exchange;
	for (const char c: payload) {
		if (c != BLANK_LETTER && !std::isupper(static_cast<unsigned char>(c))) {
			return {};
		}
		exchange.letters.push_back(c);
	}
	return exchange;
}

std::optional<ClientEvent> fromClientMessage(const std::string& message) {
	const std::string_view view(message);

	if (view.starts_with(CLIENT_JOIN)) {
		// Expect "JOIN:userId[,roomId]"
		const auto payload  = view.substr(CLIENT_JOIN.size());
		const auto commaPos = payload.find(',');
		const auto userId   = payload.substr(0, commaPos);
		if (!isIdentifier(userId)) {
			return {};
		}
		if (commaPos == std::string_view::npos) {
			return ClientJoin{.userId = std::string(userId), .roomId = std::nullopt};
		}

		const auto roomId = payload.substr(commaPos + 1);
		if (!isIdentifier(roomId)) {
			return {};
		}
		return ClientJoin{.userId = std::string(userId), .roomId = std::string(roomId)};
	}

	if (view.starts_with(CLIENT_PLAY)) {
		return fromPlayMessage(view.substr(CLIENT_PLAY.size()));
	}

	if (view.starts_with(CLIENT_EXCHANGE)) {
		return fromExchangeMessage(view.substr(CLIENT_EXCHANGE.size()));
	}

	if (view.starts_with(CLIENT_BOT)) {
		const auto botId = view.substr(CLIENT_BOT.size());
		if (!isIdentifier(botId)) {
			return {};
		}
		return ClientBot{.botId = std::string(botId)};
	}

	if (view == CLIENT_START) {
		return ClientStart{};
	}
	if (view == CLIENT_PASS) {
		return ClientPass{};
	}
	if (view == CLIENT_CHALLENGE) {
		return ClientChallenge{};
	}
	if (view == CLIENT_RESIGN) {
		return ClientResign{};
	}
	if (view == CLIENT_PING) {
		return ClientPing{};
	}

	// Invalid
	return {};
}

} // namespace wordsmith::app
