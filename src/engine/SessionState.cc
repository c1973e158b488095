#include "engine/SessionState.hh"

#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <initializer_list>
#include <map>
#include <ostream>

namespace Clue {
namespace Engine {

namespace {

const auto SESSION_STATUS_STRING_PAIRS =
    std::initializer_list<SessionStatusToStringMap::value_type> {
    { SessionStatus::LOBBY,       "lobby"      },
    { SessionStatus::IN_PROGRESS, "inprogress" },
    { SessionStatus::ENDED,       "ended"      }};

const auto ACCUSATION_OUTCOME_STRING_PAIRS =
    std::initializer_list<AccusationOutcomeToStringMap::value_type> {
    { AccusationOutcome::WIN,        "win"        },
    { AccusationOutcome::ELIMINATED, "eliminated" },
    { AccusationOutcome::TIE,        "tie"        }};

}

const SessionStatusToStringMap SESSION_STATUS_TO_STRING_MAP(
    SESSION_STATUS_STRING_PAIRS.begin(), SESSION_STATUS_STRING_PAIRS.end());

const AccusationOutcomeToStringMap ACCUSATION_OUTCOME_TO_STRING_MAP(
    ACCUSATION_OUTCOME_STRING_PAIRS.begin(),
    ACCUSATION_OUTCOME_STRING_PAIRS.end());

SessionState::SessionState(const Uuid& uuid) :
    uuid {uuid}
{
    for (const auto character : SUSPECTS) {
        tokens[static_cast<std::size_t>(character)] =
            getStartingHallway(character);
    }
}

std::optional<std::size_t> findPlayer(
    const SessionState& state, const Uuid& uuid)
{
    const auto iter = std::find_if(
        state.players.begin(), state.players.end(),
        [&uuid](const auto& player) { return player.uuid == uuid; });
    if (iter == state.players.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(iter - state.players.begin());
}

const Location& getTokenLocation(
    const SessionState& state, const Suspect character)
{
    return state.tokens[static_cast<std::size_t>(character)];
}

const Location& getPlayerLocation(
    const SessionState& state, const std::size_t index)
{
    return getTokenLocation(state, state.players.at(index).character);
}

std::optional<std::size_t> getTurnHolder(const SessionState& state)
{
    if (state.status != SessionStatus::IN_PROGRESS) {
        return std::nullopt;
    }
    return state.turnIndex;
}

bool isTurnHolder(const SessionState& state, const std::size_t index)
{
    return getTurnHolder(state) == index;
}

bool isHost(const SessionState& state, const std::size_t index)
{
    return state.hostIndex == index;
}

int countNonEliminated(const SessionState& state)
{
    return static_cast<int>(
        std::count_if(
            state.players.begin(), state.players.end(),
            [](const auto& player) { return !player.isEliminated(); }));
}

Result<std::size_t> checkActionPreconditions(
    const SessionState& state, const Uuid& player, const bool allowInLobby)
{
    if (state.status == SessionStatus::ENDED) {
        return SessionError::GAME_OVER;
    }
    const auto index = findPlayer(state, player);
    if (!index) {
        return SessionError::UNKNOWN_PLAYER;
    }
    if (state.status == SessionStatus::LOBBY && !allowInLobby) {
        return SessionError::NOT_STARTED;
    }
    if (state.pendingDisprove) {
        return SessionError::DISPROVE_PENDING;
    }
    return *index;
}

void verifyCardConservation(const SessionState& state)
{
    if (!state.caseFile) {
        return;
    }
    auto counts = std::map<Card, int> {};
    for (const auto& card : state.caseFile->getCards()) {
        ++counts[card];
    }
    for (const auto& player : state.players) {
        for (const auto& card : player.hand) {
            ++counts[card];
        }
    }
    for (const auto& card : allCards()) {
        const auto iter = counts.find(card);
        if (iter == counts.end() || iter->second != 1) {
            throw SessionAbortedException {
                "Card conservation violated in session " +
                boost::uuids::to_string(state.uuid)};
        }
    }
    if (counts.size() != allCards().size()) {
        throw SessionAbortedException {
            "Unknown cards in session " + boost::uuids::to_string(state.uuid)};
    }
}

bool operator==(const CardRevealed& lhs, const CardRevealed& rhs)
{
    return lhs.disprover == rhs.disprover && lhs.card == rhs.card;
}

bool operator==(const NoRefute&, const NoRefute&)
{
    return true;
}

bool operator==(const AwaitingDisprove& lhs, const AwaitingDisprove& rhs)
{
    return lhs.disprover == rhs.disprover && lhs.requestId == rhs.requestId;
}

std::ostream& operator<<(std::ostream& os, const SessionStatus status)
{
    return os << SESSION_STATUS_TO_STRING_MAP.left.at(status);
}

std::ostream& operator<<(std::ostream& os, const AccusationOutcome outcome)
{
    return os << ACCUSATION_OUTCOME_TO_STRING_MAP.left.at(outcome);
}

std::ostream& operator<<(std::ostream& os, const CardRevealed& outcome)
{
    os << "revealed by " << outcome.disprover << ": ";
    std::visit([&os](const auto& card) { os << card; }, outcome.card);
    return os;
}

std::ostream& operator<<(std::ostream& os, const NoRefute&)
{
    return os << "no refute";
}

std::ostream& operator<<(std::ostream& os, const AwaitingDisprove& outcome)
{
    return os << "awaiting " << outcome.disprover << " (request " <<
        outcome.requestId << ")";
}

}
}
