#include "engine/SuggestionResolver.hh"

#include "Utility.hh"

#include <algorithm>

namespace Clue {
namespace Engine {

namespace {

SuggestionOutcome reveal(SessionState& state, const Card& card)
{
    const auto& pending = dereference(state.pendingDisprove);
    const auto outcome = CardRevealed {
        state.players.at(pending.disprover).uuid, card};
    state.lastOutcomes[state.players.at(pending.suggester).uuid] = outcome;
    state.pendingDisprove.reset();
    return outcome;
}

}

std::vector<Card> getMatchingCards(
    const Player& player, const CaseFile& suggestion)
{
    auto ret = std::vector<Card> {};
    for (const auto& card : suggestion.getCards()) {
        if (player.hasCard(card)) {
            ret.push_back(card);
        }
    }
    return ret;
}

std::optional<std::size_t> findDisprover(
    const SessionState& state, const std::size_t suggester,
    const CaseFile& suggestion)
{
    const auto n_players = state.players.size();
    for (const auto offset : from_to(std::size_t {1}, n_players)) {
        const auto candidate = (suggester + offset) % n_players;
        if (!getMatchingCards(state.players[candidate], suggestion).empty()) {
            return candidate;
        }
    }
    return std::nullopt;
}

Result<SuggestionOutcome> suggest(
    SessionState& state, const Uuid& player, const Suspect suspect,
    const Weapon weapon, const SessionClock::time_point deadline)
{
    const auto index = checkActionPreconditions(state, player);
    if (!index) {
        return *index.getError();
    }
    if (state.players[*index].isEliminated()) {
        return SessionError::ELIMINATED;
    } else if (!isTurnHolder(state, *index)) {
        return SessionError::NOT_YOUR_TURN;
    }
    const auto* room = std::get_if<Room>(&getPlayerLocation(state, *index));
    if (!room) {
        return SessionError::NOT_IN_ROOM;
    }

    const auto suggestion = CaseFile {suspect, weapon, *room};
    state.tokens[static_cast<std::size_t>(suspect)] = suggestion.room;

    auto outcome = SuggestionOutcome {};
    const auto disprover = findDisprover(state, *index, suggestion);
    if (!disprover) {
        outcome = NoRefute {};
    } else {
        const auto& disprovingPlayer = state.players[*disprover];
        auto cards = getMatchingCards(disprovingPlayer, suggestion);
        if (cards.size() == 1) {
            outcome = CardRevealed {disprovingPlayer.uuid, cards.front()};
        } else {
            const auto id = state.nextRequestId++;
            state.pendingDisprove = PendingDisprove {
                id, *index, *disprover, suggestion, std::move(cards),
                deadline};
            outcome = AwaitingDisprove {disprovingPlayer.uuid, id};
        }
    }
    state.lastOutcomes[player] = outcome;
    return outcome;
}

Result<SuggestionOutcome> disprove(
    SessionState& state, const Uuid& player, const Card& card)
{
    if (state.status == SessionStatus::ENDED) {
        return SessionError::GAME_OVER;
    }
    const auto index = findPlayer(state, player);
    if (!index) {
        return SessionError::UNKNOWN_PLAYER;
    } else if (!state.pendingDisprove) {
        return SessionError::NO_PENDING_DISPROVE;
    }
    const auto& pending = *state.pendingDisprove;
    if (pending.disprover != *index) {
        return SessionError::NOT_DISPROVER;
    }
    const auto& cards = pending.matchingCards;
    if (std::find(cards.begin(), cards.end(), card) == cards.end()) {
        return SessionError::INVALID_CARD;
    }
    return reveal(state, card);
}

Result<SuggestionOutcome> expireDisprove(
    SessionState& state, const std::uint64_t requestId)
{
    if (!state.pendingDisprove || state.pendingDisprove->id != requestId) {
        return SessionError::NO_PENDING_DISPROVE;
    }
    const auto card = state.pendingDisprove->matchingCards.front();
    return reveal(state, card);
}

std::optional<SuggestionOutcome> expireOverdueDisprove(
    SessionState& state, const SessionClock::time_point now)
{
    if (state.pendingDisprove && state.pendingDisprove->deadline <= now) {
        return *expireDisprove(state, state.pendingDisprove->id);
    }
    return std::nullopt;
}

}
}
