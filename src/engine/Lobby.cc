#include "engine/Lobby.hh"

#include "clue/CardShuffle.hh"
#include "Utility.hh"

#include <algorithm>
#include <iterator>
#include <vector>

namespace Clue {
namespace Engine {

namespace {

bool isTaken(const SessionState& state, const Suspect character)
{
    return std::any_of(
        state.players.begin(), state.players.end(),
        [character](const auto& player)
        {
            return player.character == character;
        });
}

Suspect pickCharacter(const SessionState& state, Rng& rng)
{
    auto free = std::vector<Suspect> {};
    std::copy_if(
        SUSPECTS.begin(), SUSPECTS.end(), std::back_inserter(free),
        [&state](const auto character) { return !isTaken(state, character); });
    auto dist = std::uniform_int_distribution<std::size_t> {
        0, free.size() - 1};
    return free[dist(rng)];
}

}

Result<std::size_t> join(
    SessionState& state, const Uuid& player,
    const std::optional<Suspect>& preferred, Rng& rng)
{
    if (const auto index = findPlayer(state, player)) {
        auto& participation = state.players[*index].participation;
        participation = reconnect(participation);
        return *index;
    }

    if (state.status == SessionStatus::ENDED) {
        return SessionError::GAME_OVER;
    } else if (state.status == SessionStatus::IN_PROGRESS) {
        return SessionError::ALREADY_STARTED;
    } else if (state.players.size() >= std::size_t {MAX_PLAYERS}) {
        return SessionError::CAPACITY_EXCEEDED;
    } else if (preferred && isTaken(state, *preferred)) {
        return SessionError::CHARACTER_TAKEN;
    }

    const auto character = preferred ? *preferred : pickCharacter(state, rng);
    state.players.push_back(Player {player, character, {}});
    const auto index = state.players.size() - 1;
    if (!state.hostIndex) {
        state.hostIndex = index;
    }
    return index;
}

Result<> leave(SessionState& state, const Uuid& player)
{
    const auto index = findPlayer(state, player);
    if (!index) {
        return SessionError::UNKNOWN_PLAYER;
    }
    auto& participation = state.players[*index].participation;
    participation = disconnect(participation);

    if (state.status == SessionStatus::LOBBY && isHost(state, *index)) {
        const auto n_players = state.players.size();
        for (const auto offset : from_to(std::size_t {1}, n_players)) {
            const auto candidate = (*index + offset) % n_players;
            if (state.players[candidate].isConnected()) {
                state.hostIndex = candidate;
                break;
            }
        }
    }
    return {};
}

Result<> start(SessionState& state, const Uuid& requester, Rng& rng)
{
    if (state.status == SessionStatus::ENDED) {
        return SessionError::GAME_OVER;
    } else if (state.status == SessionStatus::IN_PROGRESS) {
        return SessionError::ALREADY_STARTED;
    }
    const auto index = findPlayer(state, requester);
    if (!index) {
        return SessionError::UNKNOWN_PLAYER;
    } else if (!isHost(state, *index)) {
        return SessionError::NOT_HOST;
    } else if (state.players.size() < std::size_t {MIN_PLAYERS}) {
        return SessionError::INSUFFICIENT_PLAYERS;
    }

    auto dealt = dealCards(static_cast<int>(state.players.size()), rng);
    for (const auto n : to(state.players.size())) {
        state.players[n].hand = std::move(dealt.hands[n]);
    }
    state.caseFile = dealt.caseFile;
    state.turnIndex = 0;
    state.status = SessionStatus::IN_PROGRESS;
    verifyCardConservation(state);
    return {};
}

}
}
