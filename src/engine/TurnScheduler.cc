#include "engine/TurnScheduler.hh"

#include "Utility.hh"

#include <boost/uuid/uuid_io.hpp>

namespace Clue {
namespace Engine {

std::optional<std::size_t> getNextTurnHolder(
    const SessionState& state, const std::size_t index)
{
    const auto n_players = state.players.size();
    // The last candidate is index itself
    for (const auto offset : from_to(std::size_t {1}, n_players + 1)) {
        const auto candidate = (index + offset) % n_players;
        if (!state.players[candidate].isEliminated()) {
            return candidate;
        }
    }
    return std::nullopt;
}

void advanceTurn(SessionState& state)
{
    const auto next = getNextTurnHolder(state, state.turnIndex);
    if (!next) {
        throw SessionAbortedException {
            "No player to give the turn to in session " +
            boost::uuids::to_string(state.uuid)};
    }
    state.turnIndex = *next;
}

Result<> endTurn(SessionState& state, const Uuid& player)
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
    advanceTurn(state);
    return {};
}

}
}
