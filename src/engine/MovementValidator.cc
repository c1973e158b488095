#include "engine/MovementValidator.hh"

#include "Utility.hh"

namespace Clue {
namespace Engine {

namespace {

bool isOccupiedByOther(
    const SessionState& state, const std::size_t index, const Location& target)
{
    for (const auto n : to(state.players.size())) {
        if (n != index && state.players[n].isConnected() &&
            getPlayerLocation(state, n) == target) {
            return true;
        }
    }
    return false;
}

}

std::optional<SessionError> checkBoardRules(
    const SessionState& state, const std::size_t index, const Location& target)
{
    const auto& current = getPlayerLocation(state, index);
    if (current == target) {
        return SessionError::SAME_LOCATION;
    } else if (!areAdjacent(current, target)) {
        return SessionError::INVALID_MOVE;
    } else if (isHallway(target) && isOccupiedByOther(state, index, target)) {
        return SessionError::HALLWAY_OCCUPIED;
    }
    return std::nullopt;
}

Result<> move(
    SessionState& state, const Uuid& player, const Location& target,
    const bool freeMovementInLobby)
{
    const auto index = checkActionPreconditions(
        state, player, freeMovementInLobby);
    if (!index) {
        return *index.getError();
    }
    if (state.status == SessionStatus::IN_PROGRESS) {
        if (state.players[*index].isEliminated()) {
            return SessionError::ELIMINATED;
        } else if (!isTurnHolder(state, *index)) {
            return SessionError::NOT_YOUR_TURN;
        }
    }
    if (const auto error = checkBoardRules(state, *index, target)) {
        return *error;
    }

    const auto character = state.players[*index].character;
    state.tokens[static_cast<std::size_t>(character)] = target;
    return {};
}

}
}
