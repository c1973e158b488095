#include "engine/AccusationResolver.hh"

#include "engine/TurnScheduler.hh"
#include "Utility.hh"

namespace Clue {
namespace Engine {

Result<AccusationOutcome> accuse(
    SessionState& state, const Uuid& player, const CaseFile& accusation)
{
    const auto index = checkActionPreconditions(state, player);
    if (!index) {
        return *index.getError();
    }
    auto& accuser = state.players[*index];
    if (accuser.isEliminated()) {
        return SessionError::ELIMINATED;
    } else if (!isTurnHolder(state, *index)) {
        return SessionError::NOT_YOUR_TURN;
    }

    if (accusation == dereference(state.caseFile)) {
        state.status = SessionStatus::ENDED;
        state.winner = *index;
        return AccusationOutcome::WIN;
    }

    accuser.participation = eliminate(accuser.participation);
    if (countNonEliminated(state) == 0) {
        state.status = SessionStatus::ENDED;
        return AccusationOutcome::TIE;
    }
    advanceTurn(state);
    return AccusationOutcome::ELIMINATED;
}

}
}
