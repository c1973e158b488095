#include "main/Commands.hh"

namespace Clue {
namespace Main {

const std::string HELLO_COMMAND {"cluehlo"};
const std::string VERSION_COMMAND {"version"};
const std::string ROLE_COMMAND {"role"};
const std::string GAME_COMMAND {"game"};
const std::string JOIN_COMMAND {"join"};
const std::string LEAVE_COMMAND {"leave"};
const std::string GET_COMMAND {"get"};
const std::string START_GAME_COMMAND {"start_game"};
const std::string MOVE_COMMAND {"move"};
const std::string SUGGEST_COMMAND {"suggest"};
const std::string DISPROVE_COMMAND {"disprove"};
const std::string ACCUSE_COMMAND {"accuse"};
const std::string END_TURN_COMMAND {"end_turn"};
const std::string PLAYER_COMMAND {"player"};
const std::string CHARACTER_COMMAND {"character"};
const std::string LOCATION_COMMAND {"location"};
const std::string SUSPECT_COMMAND {"suspect"};
const std::string WEAPON_COMMAND {"weapon"};
const std::string ROOM_COMMAND {"room"};
const std::string CARD_COMMAND {"card"};
const std::string OUTCOME_COMMAND {"outcome"};
const std::string COUNTER_COMMAND {"counter"};
const std::string PUBSTATE_COMMAND {"pubstate"};
const std::string PRIVSTATE_COMMAND {"privstate"};
const std::string SELF_COMMAND {"self"};
const std::string HISTORY_COMMAND {"history"};
const std::string STATUS_COMMAND {"status"};
const std::string HOST_COMMAND {"host"};
const std::string TURN_COMMAND {"turn"};
const std::string WINNER_COMMAND {"winner"};
const std::string PLAYERS_COMMAND {"players"};
const std::string TOKENS_COMMAND {"tokens"};
const std::string CASE_FILE_COMMAND {"caseFile"};
const std::string PARTICIPATION_COMMAND {"participation"};
const std::string ACTIVE_COMMAND {"active"};
const std::string ELIMINATED_COMMAND {"eliminated"};
const std::string IS_TURN_COMMAND {"isTurn"};
const std::string HAND_COMMAND {"hand"};
const std::string LAST_OUTCOME_COMMAND {"lastOutcome"};
const std::string PENDING_DISPROVE_COMMAND {"pendingDisprove"};
const std::string DISPROVER_COMMAND {"disprover"};
const std::string MATCHING_CARDS_COMMAND {"matchingCards"};
const std::string REQUEST_COMMAND {"request"};
const std::string EVENT_COMMAND {"event"};
const std::string START_COMMAND {"start"};
const std::string SUGGESTION_END_COMMAND {"suggestionend"};
const std::string END_COMMAND {"end"};
const std::string UPDATE_COMMAND {"update"};

}
}
