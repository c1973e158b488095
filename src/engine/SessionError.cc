#include "engine/SessionError.hh"

#include <initializer_list>
#include <ostream>

namespace Clue {
namespace Engine {

namespace {

const auto SESSION_ERROR_STRING_PAIRS =
    std::initializer_list<SessionErrorToStringMap::value_type> {
    { SessionError::NOT_YOUR_TURN,        "NotYourTurn"         },
    { SessionError::ELIMINATED,           "Eliminated"          },
    { SessionError::GAME_OVER,            "GameOver"            },
    { SessionError::SAME_LOCATION,        "SameLocation"        },
    { SessionError::INVALID_MOVE,         "InvalidMove"         },
    { SessionError::HALLWAY_OCCUPIED,     "HallwayOccupied"     },
    { SessionError::NOT_IN_ROOM,          "NotInRoom"           },
    { SessionError::NOT_HOST,             "NotHost"             },
    { SessionError::INSUFFICIENT_PLAYERS, "InsufficientPlayers" },
    { SessionError::CAPACITY_EXCEEDED,    "CapacityExceeded"    },
    { SessionError::ALREADY_STARTED,      "AlreadyStarted"      },
    { SessionError::SESSION_NOT_FOUND,    "SessionNotFound"     },
    { SessionError::NOT_STARTED,          "NotStarted"          },
    { SessionError::UNKNOWN_PLAYER,       "UnknownPlayer"       },
    { SessionError::CHARACTER_TAKEN,      "CharacterTaken"      },
    { SessionError::DISPROVE_PENDING,     "DisprovePending"     },
    { SessionError::NO_PENDING_DISPROVE,  "NoPendingDisprove"   },
    { SessionError::NOT_DISPROVER,        "NotDisprover"        },
    { SessionError::INVALID_CARD,         "InvalidCard"         },
    { SessionError::SESSION_ABORTED,      "SessionAborted"      }};

}

const SessionErrorToStringMap SESSION_ERROR_TO_STRING_MAP(
    SESSION_ERROR_STRING_PAIRS.begin(), SESSION_ERROR_STRING_PAIRS.end());

std::ostream& operator<<(std::ostream& os, const SessionError error)
{
    return os << SESSION_ERROR_TO_STRING_MAP.left.at(error);
}

}
}
