#include "clue/Player.hh"

#include <algorithm>
#include <initializer_list>
#include <ostream>

namespace Clue {

namespace {

const auto PARTICIPATION_STRING_PAIRS =
    std::initializer_list<ParticipationToStringMap::value_type> {
    { Participation::ACTIVE,                  "active"                  },
    { Participation::ELIMINATED,              "eliminated"              },
    { Participation::DISCONNECTED,            "disconnected"            },
    { Participation::DISCONNECTED_ELIMINATED, "disconnected_eliminated" }};

}

const ParticipationToStringMap PARTICIPATION_TO_STRING_MAP(
    PARTICIPATION_STRING_PAIRS.begin(), PARTICIPATION_STRING_PAIRS.end());

bool Player::hasCard(const Card& card) const
{
    return std::find(hand.begin(), hand.end(), card) != hand.end();
}

bool operator==(const Player& lhs, const Player& rhs)
{
    return &lhs == &rhs || (
        lhs.uuid == rhs.uuid && lhs.character == rhs.character &&
        lhs.hand == rhs.hand && lhs.participation == rhs.participation);
}

std::ostream& operator<<(std::ostream& os, const Participation participation)
{
    return os << PARTICIPATION_TO_STRING_MAP.left.at(participation);
}

}
