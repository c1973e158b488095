#include "clue/Card.hh"

#include <initializer_list>
#include <ostream>

namespace Clue {

namespace {

const auto SUSPECT_STRING_PAIRS =
    std::initializer_list<SuspectToStringMap::value_type> {
    { Suspect::MISS_SCARLET,    "miss_scarlet"    },
    { Suspect::PROFESSOR_PLUM,  "professor_plum"  },
    { Suspect::MRS_PEACOCK,     "mrs_peacock"     },
    { Suspect::MR_GREEN,        "mr_green"        },
    { Suspect::MRS_WHITE,       "mrs_white"       },
    { Suspect::COLONEL_MUSTARD, "colonel_mustard" }};

const auto WEAPON_STRING_PAIRS =
    std::initializer_list<WeaponToStringMap::value_type> {
    { Weapon::ROPE,        "rope"        },
    { Weapon::LEAD_PIPE,   "lead_pipe"   },
    { Weapon::KNIFE,       "knife"       },
    { Weapon::WRENCH,      "wrench"      },
    { Weapon::CANDLESTICK, "candlestick" },
    { Weapon::REVOLVER,    "revolver"    }};

const auto ROOM_STRING_PAIRS =
    std::initializer_list<RoomToStringMap::value_type> {
    { Room::STUDY,         "study"         },
    { Room::HALL,          "hall"          },
    { Room::LOUNGE,        "lounge"        },
    { Room::LIBRARY,       "library"       },
    { Room::BILLIARD_ROOM, "billiard_room" },
    { Room::DINING_ROOM,   "dining_room"   },
    { Room::CONSERVATORY,  "conservatory"  },
    { Room::BALLROOM,      "ballroom"      },
    { Room::KITCHEN,       "kitchen"       }};

const auto CARD_KIND_STRING_PAIRS =
    std::initializer_list<CardKindToStringMap::value_type> {
    { CardKind::SUSPECT, "suspect" },
    { CardKind::WEAPON,  "weapon"  },
    { CardKind::ROOM,    "room"    }};

}

const SuspectToStringMap SUSPECT_TO_STRING_MAP(
    SUSPECT_STRING_PAIRS.begin(), SUSPECT_STRING_PAIRS.end());

const WeaponToStringMap WEAPON_TO_STRING_MAP(
    WEAPON_STRING_PAIRS.begin(), WEAPON_STRING_PAIRS.end());

const RoomToStringMap ROOM_TO_STRING_MAP(
    ROOM_STRING_PAIRS.begin(), ROOM_STRING_PAIRS.end());

const CardKindToStringMap CARD_KIND_TO_STRING_MAP(
    CARD_KIND_STRING_PAIRS.begin(), CARD_KIND_STRING_PAIRS.end());

CardKind getCardKind(const Card& card)
{
    // The alternatives of Card are in the order of CardKind enumerators
    return static_cast<CardKind>(card.index());
}

std::vector<Card> allCards()
{
    auto cards = std::vector<Card> {};
    cards.reserve(N_CARDS);
    cards.insert(cards.end(), SUSPECTS.begin(), SUSPECTS.end());
    cards.insert(cards.end(), WEAPONS.begin(), WEAPONS.end());
    cards.insert(cards.end(), ROOMS.begin(), ROOMS.end());
    return cards;
}

std::ostream& operator<<(std::ostream& os, const Suspect suspect)
{
    return os << SUSPECT_TO_STRING_MAP.left.at(suspect);
}

std::ostream& operator<<(std::ostream& os, const Weapon weapon)
{
    return os << WEAPON_TO_STRING_MAP.left.at(weapon);
}

std::ostream& operator<<(std::ostream& os, const Room room)
{
    return os << ROOM_TO_STRING_MAP.left.at(room);
}

std::ostream& operator<<(std::ostream& os, const CardKind kind)
{
    return os << CARD_KIND_TO_STRING_MAP.left.at(kind);
}

}
