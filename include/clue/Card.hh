/** \file
 *
 * \brief Definition of the cards of the game
 *
 * A card is one of the six suspects, six weapons or nine rooms. The rooms
 * double as the rooms of the board.
 */

#ifndef CARD_HH_
#define CARD_HH_

#include "clue/ClueConstants.hh"

#include <boost/bimap/bimap.hpp>

#include <array>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace Clue {

/** \brief Suspect
 *
 * The suspects are also the characters played by the players.
 */
enum class Suspect {
    MISS_SCARLET,
    PROFESSOR_PLUM,
    MRS_PEACOCK,
    MR_GREEN,
    MRS_WHITE,
    COLONEL_MUSTARD,
};

/** \brief Weapon
 */
enum class Weapon {
    ROPE,
    LEAD_PIPE,
    KNIFE,
    WRENCH,
    CANDLESTICK,
    REVOLVER,
};

/** \brief Room
 */
enum class Room {
    STUDY,
    HALL,
    LOUNGE,
    LIBRARY,
    BILLIARD_ROOM,
    DINING_ROOM,
    CONSERVATORY,
    BALLROOM,
    KITCHEN,
};

/// \brief All suspects in their canonical order
constexpr std::array<Suspect, N_SUSPECTS> SUSPECTS {
    Suspect::MISS_SCARLET, Suspect::PROFESSOR_PLUM, Suspect::MRS_PEACOCK,
    Suspect::MR_GREEN, Suspect::MRS_WHITE, Suspect::COLONEL_MUSTARD,
};

/// \brief All weapons in their canonical order
constexpr std::array<Weapon, N_WEAPONS> WEAPONS {
    Weapon::ROPE, Weapon::LEAD_PIPE, Weapon::KNIFE, Weapon::WRENCH,
    Weapon::CANDLESTICK, Weapon::REVOLVER,
};

/// \brief All rooms in their canonical order
constexpr std::array<Room, N_ROOMS> ROOMS {
    Room::STUDY, Room::HALL, Room::LOUNGE, Room::LIBRARY, Room::BILLIARD_ROOM,
    Room::DINING_ROOM, Room::CONSERVATORY, Room::BALLROOM, Room::KITCHEN,
};

/** \brief A card
 *
 * Cards are ordered first by kind (suspects, weapons, rooms) and then by the
 * order of the enumerators.
 */
using Card = std::variant<Suspect, Weapon, Room>;

/** \brief Kind of a card
 */
enum class CardKind {
    SUSPECT,
    WEAPON,
    ROOM,
};

/// \brief Bidirectional map between suspects and their names
using SuspectToStringMap = boost::bimaps::bimap<Suspect, std::string>;

/// \brief Bidirectional map between weapons and their names
using WeaponToStringMap = boost::bimaps::bimap<Weapon, std::string>;

/// \brief Bidirectional map between rooms and their names
using RoomToStringMap = boost::bimaps::bimap<Room, std::string>;

/// \brief Bidirectional map between card kinds and their names
using CardKindToStringMap = boost::bimaps::bimap<CardKind, std::string>;

/** \brief Names of the suspects used in logs and messages
 */
extern const SuspectToStringMap SUSPECT_TO_STRING_MAP;

/** \brief Names of the weapons used in logs and messages
 */
extern const WeaponToStringMap WEAPON_TO_STRING_MAP;

/** \brief Names of the rooms used in logs and messages
 */
extern const RoomToStringMap ROOM_TO_STRING_MAP;

/** \brief Names of the card kinds used in logs and messages
 */
extern const CardKindToStringMap CARD_KIND_TO_STRING_MAP;

/** \brief Determine the kind of \p card
 */
CardKind getCardKind(const Card& card);

/** \brief Generate the universe of cards
 *
 * \return vector containing each of the 21 cards exactly once, suspects
 * first, then weapons, then rooms
 */
std::vector<Card> allCards();

/** \brief Output a Suspect to stream
 *
 * \param os the output stream
 * \param suspect the suspect to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Suspect suspect);

/** \brief Output a Weapon to stream
 *
 * \param os the output stream
 * \param weapon the weapon to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Weapon weapon);

/** \brief Output a Room to stream
 *
 * \param os the output stream
 * \param room the room to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Room room);

/** \brief Output a CardKind to stream
 */
std::ostream& operator<<(std::ostream& os, CardKind kind);

}

#endif // CARD_HH_
