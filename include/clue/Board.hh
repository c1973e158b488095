/** \file
 *
 * \brief Definition of the board of the game
 *
 * The board is a fixed graph. Its nodes are the nine rooms and twelve
 * hallways, each hallway connecting two rooms. Two pairs of corner rooms are
 * additionally connected by secret passages.
 *
 * \verbatim
 *   Study ------ 1 ------ Hall ------- 2 ------ Lounge
 *     |                    |                      |
 *     3                    4                      5
 *     |                    |                      |
 *   Library ---- 6 --- Billiard Room -- 7 --- Dining Room
 *     |                    |                      |
 *     8                    9                     10
 *     |                    |                      |
 *   Conservatory - 11 -- Ballroom ----- 12 ---- Kitchen
 * \endverbatim
 *
 * Secret passages connect the Study with the Kitchen, and the Lounge with the
 * Conservatory.
 */

#ifndef BOARD_HH_
#define BOARD_HH_

#include "clue/Card.hh"

#include <boost/bimap/bimap.hpp>

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Clue {

/** \brief Hallway
 */
enum class Hallway {
    HALLWAY1,
    HALLWAY2,
    HALLWAY3,
    HALLWAY4,
    HALLWAY5,
    HALLWAY6,
    HALLWAY7,
    HALLWAY8,
    HALLWAY9,
    HALLWAY10,
    HALLWAY11,
    HALLWAY12,
};

/// \brief All hallways in their canonical order
constexpr std::array<Hallway, N_HALLWAYS> HALLWAYS {
    Hallway::HALLWAY1, Hallway::HALLWAY2, Hallway::HALLWAY3,
    Hallway::HALLWAY4, Hallway::HALLWAY5, Hallway::HALLWAY6,
    Hallway::HALLWAY7, Hallway::HALLWAY8, Hallway::HALLWAY9,
    Hallway::HALLWAY10, Hallway::HALLWAY11, Hallway::HALLWAY12,
};

/** \brief Type of \ref HALLWAY_TO_STRING_MAP
 */
using HallwayToStringMap = boost::bimaps::bimap<Hallway, std::string>;

/** \brief Two-way map between Hallway enumerations and their string
 * representation
 */
extern const HallwayToStringMap HALLWAY_TO_STRING_MAP;

/** \brief A node of the board
 */
using Location = std::variant<Room, Hallway>;

/** \brief Determine if \p location is a room
 */
bool isRoom(const Location& location);

/** \brief Determine if \p location is a hallway
 */
bool isHallway(const Location& location);

/** \brief Determine the rooms connected by a hallway
 *
 * \param hallway the hallway
 *
 * \return the two rooms at the ends of \p hallway
 */
std::pair<Room, Room> getHallwayRooms(Hallway hallway);

/** \brief Determine the secret passage leaving from a room
 *
 * \param room the room
 *
 * \return the room at the other end of the secret passage, or none if \p room
 * has no secret passage
 */
std::optional<Room> getSecretPassage(Room room);

/** \brief Determine the neighbours of a location
 *
 * The neighbours of a hallway are its two rooms. The neighbours of a room are
 * the hallways leaving from it and the room at the other end of its secret
 * passage, if any.
 *
 * \param location the location
 *
 * \return the neighbours of \p location
 */
std::vector<Location> getNeighbours(const Location& location);

/** \brief Determine if a single move takes a token from one location to
 * another
 *
 * \param from the location the move starts from
 * \param to the location the move ends to
 *
 * \return true if \p to is a neighbour of \p from, false otherwise
 */
bool areAdjacent(const Location& from, const Location& to);

/** \brief Determine the hallway where the token of a character starts
 *
 * Each character starts from a different hallway.
 */
Hallway getStartingHallway(Suspect character);

/** \brief Output a Hallway to stream
 *
 * \param os the output stream
 * \param hallway the hallway to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Hallway hallway);

}

#endif // BOARD_HH_
