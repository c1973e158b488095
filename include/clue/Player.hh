/** \file
 *
 * \brief Definition of Clue::Player struct and participation states
 */

#ifndef PLAYER_HH_
#define PLAYER_HH_

#include "clue/Card.hh"
#include "clue/Uuid.hh"

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace Clue {

/** \brief Participation of a player in a game
 *
 * The connection state and the elimination state are combined into one
 * value. The transitions provided by eliminate(), disconnect() and
 * reconnect() never lead from an eliminated state to a state that is not
 * eliminated.
 */
enum class Participation {
    ACTIVE,                  ///< Connected and playing
    ELIMINATED,              ///< Connected after an incorrect accusation
    DISCONNECTED,            ///< Disconnected, still playing
    DISCONNECTED_ELIMINATED, ///< Disconnected after an incorrect accusation
};

/** \brief Type of \ref PARTICIPATION_TO_STRING_MAP
 */
using ParticipationToStringMap =
    boost::bimaps::bimap<Participation, std::string>;

/** \brief Two-way map between Participation enumerations and their string
 * representation
 */
extern const ParticipationToStringMap PARTICIPATION_TO_STRING_MAP;

/** \brief Determine if the player is connected
 */
constexpr bool isConnected(const Participation participation)
{
    return participation == Participation::ACTIVE ||
        participation == Participation::ELIMINATED;
}

/** \brief Determine if the player is eliminated
 */
constexpr bool isEliminated(const Participation participation)
{
    return participation == Participation::ELIMINATED ||
        participation == Participation::DISCONNECTED_ELIMINATED;
}

/** \brief Participation after an incorrect accusation
 */
constexpr Participation eliminate(const Participation participation)
{
    return isConnected(participation) ?
        Participation::ELIMINATED : Participation::DISCONNECTED_ELIMINATED;
}

/** \brief Participation after the player disconnects
 */
constexpr Participation disconnect(const Participation participation)
{
    return isEliminated(participation) ?
        Participation::DISCONNECTED_ELIMINATED : Participation::DISCONNECTED;
}

/** \brief Participation after the player connects again
 */
constexpr Participation reconnect(const Participation participation)
{
    return isEliminated(participation) ?
        Participation::ELIMINATED : Participation::ACTIVE;
}

/** \brief A player of a game
 *
 * The location of the player is the location of the token of their character,
 * and is kept by the session together with the tokens of the characters
 * nobody plays.
 *
 * Player objects are equality comparable. They compare equal when all the
 * members are equal.
 */
struct Player {

    /** \brief The identity of the player
     */
    Uuid uuid;

    /** \brief The character assigned to the player
     */
    Suspect character;

    /** \brief The cards dealt to the player
     */
    std::vector<Card> hand;

    /** \brief The participation of the player
     */
    Participation participation {Participation::ACTIVE};

    /** \brief Shorthand for Clue::isConnected(participation)
     */
    bool isConnected() const { return Clue::isConnected(participation); }

    /** \brief Shorthand for Clue::isEliminated(participation)
     */
    bool isEliminated() const { return Clue::isEliminated(participation); }

    /** \brief Determine if \p card is in the hand of the player
     */
    bool hasCard(const Card& card) const;
};

/** \brief Equality operator for players
 *
 * \sa Player
 */
bool operator==(const Player&, const Player&);

/** \brief Output a Participation to stream
 *
 * \param os the output stream
 * \param participation the participation to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Participation participation);

}

#endif // PLAYER_HH_
