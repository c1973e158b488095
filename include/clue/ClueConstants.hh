/** \file
 *
 * \brief Definition of fundamental constants of the game
 */

#ifndef CLUECONSTANTS_HH_
#define CLUECONSTANTS_HH_

/** \brief Top level namespace of the Clue session server
 *
 * The Clue namespace directly contains the rules independent concepts of the
 * game: cards, the board and players. The subnamespaces contain the session
 * engine, the messaging framework and the server application.
 */
namespace Clue {

/** \brief Number of suspects (and playable characters)
 */
constexpr auto N_SUSPECTS = 6;

/** \brief Number of weapons
 */
constexpr auto N_WEAPONS = 6;

/** \brief Number of rooms
 */
constexpr auto N_ROOMS = 9;

/** \brief Number of hallways
 */
constexpr auto N_HALLWAYS = 12;

/** \brief Number of cards in the game
 */
constexpr auto N_CARDS = N_SUSPECTS + N_WEAPONS + N_ROOMS; // 21

/** \brief Number of cards placed in the case file
 */
constexpr auto N_CASE_FILE_CARDS = 3;

/** \brief Minimum number of players needed to start a game
 */
constexpr auto MIN_PLAYERS = 3;

/** \brief Maximum number of players in a game
 */
constexpr auto MAX_PLAYERS = N_SUSPECTS;

}

#endif // CLUECONSTANTS_HH_
