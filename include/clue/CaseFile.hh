/** \file
 *
 * \brief Definition of Clue::CaseFile struct
 */

#ifndef CASEFILE_HH_
#define CASEFILE_HH_

#include "clue/Card.hh"

#include <boost/operators.hpp>

#include <array>
#include <iosfwd>

namespace Clue {

/** \brief A suspect, a weapon and a room
 *
 * The hidden solution of a game is a case file. The same triple describes
 * the claims made in suggestions and accusations.
 *
 * CaseFile objects are equality comparable. They compare equal when all
 * three cards are equal.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct CaseFile : private boost::equality_comparable<CaseFile> {
    Suspect suspect;  ///< \brief The suspect
    Weapon weapon;    ///< \brief The weapon
    Room room;        ///< \brief The room

    CaseFile() = default;

    /** \brief Create new case file
     *
     * \param suspect the suspect
     * \param weapon the weapon
     * \param room the room
     */
    constexpr CaseFile(Suspect suspect, Weapon weapon, Room room) :
        suspect {suspect},
        weapon {weapon},
        room {room}
    {
    }

    /** \brief Determine if \p card is one of the cards of the case file
     */
    bool contains(const Card& card) const;

    /** \brief Get the cards of the case file
     *
     * \return array containing the suspect, the weapon and the room, in that
     * order
     */
    std::array<Card, N_CASE_FILE_CARDS> getCards() const;
};

/** \brief Equality operator for case files
 *
 * \sa CaseFile
 */
bool operator==(const CaseFile&, const CaseFile&);

/** \brief Output a CaseFile to stream
 *
 * \param os the output stream
 * \param caseFile the case file to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const CaseFile& caseFile);

}

#endif // CASEFILE_HH_
