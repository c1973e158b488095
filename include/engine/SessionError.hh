/** \file
 *
 * \brief Definition of the errors reported by the session engine
 */

#ifndef ENGINE_SESSIONERROR_HH_
#define ENGINE_SESSIONERROR_HH_

#include <boost/bimap/bimap.hpp>

#include <concepts>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace Clue {
namespace Engine {

/** \brief Rule violation detected by the session engine
 *
 * Session errors are expected and recoverable. They are reported privately
 * to the player that attempted the action, and an action failing with a
 * session error never changes the state of the session.
 */
enum class SessionError {
    NOT_YOUR_TURN,        ///< The requester does not have the turn
    ELIMINATED,           ///< The requester has been eliminated
    GAME_OVER,            ///< The game has ended
    SAME_LOCATION,        ///< Moving to the current location
    INVALID_MOVE,         ///< Moving to a location not adjacent
    HALLWAY_OCCUPIED,     ///< Moving to a hallway already occupied
    NOT_IN_ROOM,          ///< Suggesting outside a room
    NOT_HOST,             ///< Starting the game without being the host
    INSUFFICIENT_PLAYERS, ///< Starting the game with too few players
    CAPACITY_EXCEEDED,    ///< Joining a full game
    ALREADY_STARTED,      ///< Joining or starting a game already started
    SESSION_NOT_FOUND,    ///< No session with the identifier
    NOT_STARTED,          ///< Playing before the game has started
    UNKNOWN_PLAYER,       ///< The requester has not joined the game
    CHARACTER_TAKEN,      ///< Requesting a character already assigned
    DISPROVE_PENDING,     ///< A disprove choice must be resolved first
    NO_PENDING_DISPROVE,  ///< Disproving when no choice is pending
    NOT_DISPROVER,        ///< Disproving without being the disprover
    INVALID_CARD,         ///< Revealing a card that does not disprove
    SESSION_ABORTED,      ///< The session was aborted due to internal error
};

/** \brief Type of \ref SESSION_ERROR_TO_STRING_MAP
 */
using SessionErrorToStringMap = boost::bimaps::bimap<SessionError, std::string>;

/** \brief Two-way map between SessionError enumerations and their string
 * representation
 *
 * The string representation is the one used in the failure replies to the
 * clients.
 */
extern const SessionErrorToStringMap SESSION_ERROR_TO_STRING_MAP;

/** \brief Output a SessionError to stream
 *
 * \param os the output stream
 * \param error the error to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, SessionError error);

/** \brief Either the value of a successful operation, or a session error
 *
 * Each operation of the session engine returns a result. Results convert to
 * true when they hold a value.
 *
 * \code{.cc}
 * const auto result = move(state, player, Room::HALL);
 * if (!result) {
 *     log(LogLevel::DEBUG, "Move failed: %s", *result.getError());
 * }
 * \endcode
 *
 * \tparam T the type of the value, std::monostate for operations that
 * produce no value
 */
template<typename T = std::monostate>
class Result {
public:

    /** \brief Create a successful result holding a default value
     */
    Result() requires std::default_initializable<T> :
        result {std::in_place_index<1>}
    {
    }

    /** \brief Create a successful result
     *
     * \param value the value
     */
    Result(T value) :
        result {std::in_place_index<1>, std::move(value)}
    {
    }

    /** \brief Create a failed result
     *
     * \param error the error
     */
    Result(SessionError error) :
        result {std::in_place_index<0>, error}
    {
    }

    /** \brief Determine if the result is successful
     */
    explicit operator bool() const
    {
        return result.index() == 1;
    }

    /** \brief Access the value
     *
     * \throw std::bad_variant_access if the result is an error
     */
    const T& operator*() const
    {
        return std::get<1>(result);
    }

    /** \brief Access the value
     *
     * \throw std::bad_variant_access if the result is an error
     */
    const T* operator->() const
    {
        return &std::get<1>(result);
    }

    /** \brief Get the error, or none if the result is successful
     */
    std::optional<SessionError> getError() const
    {
        if (const auto* error = std::get_if<0>(&result)) {
            return *error;
        }
        return std::nullopt;
    }

private:

    std::variant<SessionError, T> result;
};

/** \brief Exception thrown when an invariant of a session is violated
 *
 * Unlike a SessionError, a violated invariant is a defect that cannot be
 * recovered from. The session where it is detected is aborted.
 */
class SessionAbortedException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
}

#endif // ENGINE_SESSIONERROR_HH_
