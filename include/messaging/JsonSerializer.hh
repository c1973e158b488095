/** \file
 *
 * \brief Definition of JSON serialization policy for message passing
 *
 * The serialization policy is based on the JSON library by nlohmann
 * (https://github.com/nlohmann/json). Every argument and reply value of the
 * commands of the server is a JSON document.
 *
 * \sa \ref serializationpolicy
 */

#ifndef MESSAGING_JSONSERIALIZER_HH_
#define MESSAGING_JSONSERIALIZER_HH_

#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace Clue {
namespace Messaging {

/** \brief Serialization policy that uses JSON
 *
 * \page serializationpolicy Serialization policy
 *
 * A serialization policy is a type with two static function templates:
 * <tt>serialize(t)</tt> returning a contiguous container of bytes, and
 * <tt>deserialize<T>(bytes)</tt> returning an object of type \c T or
 * throwing SerializationFailureException.
 *
 * \sa FunctionMessageHandler
 */
struct JsonSerializer {

    /** \brief Serialize object to JSON string
     *
     * \param t the object
     *
     * \return dump of the JSON value converted from \p t
     */
    template<typename T> static std::string serialize(T&& t)
    {
        return nlohmann::json(std::forward<T>(t)).dump();
    }

    /** \brief Deserialize JSON string to object
     *
     * \param s the contiguous sequence of bytes to parse
     *
     * \return \p s parsed as JSON and converted to an object of type \c T
     *
     * \throw SerializationFailureException if parsing or conversion fails
     */
    template<typename T, typename String>
    static T deserialize(String&& s)
    {
        static_assert(sizeof(*std::data(s)) == 1);
        const auto sv = std::string_view(
            reinterpret_cast<const char*>(std::data(s)), std::size(s));
        try {
            return nlohmann::json::parse(sv).template get<T>();
        } catch (const nlohmann::json::exception&) {
            throw SerializationFailureException {};
        }
    }
};

}
}

#endif // MESSAGING_JSONSERIALIZER_HH_
