/** \file
 *
 * \brief Definition of JSON serialization utilities
 */

#ifndef MESSAGING_JSONSERIALIZERUTILITY_HH_
#define MESSAGING_JSONSERIALIZERUTILITY_HH_

#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace nlohmann {

/** \brief JSON converter for optional types
 *
 * An empty optional is converted to null and vice versa.
 */
template<typename T>
struct adl_serializer<std::optional<T>>
{
    /** \brief Convert optional type to JSON
     */
    static void to_json(json& j, const std::optional<T>& t)
    {
        if (t) {
            j = *t;
        } else {
            j = nullptr;
        }
    }

    /** \brief Convert JSON to optional type
     */
    static void from_json(const json& j, std::optional<T>& t)
    {
        if (j.is_null()) {
            t = std::nullopt;
        } else {
            t = j.get<T>();
        }
    }
};

}

namespace Clue {
namespace Messaging {

/** \brief Convert enumeration to JSON string
 *
 * \param map bimap from the enumeration to its string representation
 * \param e the enumeration
 *
 * \return JSON string mapped to \p e
 *
 * \throw SerializationFailureException if \p e is not in \p map
 */
template<typename EnumToStringMap>
nlohmann::json enumToJson(
    const EnumToStringMap& map,
    const typename EnumToStringMap::left_key_type e)
{
    const auto iter = map.left.find(e);
    if (iter == map.left.end()) {
        throw SerializationFailureException {};
    }
    return iter->second;
}

/** \brief Convert JSON string to enumeration
 *
 * \param map bimap from the enumeration to its string representation
 * \param j the JSON value
 *
 * \return the enumeration \p j is mapped to
 *
 * \throw SerializationFailureException if \p j is not a string in \p map
 */
template<typename EnumToStringMap>
auto jsonToEnum(const EnumToStringMap& map, const nlohmann::json& j)
{
    if (!j.is_string()) {
        throw SerializationFailureException {};
    }
    const auto iter = map.right.find(j.get_ref<const std::string&>());
    if (iter == map.right.end()) {
        throw SerializationFailureException {};
    }
    return iter->second;
}

/** \brief Validate a deserialized value
 *
 * \param t the object to validate
 * \param preds predicates invoked with \p t
 *
 * \return \p t if all predicates evaluate to true
 *
 * \throw SerializationFailureException if any predicate evaluates to false
 */
template<typename T, typename... Preds>
T validate(T&& t, Preds&&... preds)
{
    if ( ( ... && std::invoke(std::forward<Preds>(preds), t) ) ) {
        return std::forward<T>(t);
    }
    throw SerializationFailureException {};
}

/** \brief Convert JSON to object, returning none on error
 */
template<typename T>
std::optional<T> tryFromJson(const nlohmann::json& j)
{
    try {
        return j.get<T>();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}
}

#endif // MESSAGING_JSONSERIALIZERUTILITY_HH_
