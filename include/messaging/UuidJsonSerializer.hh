/** \file
 *
 * \brief Definition of JSON serializer for UUID
 *
 * A UUID is represented by its canonical string representation, for example
 * "01234567-89ab-cdef-0123-456789abcdef".
 */

#ifndef MESSAGING_UUIDJSONSERIALIZER_HH_
#define MESSAGING_UUIDJSONSERIALIZER_HH_

#include "clue/Uuid.hh"

#include <nlohmann/json.hpp>

namespace nlohmann {

/** \brief Explicit specialization of adl_serializer for Uuid
 */
template<>
struct adl_serializer<Clue::Uuid> {

    /** \brief Convert UUID to JSON
     */
    static void to_json(json&, const Clue::Uuid&);

    /** \brief Convert JSON to UUID
     */
    static void from_json(const json&, Clue::Uuid&);
};

}

#endif // MESSAGING_UUIDJSONSERIALIZER_HH_
