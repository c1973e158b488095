#include "messaging/UuidJsonSerializer.hh"

#include "messaging/SerializationFailureException.hh"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <exception>
#include <string>

namespace nlohmann {

void adl_serializer<Clue::Uuid>::to_json(json& j, const Clue::Uuid& uuid)
{
    j = boost::uuids::to_string(uuid);
}

void adl_serializer<Clue::Uuid>::from_json(const json& j, Clue::Uuid& uuid)
{
    if (!j.is_string()) {
        throw Clue::Messaging::SerializationFailureException {};
    }
    auto gen = boost::uuids::string_generator {};
    try {
        uuid = gen(j.get_ref<const std::string&>());
    } catch (const std::exception&) {
        // string_generator reports malformed input with std::runtime_error
        throw Clue::Messaging::SerializationFailureException {};
    }
}

}
