#include "messaging/LocationJsonSerializer.hh"

#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/SerializationFailureException.hh"

#include <string>
#include <variant>

using nlohmann::json;
using Clue::Messaging::enumToJson;
using Clue::Messaging::jsonToEnum;

namespace Clue {

void to_json(json& j, const Hallway hallway)
{
    j = enumToJson(HALLWAY_TO_STRING_MAP, hallway);
}

void from_json(const json& j, Hallway& hallway)
{
    hallway = jsonToEnum(HALLWAY_TO_STRING_MAP, j);
}

void to_json(json& j, const Location& location)
{
    std::visit([&j](const auto value) { j = json(value); }, location);
}

void from_json(const json& j, Location& location)
{
    if (!j.is_string()) {
        throw Messaging::SerializationFailureException {};
    }
    const auto& name = j.get_ref<const std::string&>();
    if (const auto iter = ROOM_TO_STRING_MAP.right.find(name);
        iter != ROOM_TO_STRING_MAP.right.end()) {
        location = iter->second;
    } else {
        location = jsonToEnum(HALLWAY_TO_STRING_MAP, j);
    }
}

}
