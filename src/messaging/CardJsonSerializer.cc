#include "messaging/CardJsonSerializer.hh"

#include "clue/CaseFile.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/SerializationFailureException.hh"

#include <variant>

using nlohmann::json;
using Clue::Messaging::enumToJson;
using Clue::Messaging::jsonToEnum;

namespace Clue {

const std::string CARD_KIND_KEY {"kind"};
const std::string CARD_NAME_KEY {"name"};
const std::string CASE_FILE_SUSPECT_KEY {"suspect"};
const std::string CASE_FILE_WEAPON_KEY {"weapon"};
const std::string CASE_FILE_ROOM_KEY {"room"};

void to_json(json& j, const Suspect suspect)
{
    j = enumToJson(SUSPECT_TO_STRING_MAP, suspect);
}

void from_json(const json& j, Suspect& suspect)
{
    suspect = jsonToEnum(SUSPECT_TO_STRING_MAP, j);
}

void to_json(json& j, const Weapon weapon)
{
    j = enumToJson(WEAPON_TO_STRING_MAP, weapon);
}

void from_json(const json& j, Weapon& weapon)
{
    weapon = jsonToEnum(WEAPON_TO_STRING_MAP, j);
}

void to_json(json& j, const Room room)
{
    j = enumToJson(ROOM_TO_STRING_MAP, room);
}

void from_json(const json& j, Room& room)
{
    room = jsonToEnum(ROOM_TO_STRING_MAP, j);
}

void to_json(json& j, const Card& card)
{
    j = json::object();
    j.emplace(
        CARD_KIND_KEY,
        enumToJson(CARD_KIND_TO_STRING_MAP, getCardKind(card)));
    std::visit(
        [&j](const auto value) { j.emplace(CARD_NAME_KEY, json(value)); },
        card);
}

void from_json(const json& j, Card& card)
{
    if (!j.is_object()) {
        throw Messaging::SerializationFailureException {};
    }
    const auto& name = j.at(CARD_NAME_KEY);
    switch (jsonToEnum(CARD_KIND_TO_STRING_MAP, j.at(CARD_KIND_KEY))) {
    case CardKind::SUSPECT:
        card = name.get<Suspect>();
        break;
    case CardKind::WEAPON:
        card = name.get<Weapon>();
        break;
    case CardKind::ROOM:
        card = name.get<Room>();
        break;
    }
}

void to_json(json& j, const CaseFile& caseFile)
{
    j = json::object();
    j.emplace(CASE_FILE_SUSPECT_KEY, json(caseFile.suspect));
    j.emplace(CASE_FILE_WEAPON_KEY, json(caseFile.weapon));
    j.emplace(CASE_FILE_ROOM_KEY, json(caseFile.room));
}

void from_json(const json& j, CaseFile& caseFile)
{
    caseFile.suspect = j.at(CASE_FILE_SUSPECT_KEY).get<Suspect>();
    caseFile.weapon = j.at(CASE_FILE_WEAPON_KEY).get<Weapon>();
    caseFile.room = j.at(CASE_FILE_ROOM_KEY).get<Room>();
}

}
