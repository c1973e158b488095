#include "messaging/SessionJsonSerializer.hh"

#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/UuidJsonSerializer.hh"

#include <variant>

using nlohmann::json;
using Clue::Messaging::enumToJson;
using Clue::Messaging::jsonToEnum;

namespace Clue {

void to_json(json& j, const Participation participation)
{
    j = enumToJson(PARTICIPATION_TO_STRING_MAP, participation);
}

void from_json(const json& j, Participation& participation)
{
    participation = jsonToEnum(PARTICIPATION_TO_STRING_MAP, j);
}

namespace Engine {

const std::string OUTCOME_RESULT_KEY {"result"};
const std::string OUTCOME_DISPROVER_KEY {"disprover"};
const std::string OUTCOME_CARD_KEY {"card"};

void to_json(json& j, const SessionStatus status)
{
    j = enumToJson(SESSION_STATUS_TO_STRING_MAP, status);
}

void from_json(const json& j, SessionStatus& status)
{
    status = jsonToEnum(SESSION_STATUS_TO_STRING_MAP, j);
}

void to_json(json& j, const AccusationOutcome outcome)
{
    j = enumToJson(ACCUSATION_OUTCOME_TO_STRING_MAP, outcome);
}

void from_json(const json& j, AccusationOutcome& outcome)
{
    outcome = jsonToEnum(ACCUSATION_OUTCOME_TO_STRING_MAP, j);
}

void to_json(json& j, const SessionError error)
{
    j = enumToJson(SESSION_ERROR_TO_STRING_MAP, error);
}

void from_json(const json& j, SessionError& error)
{
    error = jsonToEnum(SESSION_ERROR_TO_STRING_MAP, j);
}

namespace {

struct SuggestionOutcomeToJsonVisitor {
    json& j;

    void operator()(const CardRevealed& outcome) const
    {
        j.emplace(OUTCOME_RESULT_KEY, "revealed");
        j.emplace(OUTCOME_DISPROVER_KEY, json(outcome.disprover));
        j.emplace(OUTCOME_CARD_KEY, json(outcome.card));
    }

    void operator()(const NoRefute&) const
    {
        j.emplace(OUTCOME_RESULT_KEY, "norefute");
    }

    void operator()(const AwaitingDisprove& outcome) const
    {
        j.emplace(OUTCOME_RESULT_KEY, "pending");
        j.emplace(OUTCOME_DISPROVER_KEY, json(outcome.disprover));
    }
};

}

void to_json(json& j, const SuggestionOutcome& outcome)
{
    j = json::object();
    std::visit(SuggestionOutcomeToJsonVisitor {j}, outcome);
}

}
}
