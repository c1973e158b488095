#include "main/GameStateHelper.hh"

#include "engine/SessionState.hh"
#include "main/Commands.hh"
#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/LocationJsonSerializer.hh"
#include "messaging/SessionJsonSerializer.hh"
#include "messaging/UuidJsonSerializer.hh"

#include <cstddef>
#include <optional>
#include <utility>

namespace Clue {
namespace Main {

using Engine::SessionState;

namespace {

auto getPlayerUuid(
    const SessionState& state, const std::optional<std::size_t>& index)
{
    auto ret = std::optional<Uuid> {};
    if (index) {
        ret = state.players.at(*index).uuid;
    }
    return ret;
}

auto getPlayers(const SessionState& state)
{
    auto players = nlohmann::json::array();
    for (auto n = std::size_t {}; n < state.players.size(); ++n) {
        const auto& player = state.players[n];
        players.push_back(
            nlohmann::json {
                { PLAYER_COMMAND, player.uuid },
                { CHARACTER_COMMAND, player.character },
                { LOCATION_COMMAND, Engine::getPlayerLocation(state, n) },
                { PARTICIPATION_COMMAND, player.participation },
                { ACTIVE_COMMAND, player.isConnected() },
                { ELIMINATED_COMMAND, player.isEliminated() },
                { IS_TURN_COMMAND, Engine::isTurnHolder(state, n) },
            });
    }
    return players;
}

auto getTokens(const SessionState& state)
{
    auto tokens = nlohmann::json::object();
    for (const auto suspect : SUSPECTS) {
        tokens.emplace(
            SUSPECT_TO_STRING_MAP.left.at(suspect),
            Engine::getTokenLocation(state, suspect));
    }
    return tokens;
}

}

GameState getPubstate(const SessionState& state)
{
    auto ret = GameState {
        { STATUS_COMMAND, state.status },
        { HOST_COMMAND, getPlayerUuid(state, state.hostIndex) },
        { TURN_COMMAND, getPlayerUuid(state, Engine::getTurnHolder(state)) },
        { WINNER_COMMAND, getPlayerUuid(state, state.winner) },
        { PLAYERS_COMMAND, getPlayers(state) },
        { TOKENS_COMMAND, getTokens(state) },
    };
    // The solution is revealed only when somebody has solved it
    if (state.winner && state.caseFile) {
        ret.emplace(CASE_FILE_COMMAND, *state.caseFile);
    }
    return ret;
}

void emplacePubstate(const SessionState& state, GameState& out)
{
    out.emplace(PUBSTATE_COMMAND, getPubstate(state));
}

void emplacePrivstate(
    const SessionState& state, const Uuid& player, GameState& out)
{
    const auto index = Engine::findPlayer(state, player);
    if (!index) {
        out.emplace(PRIVSTATE_COMMAND, nlohmann::json::object());
        return;
    }
    auto last_outcome = std::optional<Engine::SuggestionOutcome> {};
    if (const auto iter = state.lastOutcomes.find(player);
        iter != state.lastOutcomes.end()) {
        last_outcome = iter->second;
    }
    out.emplace(
        PRIVSTATE_COMMAND,
        nlohmann::json {
            { HAND_COMMAND, state.players[*index].hand },
            { LAST_OUTCOME_COMMAND, last_outcome },
        });
}

void emplaceSelf(
    const SessionState& state, const Uuid& player, GameState& out)
{
    const auto index = Engine::findPlayer(state, player);
    auto self = nlohmann::json {
        { PLAYER_COMMAND, player },
        { CHARACTER_COMMAND, nullptr },
        { PENDING_DISPROVE_COMMAND, nullptr },
    };
    if (index) {
        self[CHARACTER_COMMAND] = state.players[*index].character;
        const auto& pending = state.pendingDisprove;
        if (pending && pending->disprover == *index) {
            self[PENDING_DISPROVE_COMMAND] = nlohmann::json {
                { REQUEST_COMMAND, pending->id },
                { PLAYER_COMMAND, state.players.at(pending->suggester).uuid },
                { SUSPECT_COMMAND, pending->suggestion.suspect },
                { WEAPON_COMMAND, pending->suggestion.weapon },
                { ROOM_COMMAND, pending->suggestion.room },
                { MATCHING_CARDS_COMMAND, pending->matchingCards },
            };
        }
    }
    out.emplace(SELF_COMMAND, std::move(self));
}

}
}
