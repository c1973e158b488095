#include "clue/CardShuffle.hh"

#include <algorithm>
#include <stdexcept>

namespace Clue {

namespace {

template<typename Array>
auto drawFrom(const Array& values, Rng& rng)
{
    auto dist = std::uniform_int_distribution<std::size_t> {
        0, values.size() - 1};
    return values[dist(rng)];
}

}

CaseFile drawCaseFile(Rng& rng)
{
    const auto suspect = drawFrom(SUSPECTS, rng);
    const auto weapon = drawFrom(WEAPONS, rng);
    const auto room = drawFrom(ROOMS, rng);
    return CaseFile {suspect, weapon, room};
}

DealtCards dealCards(const int nPlayers, Rng& rng)
{
    if (nPlayers <= 0) {
        throw std::invalid_argument {"Cannot deal cards to no players"};
    }

    auto ret = DealtCards {drawCaseFile(rng), {}};
    auto deck = allCards();
    std::erase_if(
        deck, [&caseFile = ret.caseFile](const auto& card)
        {
            return caseFile.contains(card);
        });
    std::shuffle(deck.begin(), deck.end(), rng);

    ret.hands.resize(static_cast<std::size_t>(nPlayers));
    auto n = std::size_t {};
    for (const auto& card : deck) {
        ret.hands[n].push_back(card);
        n = (n + 1) % ret.hands.size();
    }
    return ret;
}

}
