#include "clue/CaseFile.hh"

#include <algorithm>
#include <ostream>

namespace Clue {

bool CaseFile::contains(const Card& card) const
{
    const auto cards = getCards();
    return std::find(cards.begin(), cards.end(), card) != cards.end();
}

std::array<Card, N_CASE_FILE_CARDS> CaseFile::getCards() const
{
    return { suspect, weapon, room };
}

bool operator==(const CaseFile& lhs, const CaseFile& rhs)
{
    return lhs.suspect == rhs.suspect && lhs.weapon == rhs.weapon &&
        lhs.room == rhs.room;
}

std::ostream& operator<<(std::ostream& os, const CaseFile& caseFile)
{
    return os << caseFile.suspect << " with " << caseFile.weapon << " in " <<
        caseFile.room;
}

}
