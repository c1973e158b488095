#include "clue/Board.hh"

#include <algorithm>
#include <initializer_list>
#include <ostream>

namespace Clue {

namespace {

const auto HALLWAY_STRING_PAIRS =
    std::initializer_list<HallwayToStringMap::value_type> {
    { Hallway::HALLWAY1,  "hallway1"  },
    { Hallway::HALLWAY2,  "hallway2"  },
    { Hallway::HALLWAY3,  "hallway3"  },
    { Hallway::HALLWAY4,  "hallway4"  },
    { Hallway::HALLWAY5,  "hallway5"  },
    { Hallway::HALLWAY6,  "hallway6"  },
    { Hallway::HALLWAY7,  "hallway7"  },
    { Hallway::HALLWAY8,  "hallway8"  },
    { Hallway::HALLWAY9,  "hallway9"  },
    { Hallway::HALLWAY10, "hallway10" },
    { Hallway::HALLWAY11, "hallway11" },
    { Hallway::HALLWAY12, "hallway12" }};

// Indexed by Hallway
constexpr std::array<std::pair<Room, Room>, N_HALLWAYS> HALLWAY_ROOMS {{
    { Room::STUDY,         Room::HALL          },
    { Room::HALL,          Room::LOUNGE        },
    { Room::STUDY,         Room::LIBRARY       },
    { Room::HALL,          Room::BILLIARD_ROOM },
    { Room::LOUNGE,        Room::DINING_ROOM   },
    { Room::LIBRARY,       Room::BILLIARD_ROOM },
    { Room::BILLIARD_ROOM, Room::DINING_ROOM   },
    { Room::LIBRARY,       Room::CONSERVATORY  },
    { Room::BILLIARD_ROOM, Room::BALLROOM      },
    { Room::DINING_ROOM,   Room::KITCHEN       },
    { Room::CONSERVATORY,  Room::BALLROOM      },
    { Room::BALLROOM,      Room::KITCHEN       },
}};

constexpr std::array<std::pair<Room, Room>, 2> SECRET_PASSAGES {{
    { Room::STUDY,  Room::KITCHEN      },
    { Room::LOUNGE, Room::CONSERVATORY },
}};

// Indexed by Suspect
constexpr std::array<Hallway, N_SUSPECTS> STARTING_HALLWAYS {
    Hallway::HALLWAY2,   // Miss Scarlet
    Hallway::HALLWAY3,   // Professor Plum
    Hallway::HALLWAY8,   // Mrs. Peacock
    Hallway::HALLWAY11,  // Mr. Green
    Hallway::HALLWAY12,  // Mrs. White
    Hallway::HALLWAY5,   // Colonel Mustard
};

struct NeighbourVisitor {

    std::vector<Location> operator()(const Room room) const
    {
        auto ret = std::vector<Location> {};
        for (const auto hallway : HALLWAYS) {
            const auto& [first, second] = getHallwayRooms(hallway);
            if (first == room || second == room) {
                ret.emplace_back(hallway);
            }
        }
        if (const auto other = getSecretPassage(room)) {
            ret.emplace_back(*other);
        }
        return ret;
    }

    std::vector<Location> operator()(const Hallway hallway) const
    {
        const auto& [first, second] = getHallwayRooms(hallway);
        return { first, second };
    }
};

}

const HallwayToStringMap HALLWAY_TO_STRING_MAP(
    HALLWAY_STRING_PAIRS.begin(), HALLWAY_STRING_PAIRS.end());

bool isRoom(const Location& location)
{
    return std::holds_alternative<Room>(location);
}

bool isHallway(const Location& location)
{
    return std::holds_alternative<Hallway>(location);
}

std::pair<Room, Room> getHallwayRooms(const Hallway hallway)
{
    return HALLWAY_ROOMS.at(static_cast<std::size_t>(hallway));
}

std::optional<Room> getSecretPassage(const Room room)
{
    for (const auto& [first, second] : SECRET_PASSAGES) {
        if (first == room) {
            return second;
        } else if (second == room) {
            return first;
        }
    }
    return std::nullopt;
}

std::vector<Location> getNeighbours(const Location& location)
{
    return std::visit(NeighbourVisitor {}, location);
}

bool areAdjacent(const Location& from, const Location& to)
{
    const auto neighbours = getNeighbours(from);
    return std::find(neighbours.begin(), neighbours.end(), to) !=
        neighbours.end();
}

Hallway getStartingHallway(const Suspect character)
{
    return STARTING_HALLWAYS.at(static_cast<std::size_t>(character));
}

std::ostream& operator<<(std::ostream& os, const Hallway hallway)
{
    return os << HALLWAY_TO_STRING_MAP.left.at(hallway);
}

}
