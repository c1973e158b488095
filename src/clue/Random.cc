#include "clue/Random.hh"

namespace Clue {

Rng& getRng()
{
    thread_local Rng randomEngine {std::random_device()()};
    return randomEngine;
}

}
