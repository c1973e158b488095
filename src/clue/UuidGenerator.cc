#include "clue/UuidGenerator.hh"

namespace Clue {

Uuid generateUuid()
{
    thread_local UuidGenerator uuidGenerator {&getRng()};
    return uuidGenerator();
}

}
