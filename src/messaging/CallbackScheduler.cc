#include "messaging/CallbackScheduler.hh"

namespace Clue {
namespace Messaging {

CallbackScheduler::~CallbackScheduler() = default;

void CallbackScheduler::handleCallSoon(Callback callback)
{
    handleCallLater(std::chrono::milliseconds::zero(), std::move(callback));
}

}
}
