#include "messaging/PollingCallbackScheduler.hh"

#include "messaging/MessageUtility.hh"

#include <sstream>
#include <utility>

namespace Clue {
namespace Messaging {

namespace {

std::string makeTimerEndpoint(const void* scheduler)
{
    std::ostringstream os;
    os << "inproc://clue.callbackscheduler." << scheduler;
    return os.str();
}

}

PollingCallbackScheduler::PollingCallbackScheduler(MessageContext& context) :
    socket {makeSharedSocket(context, SocketType::pair)}
{
    auto endpoint = makeTimerEndpoint(this);
    bindSocket(*socket, endpoint);
    timer = Thread {
        &PollingCallbackScheduler::runTimer, this, std::ref(context),
        std::move(endpoint)};
}

PollingCallbackScheduler::~PollingCallbackScheduler()
{
    {
        const auto lock = std::lock_guard {mutex};
        stopping = true;
    }
    condition.notify_all();
}

SharedSocket PollingCallbackScheduler::getSocket()
{
    return socket;
}

void PollingCallbackScheduler::operator()(Socket& socket)
{
    auto id = CallbackId {};
    recvMessage(socket, zmq::mutable_buffer(&id, sizeof(id)));
    const auto iter = callbacks.find(id);
    if (iter != callbacks.end()) {
        const auto callback = std::move(iter->second);
        callbacks.erase(iter);
        callback();
    }
}

void PollingCallbackScheduler::handleCallLater(
    const std::chrono::milliseconds timeout, Callback callback)
{
    const auto id = nextId++;
    callbacks.emplace(id, std::move(callback));
    {
        const auto lock = std::lock_guard {mutex};
        deadlines.push({SchedulerClock::now() + timeout, id});
    }
    condition.notify_all();
}

void PollingCallbackScheduler::runTimer(
    MessageContext& context, std::string endpoint)
{
    auto notifier = Socket {context, SocketType::pair};
    connectSocket(notifier, endpoint);
    auto lock = std::unique_lock {mutex};
    while (!stopping) {
        if (deadlines.empty()) {
            condition.wait(lock);
        } else if (deadlines.top().time <= SchedulerClock::now()) {
            const auto id = deadlines.top().id;
            deadlines.pop();
            lock.unlock();
            sendMessage(notifier, zmq::const_buffer(&id, sizeof(id)));
            lock.lock();
        } else {
            condition.wait_until(lock, deadlines.top().time);
        }
    }
}

}
}
