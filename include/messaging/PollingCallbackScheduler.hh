/** \file
 *
 * \brief Definition of Clue::Messaging::PollingCallbackScheduler
 */

#ifndef MESSAGING_POLLINGCALLBACKSCHEDULER_HH_
#define MESSAGING_POLLINGCALLBACKSCHEDULER_HH_

#include "messaging/CallbackScheduler.hh"
#include "messaging/Sockets.hh"
#include "Thread.hh"

#include <boost/core/noncopyable.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace Clue {
namespace Messaging {

/** \brief Callback scheduler integrated with MessageLoop
 *
 * PollingCallbackScheduler stores the callbacks and keeps their deadlines in
 * a timer thread. When a deadline passes, the timer thread sends the
 * identifier of the callback through an inproc socket. The socket returned
 * by getSocket() is registered to the message loop with the scheduler
 * object as its callback, so the callbacks are executed in the thread of the
 * message loop.
 *
 * The timer thread is stopped and joined when the scheduler is destructed.
 */
class PollingCallbackScheduler :
    public CallbackScheduler, private boost::noncopyable {
public:

    /** \brief Create new callback scheduler
     *
     * \param context the ZeroMQ context
     */
    explicit PollingCallbackScheduler(MessageContext& context);

    ~PollingCallbackScheduler();

    /** \brief Get the socket to register to the message loop
     */
    SharedSocket getSocket();

    /** \brief Execute the callbacks whose deadline has passed
     *
     * A callback is removed before it is executed, so it is executed once
     * even if it throws. Exceptions are propagated to the caller.
     *
     * \param socket the socket returned by getSocket()
     */
    void operator()(Socket& socket);

private:

    using CallbackId = std::uint64_t;
    using SchedulerClock = std::chrono::steady_clock;

    struct Deadline {
        SchedulerClock::time_point time;
        CallbackId id;
        bool operator>(const Deadline& other) const
        {
            return time > other.time;
        }
    };

    void handleCallLater(
        std::chrono::milliseconds timeout, Callback callback) override;

    void runTimer(MessageContext& context, std::string endpoint);

    SharedSocket socket;
    std::map<CallbackId, Callback> callbacks;
    CallbackId nextId {};
    std::mutex mutex;
    std::condition_variable condition;
    std::priority_queue<
        Deadline, std::vector<Deadline>, std::greater<Deadline>> deadlines;
    bool stopping {};
    Thread timer;
};

}
}

#endif // MESSAGING_POLLINGCALLBACKSCHEDULER_HH_
