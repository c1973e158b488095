/** \file
 *
 * \brief Definition of Clue::Thread
 */

#ifndef THREAD_HH_
#define THREAD_HH_

#include <functional>
#include <thread>
#include <utility>

namespace Clue {

/** \brief Worker thread joined on destruction
 *
 * The thread blocks SIGINT and SIGTERM before running its function so that
 * the termination signals are always delivered to the thread running the
 * message loop.
 */
class Thread {
public:

    /** \brief Create an object without a thread of execution
     */
    Thread() noexcept;

    /** \brief Start a thread calling \p f with \p args
     */
    template<typename Function, typename... Args>
    explicit Thread(Function&& f, Args&&... args);

    Thread(Thread&& other) noexcept;

    /** \brief Join the thread if it is joinable
     */
    ~Thread();

    Thread& operator=(Thread&& other) noexcept;

private:

    static void blockTerminationSignals();

    std::thread thread;
};

template<typename Function, typename... Args>
Thread::Thread(Function&& f, Args&&... args) :
    thread {
        [](auto&& f, auto&&... args)
        {
            blockTerminationSignals();
            std::invoke(
                std::forward<decltype(f)>(f),
                std::forward<decltype(args)>(args)...);
        },
        std::forward<Function>(f), std::forward<Args>(args)...}
{
}

}

#endif // THREAD_HH_
