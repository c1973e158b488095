/** \file
 *
 * \brief Definition of Clue::Messaging::CallbackScheduler
 */

#ifndef MESSAGING_CALLBACKSCHEDULER_HH_
#define MESSAGING_CALLBACKSCHEDULER_HH_

#include <chrono>
#include <functional>
#include <tuple>
#include <utility>

namespace Clue {
namespace Messaging {

/** \brief Interface for scheduling callbacks outside of the call stack
 *
 * The callbacks are executed in the thread of the message loop the
 * scheduler is integrated with, never in the call stack scheduling them.
 */
class CallbackScheduler {
public:

    virtual ~CallbackScheduler();

    /** \brief Schedule callback for execution as soon as possible
     *
     * \param callable the callback
     * \param args the arguments stored and passed to \p callable
     */
    template<typename Callable, typename... Args>
    void callSoon(Callable&& callable, Args&&... args);

    /** \brief Schedule callback for execution after a timeout
     *
     * \param timeout the time after which \p callable is executed
     * \param callable the callback
     * \param args the arguments stored and passed to \p callable
     */
    template<typename Callable, typename... Args>
    void callLater(
        std::chrono::milliseconds timeout, Callable&& callable,
        Args&&... args);

protected:

    /** \brief Type erased callback
     */
    using Callback = std::function<void()>;

private:

    template<typename Callable, typename... Args>
    static Callback bindCallback(Callable&& callable, Args&&... args);

    /** \brief Handle for callSoon()
     *
     * The default implementation calls handleCallLater() with zero timeout.
     */
    virtual void handleCallSoon(Callback callback);

    /** \brief Handle for callLater()
     *
     * The implementation must invoke \p callback at most once.
     */
    virtual void handleCallLater(
        std::chrono::milliseconds timeout, Callback callback) = 0;
};

template<typename Callable, typename... Args>
CallbackScheduler::Callback CallbackScheduler::bindCallback(
    Callable&& callable, Args&&... args)
{
    return [callable = std::forward<Callable>(callable),
            bound_args = std::tuple {std::forward<Args>(args)...}]() mutable
    {
        std::apply(callable, bound_args);
    };
}

template<typename Callable, typename... Args>
void CallbackScheduler::callSoon(Callable&& callable, Args&&... args)
{
    handleCallSoon(
        bindCallback(
            std::forward<Callable>(callable), std::forward<Args>(args)...));
}

template<typename Callable, typename... Args>
void CallbackScheduler::callLater(
    const std::chrono::milliseconds timeout, Callable&& callable,
    Args&&... args)
{
    handleCallLater(
        timeout,
        bindCallback(
            std::forward<Callable>(callable), std::forward<Args>(args)...));
}

}
}

#endif // MESSAGING_CALLBACKSCHEDULER_HH_
