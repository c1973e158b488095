/** \file
 *
 * \brief Definition of Clue::FunctionQueue class
 */

#ifndef FUNCTIONQUEUE_HH_
#define FUNCTIONQUEUE_HH_

#include <functional>
#include <list>

namespace Clue {

/** \brief Queue serializing nested calls
 *
 * A function given to the queue while another queued function is executing
 * is not called immediately but after the running one (and any functions
 * queued before it) returns. This keeps notifications of reentrant observers
 * in the order they were emitted.
 */
class FunctionQueue {
public:

    /** \brief Call or enqueue \p function
     *
     * If an exception escapes from a function, the remaining queue is
     * discarded and the exception is propagated.
     *
     * \param function nullary callable, its return value is discarded
     */
    template<typename Function>
    void operator()(Function&& function);

private:

    void processQueue();

    std::list<std::function<void()>> functions;
};

template<typename Function>
void FunctionQueue::operator()(Function&& function)
{
    functions.emplace_back(std::forward<Function>(function));
    if (functions.size() == 1) {
        try {
            processQueue();
        } catch (...) {
            functions.clear();
            throw;
        }
    }
}

inline void FunctionQueue::processQueue()
{
    while (!functions.empty()) {
        functions.front()();
        functions.pop_front();
    }
}

}

#endif // FUNCTIONQUEUE_HH_
