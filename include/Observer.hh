/** \file
 *
 * \brief Definition of the observer pattern used for domain events
 *
 * Observable does not synchronize anything itself. The owner of an observable
 * is responsible for notifying only while holding whatever lock protects the
 * state the notification describes.
 */

#ifndef OBSERVER_HH_
#define OBSERVER_HH_

#include "FunctionQueue.hh"

#include <list>
#include <memory>
#include <tuple>
#include <utility>

namespace Clue {

/** \brief Receiver of notifications
 *
 * \sa Observable
 */
template<typename... T>
class Observer {
public:
    virtual ~Observer() = default;

    /** \brief Notify the observer
     */
    void notify(const T&... args);

private:

    /** \brief Handle notification
     */
    virtual void handleNotify(const T&... args) = 0;
};

template<typename... T>
void Observer<T...>::notify(const T&... args)
{
    handleNotify(args...);
}

/** \brief Publisher of notifications
 *
 * Observers are held weakly. An observer whose lifetime has ended is
 * forgotten the next time notifications are dispatched.
 */
template<typename... T>
class Observable {
public:

    /** \brief Subscribe \p observer to future notifications
     */
    void subscribe(std::weak_ptr<Observer<T...>> observer);

    /** \brief Notify every subscribed observer
     *
     * A notification emitted from within an observer is dispatched after the
     * current one has reached every observer.
     */
    template<typename... U>
    void notifyAll(U&&... args);

private:

    template<std::size_t... Ns>
    void dispatch(const std::tuple<T...>& args, std::index_sequence<Ns...>);

    std::list<std::weak_ptr<Observer<T...>>> observers;
    FunctionQueue functionQueue;
};

template<typename... T>
void Observable<T...>::subscribe(std::weak_ptr<Observer<T...>> observer)
{
    observers.emplace_back(std::move(observer));
}

template<typename... T>
template<typename... U>
void Observable<T...>::notifyAll(U&&... args)
{
    functionQueue(
        [this, args = std::tuple<T...> {std::forward<U>(args)...}]()
        {
            dispatch(args, std::index_sequence_for<T...> {});
        });
}

template<typename... T>
template<std::size_t... Ns>
void Observable<T...>::dispatch(
    const std::tuple<T...>& args, std::index_sequence<Ns...>)
{
    auto iter = observers.begin();
    while (iter != observers.end()) {
        if (const auto observer = iter->lock()) {
            observer->notify(std::get<Ns>(args)...);
            ++iter;
        } else {
            iter = observers.erase(iter);
        }
    }
}

}

#endif // OBSERVER_HH_
