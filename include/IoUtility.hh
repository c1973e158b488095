/** \file
 *
 * \brief Stream related helpers
 */

#ifndef IOUTILITY_HH_
#define IOUTILITY_HH_

#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace Clue {

/** \brief Write optional value to a stream
 *
 * An empty optional is written as “(none)”.
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::optional<T>& t)
{
    if (!t) {
        return os << "(none)";
    }
    return os << *t;
}

/** \brief Write the active alternative of a variant to a stream
 */
template<typename T, typename... Ts>
std::ostream& operator<<(std::ostream& os, const std::variant<T, Ts...>& t)
{
    std::visit([&os](const auto& v) { os << v; }, t);
    return os;
}

/** \brief Invoke \p callback with an input stream opened from \p path
 *
 * A single hyphen means the standard input. Otherwise the file at \p path is
 * opened for the duration of the call.
 *
 * \param path filesystem path or “-”
 * \param callback callable accepting <tt>std::istream&</tt>
 *
 * \return whatever \p callback returns
 */
template<typename Callable>
decltype(auto) processStreamFromPath(std::string_view path, Callable&& callback)
{
    if (path == "-") {
        return std::invoke(std::forward<Callable>(callback), std::cin);
    }
    auto in = std::ifstream {std::string {path}};
    return std::invoke(std::forward<Callable>(callback), in);
}

}

#endif // IOUTILITY_HH_
