/** \file
 *
 * \brief Definition of general purpose utilities
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <concepts>
#include <cstddef>
#include <ranges>
#include <stdexcept>
#include <type_traits>

namespace Clue {

/** \brief Check that \p i is a valid index to a sequence of size \p n
 *
 * \return i
 *
 * \throw std::out_of_range if i < 0 or i >= n
 */
template<typename Integer1, typename Integer2>
constexpr auto checkIndex(Integer1 i, Integer2 n)
{
    if (i < 0 || i >= n) {
        throw std::out_of_range("Index out of range");
    }
    return i;
}

/** \brief Dereference a pointer‐like object checking it first
 *
 * \throw std::invalid_argument if \p p is empty
 */
template<typename T>
constexpr decltype(auto) dereference(const T& p)
{
    if (!p) {
        throw std::invalid_argument("Trying to dereference nullptr");
    }
    return *p;
}

/** \brief Range over integers from \p m to \p n (exclusive)
 *
 * \code{.cc}
 * for (const auto i : from_to(1, 4)) {
 *     // i is 1, 2, 3
 * }
 * \endcode
 *
 * \throw std::invalid_argument if \p m > \p n
 */
template<std::integral Integer>
constexpr auto from_to(std::type_identity_t<Integer> m, Integer n)
{
    if (m > n) {
        throw std::invalid_argument {"Invalid integer range"};
    }
    return std::ranges::views::iota(m, n);
}

/** \brief Shorthand for from_to(0, n)
 */
template<std::integral Integer>
constexpr auto to(Integer n)
{
    return from_to(Integer {}, n);
}

}

#endif // UTILITY_HH_
