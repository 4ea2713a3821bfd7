/** \file
 *
 * \brief Small helpers shared by the rule engine and the front end
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace Klondike {

/** \brief Validate a container index
 *
 * \param i the index
 * \param n the size of the container
 *
 * \return \p i
 *
 * \throw std::out_of_range unless 0 <= \p i < \p n
 */
inline int checkIndex(const int i, const int n)
{
    if (i < 0 || i >= n) {
        throw std::out_of_range {
            "Index " + std::to_string(i) + " not below " + std::to_string(n)};
    }
    return i;
}

/** \brief Range of integers 0, 1, ..., n - 1 for use in ranged for
 *
 * \throw std::invalid_argument if \p n < 0
 */
inline auto to(const int n)
{
    if (n < 0) {
        throw std::invalid_argument {"Negative range length"};
    }
    return std::views::iota(0, n);
}

/** \brief Output optional value
 *
 * Writes the wrapped value, or “none” if \p t is empty.
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::optional<T>& t)
{
    if (!t) {
        return os << "none";
    }
    return os << *t;
}

/** \brief Output the active alternative of a variant
 */
template<typename T0, typename... Ts>
std::ostream& operator<<(std::ostream& os, const std::variant<T0, Ts...>& t)
{
    std::visit([&os](const auto& alternative) { os << alternative; }, t);
    return os;
}

/** \brief Invoke \p callback with an input stream opened from \p path
 *
 * A hyphen (“-”) stands for \c std::cin. Any other \p path is opened as a
 * file, which stays open until \p callback returns.
 *
 * \param path a filesystem path or hyphen
 * \param callback a callable accepting \c std::istream&
 *
 * \return whatever \p callback returns
 *
 * \throw std::runtime_error if the file cannot be opened
 */
template<typename Callable>
decltype(auto) withInputStream(const std::string_view path, Callable&& callback)
{
    if (path == "-") {
        return std::invoke(std::forward<Callable>(callback), std::cin);
    }
    auto in = std::ifstream {std::string {path}};
    if (!in.is_open()) {
        throw std::runtime_error {
            "Could not open " + std::string {path}};
    }
    return std::invoke(
        std::forward<Callable>(callback), static_cast<std::istream&>(in));
}

}

#endif // UTILITY_HH_
