#pragma once

#include <concepts>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include "expected.hpp"

namespace railyard {

/**
 * @brief Binary outcome of a fallible step
 *
 * Alias for expected<T, E>: holds either the success value T or the failure
 * value E, never both and never neither. Outcome<void, E> is the outcome of a
 * step that only reports pass or fail.
 *
 * Usage:
 * @code
 *   Outcome<User, std::string> find(std::string_view name) {
 *       if (auto it = users.find(name); it != users.end()) {
 *           return it->second;
 *       }
 *       return failure(std::string("not found"));
 *   }
 * @endcode
 *
 * @tparam T Success value type (may be void)
 * @tparam E Failure value type
 */
template <typename T, typename E>
using Outcome = expected<T, E>;

/**
 * @brief Factory for the failure branch of an Outcome
 *
 * Returns unexpected<E>, which converts to any Outcome<T, E>.
 */
template <typename E>
constexpr auto failure(E&& error) {
    return make_unexpected(std::forward<E>(error));
}

namespace detail {

template <typename T>
struct is_outcome : std::false_type {};

template <typename T, typename E>
struct is_outcome<expected<T, E>> : std::true_type {};

} // namespace detail

/**
 * Any Outcome<T, E>, ignoring references and cv-qualifiers.
 */
template <typename O>
concept OutcomeLike = detail::is_outcome<std::remove_cvref_t<O>>::value;

template <OutcomeLike O>
using outcome_value_t = typename std::remove_cvref_t<O>::value_type;

template <OutcomeLike O>
using outcome_error_t = typename std::remove_cvref_t<O>::error_type;

/**
 * Two outcomes that share the same failure type, so one can stand in for
 * the other on the failure track.
 */
template <typename A, typename B>
concept SameErrorTrack =
    OutcomeLike<A> && OutcomeLike<B> && std::same_as<outcome_error_t<A>, outcome_error_t<B>>;

/**
 * @brief Conversion from a caught exception to a failure value
 *
 * Used by guard(), try_with() and try_map() to turn an exception raised
 * inside a wrapped step into the failure branch. from_exception() handles
 * anything derived from std::exception; from_unknown() handles every other
 * thrown type. The primary template builds E from a string, so error types
 * that are not constructible from a string specialise this template.
 *
 * @tparam E Failure value type
 */
template <typename E>
struct fault_traits {
    static E from_exception(const std::exception& ex) { return E(std::string(ex.what())); }
    static E from_unknown() { return E(std::string("unknown exception")); }
};

} // namespace railyard
