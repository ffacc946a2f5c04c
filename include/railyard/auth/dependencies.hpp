#pragma once

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

#include "../outcome.hpp"
#include "user.hpp"

namespace railyard::auth {

// ============================================================================
// Collaborator concepts
// ============================================================================

/**
 * Finds a user by name.
 *
 * Signature: `Outcome<User, std::string>(std::string_view username)`
 */
template <typename F>
concept UserLookup = std::invocable<const F&, std::string_view> &&
                     std::same_as<std::remove_cvref_t<std::invoke_result_t<const F&, std::string_view>>,
                                  Outcome<User, std::string>>;

/**
 * Compares the stored credential against the supplied password.
 *
 * Signature: `Outcome<void, std::string>(std::string_view stored, std::string_view provided)`
 */
template <typename F>
concept PasswordChecker =
    std::invocable<const F&, std::string_view, std::string_view> &&
    std::same_as<std::remove_cvref_t<std::invoke_result_t<const F&, std::string_view, std::string_view>>,
                 Outcome<void, std::string>>;

/**
 * Delivers a message to an email address.
 *
 * Signature: `Outcome<void, std::string>(std::string_view email, std::string_view message)`
 */
template <typename F>
concept Notifier =
    std::invocable<const F&, std::string_view, std::string_view> &&
    std::same_as<std::remove_cvref_t<std::invoke_result_t<const F&, std::string_view, std::string_view>>,
                 Outcome<void, std::string>>;

/**
 * Appends a successful login to the user's history.
 *
 * Signature: `Outcome<void, std::string>(const User& user)`
 */
template <typename F>
concept HistoryRecorder =
    std::invocable<const F&, const User&> &&
    std::same_as<std::remove_cvref_t<std::invoke_result_t<const F&, const User&>>,
                 Outcome<void, std::string>>;

/**
 * History recorder used when the caller supplies none. Never called.
 */
struct NoHistory {
    Outcome<void, std::string> operator()(const User&) const noexcept { return {}; }
};

// ============================================================================
// std::function collaborator types
// ============================================================================

using LookupCallback = std::function<Outcome<User, std::string>(std::string_view)>;
using PasswordCheckCallback =
    std::function<Outcome<void, std::string>(std::string_view, std::string_view)>;
using NotifyCallback = std::function<Outcome<void, std::string>(std::string_view, std::string_view)>;
using HistoryCallback = std::function<Outcome<void, std::string>(const User&)>;

namespace detail {

template <typename F>
struct is_std_function : std::false_type {};

template <typename Sig>
struct is_std_function<std::function<Sig>> : std::true_type {};

/**
 * Whether a collaborator can be called: false for NoHistory, empty
 * std::function objects and null function pointers.
 */
template <typename F>
constexpr bool is_present([[maybe_unused]] const F& f) noexcept {
    if constexpr (std::is_same_v<F, NoHistory>) {
        return false;
    } else if constexpr (is_std_function<F>::value) {
        return static_cast<bool>(f);
    } else if constexpr (std::is_pointer_v<F>) {
        return f != nullptr;
    } else {
        return true;
    }
}

} // namespace detail

} // namespace railyard::auth
