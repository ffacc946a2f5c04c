#pragma once

#include <string>

#include <cstdint>

namespace railyard::auth {

/**
 * What a failed confirmation notification does to the login.
 */
enum class NotifyPolicy : uint8_t {
    required,   ///< Delivery failure fails the login
    best_effort ///< Delivery failure is logged as a warning, login proceeds
};

constexpr const char* notify_policy_string(NotifyPolicy policy) noexcept {
    switch (policy) {
        case NotifyPolicy::required:
            return "required";
        case NotifyPolicy::best_effort:
            return "best_effort";
        default:
            return "unknown";
    }
}

/**
 * @brief Tunables for the authentication pipeline
 *
 * Filled in by the caller; every field has a usable default.
 */
struct AuthOptions {
    std::string confirmation_message = "You have successfully logged in";
    NotifyPolicy notify_policy = NotifyPolicy::required;
};

} // namespace railyard::auth
