#pragma once

#include <exception>
#include <string>
#include <utility>

#include <cstdint>

#include "../outcome.hpp"

namespace railyard::auth {

/**
 * Which part of the authentication pipeline failed.
 */
enum class ErrorKind : uint8_t {
    invalid_input,       ///< Username or password empty or blank
    not_found,           ///< User lookup failed
    credential_mismatch, ///< Password check failed
    notify_failed,       ///< Confirmation could not be delivered
    history_failed,      ///< Login history could not be recorded
    internal_fault       ///< A collaborator threw instead of returning a failure
};

/**
 * Convert ErrorKind to a short, stable identifier for logs.
 */
constexpr const char* error_kind_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::invalid_input:
            return "invalid_input";
        case ErrorKind::not_found:
            return "not_found";
        case ErrorKind::credential_mismatch:
            return "credential_mismatch";
        case ErrorKind::notify_failed:
            return "notify_failed";
        case ErrorKind::history_failed:
            return "history_failed";
        case ErrorKind::internal_fault:
            return "internal_fault";
        default:
            return "unknown";
    }
}

/**
 * @brief Error value carried on the failure track of the pipeline
 *
 * The kind says which step failed; the detail is the text reported by
 * that step's collaborator (or the pipeline's own text for validation).
 */
struct AuthError {
    ErrorKind kind;     ///< Failing step
    std::string detail; ///< Human-readable reason

    /**
     * @brief Get the human-readable error message
     */
    [[nodiscard]] const std::string& message() const noexcept { return detail; }

    friend bool operator==(const AuthError&, const AuthError&) = default;
};

/**
 * @brief Factory for the failure branch of an authentication outcome
 *
 * Usage:
 * @code
 *   return make_auth_error(ErrorKind::invalid_input, "Invalid params");
 * @endcode
 */
inline auto make_auth_error(ErrorKind kind, std::string detail) {
    return unexpected(AuthError{.kind = kind, .detail = std::move(detail)});
}

/**
 * Returns a callable that lifts a collaborator's string error into an
 * AuthError of the given kind. Intended for map_error().
 */
inline auto tag_error(ErrorKind kind) {
    return [kind](std::string detail) { return AuthError{.kind = kind, .detail = std::move(detail)}; };
}

} // namespace railyard::auth

namespace railyard {

// Exceptions escaping a collaborator are reported as internal faults.
template <>
struct fault_traits<auth::AuthError> {
    static auth::AuthError from_exception(const std::exception& ex) {
        return auth::AuthError{.kind = auth::ErrorKind::internal_fault, .detail = ex.what()};
    }
    static auth::AuthError from_unknown() {
        return auth::AuthError{.kind = auth::ErrorKind::internal_fault, .detail = "unknown exception"};
    }
};

} // namespace railyard
