#pragma once

#include "../combinators.hpp"
#include "../outcome.hpp"
#include "audit_log.hpp"
#include "auth_error.hpp"
#include "auth_options.hpp"
#include "dependencies.hpp"
#include "user.hpp"

#include <array>
#include <concepts>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <cctype>
#include <cstddef>

namespace railyard::auth {

namespace detail {

// UTF-8 encodings of the Unicode whitespace characters outside ASCII
inline constexpr std::array<std::string_view, 19> unicode_spaces = {
    "\xC2\x85", "\xC2\xA0", "\xE1\x9A\x80", "\xE2\x80\x80", "\xE2\x80\x81",
    "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86",
    "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", "\xE2\x80\xA8",
    "\xE2\x80\xA9", "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80",
};

// Byte length of the whitespace character at the front of text, 0 if none
inline std::size_t leading_space_length(std::string_view text) noexcept {
    if (std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        return 1;
    }
    for (std::string_view space : unicode_spaces) {
        if (text.starts_with(space)) {
            return space.size();
        }
    }
    return 0;
}

} // namespace detail

/**
 * @brief True when text is empty or contains only whitespace
 *
 * Whitespace is ASCII whitespace (std::isspace in the "C" locale) plus the
 * UTF-8 encoded Unicode whitespace characters: NEL, NO-BREAK SPACE, OGHAM
 * SPACE MARK, U+2000..U+200A, LINE SEPARATOR, PARAGRAPH SEPARATOR, NARROW
 * NO-BREAK SPACE, MEDIUM MATHEMATICAL SPACE and IDEOGRAPHIC SPACE. Any
 * other byte sequence, including invalid UTF-8, counts as content.
 */
inline bool is_blank(std::string_view text) noexcept {
    while (!text.empty()) {
        std::size_t length = detail::leading_space_length(text);
        if (length == 0) {
            return false;
        }
        text.remove_prefix(length);
    }
    return true;
}

/**
 * @brief First step of the pipeline: reject blank credentials
 *
 * @return Credentials on success, ErrorKind::invalid_input "Invalid params"
 *         when either field is empty or whitespace only
 */
[[nodiscard]] inline Outcome<Credentials, AuthError> validate_credentials(std::string_view username,
                                                                          std::string_view password) {
    if (is_blank(username) || is_blank(password)) {
        return make_auth_error(ErrorKind::invalid_input, "Invalid params");
    }
    return Credentials{.username = std::string(username), .password = std::string(password)};
}

/**
 * @brief Username/password authentication pipeline
 *
 * Steps, each skipped once an earlier one has failed:
 *   1. validate  - reject blank input
 *   2. lookup    - find the user (bind)
 *   3. password  - compare credentials (tee)
 *   4. notify    - send the confirmation message (tee)
 *   5. history   - record the login, if a recorder was given (tee)
 *   6. audit     - report success or failure to the AuditLog (observe, always runs)
 *   7. response  - drop the password, return the user (map)
 *
 * Each collaborator is called at most once per attempt and runs behind a
 * fault boundary: an exception becomes ErrorKind::internal_fault instead of
 * leaving authenticate(). The authenticator itself holds no per-call state,
 * so concurrent calls are safe when the collaborators and log are.
 *
 * Usage:
 * @code
 *   railyard::auth::StreamAuditLog log(std::clog);
 *   railyard::auth::Authenticator auth(lookup, check, notify, log);
 *   auto result = auth.authenticate("alice", "secret");
 * @endcode
 *
 * @tparam Lookup Satisfies UserLookup
 * @tparam Check Satisfies PasswordChecker
 * @tparam Notify Satisfies Notifier
 * @tparam History Satisfies HistoryRecorder (NoHistory skips the step)
 */
template <UserLookup Lookup, PasswordChecker Check, Notifier Notify,
          HistoryRecorder History = NoHistory>
class Authenticator {
public:
    /**
     * Construct without a history recorder.
     *
     * @param log Audit sink; must outlive the authenticator
     * @throws std::invalid_argument if a collaborator is an empty std::function
     *         or null function pointer
     */
    Authenticator(Lookup lookup, Check check, Notify notify, AuditLog& log, AuthOptions options = {})
        requires std::default_initializable<History>
        : Authenticator(std::move(lookup), std::move(check), std::move(notify), History{}, log,
                        std::move(options)) {}

    /**
     * Construct with a history recorder.
     *
     * An empty std::function history recorder is allowed and skips the step.
     *
     * @param log Audit sink; must outlive the authenticator
     * @throws std::invalid_argument if lookup, check or notify is an empty
     *         std::function or null function pointer
     */
    Authenticator(Lookup lookup, Check check, Notify notify, History history, AuditLog& log,
                  AuthOptions options = {})
        : lookup_(std::move(lookup)),
          check_(std::move(check)),
          notify_(std::move(notify)),
          history_(std::move(history)),
          log_(log),
          options_(std::move(options)) {
        if (!detail::is_present(lookup_)) {
            throw std::invalid_argument("Authenticator requires a user lookup");
        }
        if (!detail::is_present(check_)) {
            throw std::invalid_argument("Authenticator requires a password checker");
        }
        if (!detail::is_present(notify_)) {
            throw std::invalid_argument("Authenticator requires a notifier");
        }
    }

    /**
     * @brief Authenticate a username/password pair
     *
     * @return The user returned by the lookup collaborator, or the first
     *         failure encountered. Never throws for collaborator failures.
     */
    [[nodiscard]] Outcome<User, AuthError> authenticate(std::string_view username,
                                                        std::string_view password) const {
        return validate_credentials(username, password)
               | try_with([this](const Credentials& c) { return find_user(c); })
               | tee(guard([this](const AuthenticatedPair& p) { return check_password(p); }))
               | tee([this](const AuthenticatedPair& p) { return confirm(p); })
               | tee(guard([this](const AuthenticatedPair& p) { return record_history(p); }))
               | observe([this](const Outcome<AuthenticatedPair, AuthError>& o) { audit(o); })
               | map([](AuthenticatedPair p) { return std::move(p.user); });
    }

    const AuthOptions& options() const noexcept { return options_; }

    bool records_history() const noexcept { return detail::is_present(history_); }

private:
    Outcome<AuthenticatedPair, AuthError> find_user(const Credentials& credentials) const {
        return std::invoke(lookup_, std::string_view{credentials.username})
               | map_error(tag_error(ErrorKind::not_found))
               | map([&credentials](User user) {
                     return AuthenticatedPair{.user = std::move(user), .password = credentials.password};
                 });
    }

    Outcome<void, AuthError> check_password(const AuthenticatedPair& pair) const {
        return std::invoke(check_, std::string_view{pair.user.password}, std::string_view{pair.password})
               | map_error(tag_error(ErrorKind::credential_mismatch));
    }

    Outcome<void, AuthError> send_confirmation(const AuthenticatedPair& pair) const {
        return std::invoke(notify_, std::string_view{pair.user.email},
                           std::string_view{options_.confirmation_message})
               | map_error(tag_error(ErrorKind::notify_failed));
    }

    // Applies NotifyPolicy on top of the guarded delivery
    Outcome<void, AuthError> confirm(const AuthenticatedPair& pair) const {
        auto sent = guard([this](const AuthenticatedPair& p) { return send_confirmation(p); })(pair);
        if (!sent && options_.notify_policy == NotifyPolicy::best_effort) {
            log_.record_warning("confirmation for user " + pair.user.id +
                                " not delivered: " + sent.error().message());
            return {};
        }
        return sent;
    }

    Outcome<void, AuthError> record_history(const AuthenticatedPair& pair) const {
        if (!detail::is_present(history_)) {
            return {};
        }
        return std::invoke(history_, pair.user) | map_error(tag_error(ErrorKind::history_failed));
    }

    void audit(const Outcome<AuthenticatedPair, AuthError>& outcome) const noexcept {
        if (outcome.has_value()) {
            log_.record_success(outcome->user);
        } else {
            log_.record_failure(outcome.error());
        }
    }

    Lookup lookup_;
    Check check_;
    Notify notify_;
    History history_;
    AuditLog& log_;
    AuthOptions options_;
};

// ============================================================================
// Convenience type aliases
// ============================================================================

/**
 * Authenticator with std::function collaborators.
 *
 * Lets collaborators be chosen at runtime and stored in one type, at the
 * cost of type erasure. For zero overhead use Authenticator directly with
 * lambdas or functors.
 */
using SimpleAuthenticator =
    Authenticator<LookupCallback, PasswordCheckCallback, NotifyCallback, HistoryCallback>;

} // namespace railyard::auth
