#pragma once

#include <mutex>
#include <ostream>
#include <string_view>

#include "auth_error.hpp"
#include "user.hpp"

namespace railyard::auth {

/**
 * @brief Observability sink for authentication attempts
 *
 * The pipeline reports exactly one success or failure per attempt, plus
 * warnings for failures it chose to tolerate. Implementations must not
 * throw; a broken sink never fails a login.
 *
 * The caller owns the sink and its lifetime; it must outlive every
 * Authenticator that refers to it.
 */
class AuditLog {
public:
    virtual ~AuditLog() = default;

    virtual void record_success(const User& user) noexcept = 0;
    virtual void record_failure(const AuthError& error) noexcept = 0;
    virtual void record_warning(std::string_view message) noexcept = 0;
};

/**
 * Audit log that drops every event.
 */
class NullAuditLog final : public AuditLog {
public:
    void record_success(const User&) noexcept override {}
    void record_failure(const AuthError&) noexcept override {}
    void record_warning(std::string_view) noexcept override {}
};

/**
 * @brief Audit log writing one line per event to a std::ostream
 *
 * Line formats:
 *   [auth] success user=<id>
 *   [auth] failure kind=<kind> detail=<detail>
 *   [auth] warning <message>
 *
 * Writes are serialised so one instance can be shared by concurrent
 * authenticators. An event whose write throws is dropped. The stream must
 * outlive the log.
 */
class StreamAuditLog final : public AuditLog {
public:
    explicit StreamAuditLog(std::ostream& out) noexcept : out_(out) {}

    void record_success(const User& user) noexcept override {
        write_line([&](std::ostream& out) { out << "[auth] success user=" << user.id << '\n'; });
    }

    void record_failure(const AuthError& error) noexcept override {
        write_line([&](std::ostream& out) {
            out << "[auth] failure kind=" << error_kind_string(error.kind)
                << " detail=" << error.message() << '\n';
        });
    }

    void record_warning(std::string_view message) noexcept override {
        write_line([&](std::ostream& out) { out << "[auth] warning " << message << '\n'; });
    }

private:
    // A stream that throws, or a lock that cannot be taken, drops the event.
    template <typename Write>
    void write_line(Write&& write) noexcept {
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            write(out_);
        } catch (...) {
            return;
        }
    }

    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace railyard::auth
