#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <railyard/auth/audit_log.hpp>

using namespace railyard::auth;

namespace {

// Stream buffer whose device is gone
class BrokenBuffer : public std::streambuf {
protected:
    int_type overflow(int_type) override { throw std::runtime_error("disk full"); }
};

} // namespace

// ============================================================================
// StreamAuditLog
// ============================================================================

class StreamAuditLogTest : public ::testing::Test {
protected:
    std::ostringstream out;
    StreamAuditLog log{out};
};

TEST_F(StreamAuditLogTest, SuccessLineNamesUserId) {
    log.record_success(User{.id = "42", .name = "alice", .email = "a@test.com", .password = "x"});

    EXPECT_EQ(out.str(), "[auth] success user=42\n");
}

TEST_F(StreamAuditLogTest, FailureLineNamesKindAndDetail) {
    log.record_failure(AuthError{.kind = ErrorKind::credential_mismatch, .detail = "mismatch"});

    EXPECT_EQ(out.str(), "[auth] failure kind=credential_mismatch detail=mismatch\n");
}

TEST_F(StreamAuditLogTest, WarningLineCarriesMessage) {
    log.record_warning("mail relay slow");

    EXPECT_EQ(out.str(), "[auth] warning mail relay slow\n");
}

TEST_F(StreamAuditLogTest, PasswordNeverWritten) {
    log.record_success(User{.id = "7", .name = "bob", .email = "b@test.com", .password = "hunter2"});

    EXPECT_EQ(out.str().find("hunter2"), std::string::npos);
}

TEST_F(StreamAuditLogTest, ConcurrentWritersProduceWholeLines) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([this, t] {
            for (int i = 0; i < kPerThread; ++i) {
                log.record_success(User{.id = std::to_string(t)});
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line.rfind("[auth] success user=", 0), 0u) << line;
        ++count;
    }
    EXPECT_EQ(count, kThreads * kPerThread);
}

// ============================================================================
// NullAuditLog
// ============================================================================

TEST(StreamAuditLogFailureTest, ThrowingStreamDropsEvents) {
    BrokenBuffer buffer;
    std::ostream broken(&buffer);
    broken.exceptions(std::ios::badbit);
    StreamAuditLog log(broken);

    EXPECT_NO_THROW(log.record_success(User{.id = "1", .name = "a", .email = "a@test.com", .password = "x"}));
    EXPECT_NO_THROW(log.record_failure(AuthError{.kind = ErrorKind::not_found, .detail = "gone"}));
    EXPECT_NO_THROW(log.record_warning("still running"));
    EXPECT_TRUE(broken.bad());
}

TEST(NullAuditLogTest, AcceptsEveryEvent) {
    NullAuditLog log;
    AuditLog& sink = log;

    sink.record_success(User{.id = "1"});
    sink.record_failure(AuthError{.kind = ErrorKind::not_found, .detail = "gone"});
    sink.record_warning("ignored");
    SUCCEED();
}
