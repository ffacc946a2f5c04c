#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <railyard/auth/auth_error.hpp>
#include <railyard/auth/auth_options.hpp>
#include <railyard/combinators.hpp>

using namespace railyard;
using namespace railyard::auth;

TEST(AuthErrorTest, KindStrings) {
    EXPECT_STREQ(error_kind_string(ErrorKind::invalid_input), "invalid_input");
    EXPECT_STREQ(error_kind_string(ErrorKind::not_found), "not_found");
    EXPECT_STREQ(error_kind_string(ErrorKind::credential_mismatch), "credential_mismatch");
    EXPECT_STREQ(error_kind_string(ErrorKind::notify_failed), "notify_failed");
    EXPECT_STREQ(error_kind_string(ErrorKind::history_failed), "history_failed");
    EXPECT_STREQ(error_kind_string(ErrorKind::internal_fault), "internal_fault");
    EXPECT_STREQ(error_kind_string(static_cast<ErrorKind>(200)), "unknown");
}

TEST(AuthErrorTest, MessageIsDetail) {
    AuthError err{.kind = ErrorKind::not_found, .detail = "no such user"};

    EXPECT_EQ(err.message(), "no such user");
}

TEST(AuthErrorTest, EqualityComparesKindAndDetail) {
    AuthError a{.kind = ErrorKind::not_found, .detail = "x"};
    AuthError b{.kind = ErrorKind::not_found, .detail = "x"};
    AuthError c{.kind = ErrorKind::notify_failed, .detail = "x"};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(AuthErrorTest, MakeAuthErrorBuildsFailureBranch) {
    Outcome<int, AuthError> result = make_auth_error(ErrorKind::invalid_input, "Invalid params");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::invalid_input);
    EXPECT_EQ(result.error().message(), "Invalid params");
}

TEST(AuthErrorTest, TagErrorLiftsStringFailures) {
    Outcome<void, std::string> delivery = failure(std::string("bounced"));
    auto lifted = map_error(tag_error(ErrorKind::notify_failed), delivery);

    ASSERT_FALSE(lifted.has_value());
    EXPECT_EQ(lifted.error(), (AuthError{ErrorKind::notify_failed, "bounced"}));
}

TEST(AuthErrorTest, ExceptionsBecomeInternalFaults) {
    auto result = try_with(
        [](int) -> Outcome<int, AuthError> { throw std::out_of_range("index 9"); },
        Outcome<int, AuthError>{1});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::internal_fault);
    EXPECT_EQ(result.error().message(), "index 9");
}

TEST(AuthErrorTest, UnknownThrowsBecomeInternalFaults) {
    auto result = try_with([](int) -> Outcome<int, AuthError> { throw 7; }, Outcome<int, AuthError>{1});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), (AuthError{ErrorKind::internal_fault, "unknown exception"}));
}

TEST(AuthOptionsTest, Defaults) {
    AuthOptions options;

    EXPECT_EQ(options.confirmation_message, "You have successfully logged in");
    EXPECT_EQ(options.notify_policy, NotifyPolicy::required);
    EXPECT_STREQ(notify_policy_string(options.notify_policy), "required");
    EXPECT_STREQ(notify_policy_string(NotifyPolicy::best_effort), "best_effort");
}
