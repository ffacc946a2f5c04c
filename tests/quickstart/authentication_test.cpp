// [TITLE]
// Authenticating a User
// [/TITLE]
//
// This test demonstrates composing fallible steps with the railway
// combinators, and running the ready-made authentication pipeline.

// Suppress nodiscard warnings for cleaner quickstart examples
#pragma GCC diagnostic ignored "-Wunused-result"

#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <string_view>

#include <gtest/gtest.h>
#include <railyard/railyard.hpp>

// [TEXT]
// All examples assume `#include <railyard/railyard.hpp>`.
// [/TEXT]

// [EXAMPLE]
// Composing Steps
// [/EXAMPLE]

// [DESCRIPTION]
// Each step returns an `Outcome<T, E>`. `bind` chains a step that can
// fail, `tee` runs a check without changing the value, and `map` applies
// a plain transform. The first failure skips every remaining step.
// [/DESCRIPTION]

TEST(QuickstartSnippet, ComposingSteps) {
    // [SNIPPET]
    using railyard::Outcome;

    auto parse = [](std::string_view text) -> Outcome<int, std::string> {
        if (text.empty()) {
            return railyard::failure(std::string("empty"));
        }
        return std::stoi(std::string(text));
    };

    auto positive = [](int v) -> Outcome<void, std::string> {
        if (v <= 0) {
            return railyard::failure(std::string("not positive"));
        }
        return {};
    };

    auto pipeline = railyard::tee(positive) | railyard::map([](int v) { return v * 2; });

    auto good = Outcome<std::string_view, std::string>{"21"} | railyard::bind(parse) | pipeline;
    auto bad = Outcome<std::string_view, std::string>{"-4"} | railyard::bind(parse) | pipeline;
    // [/SNIPPET]

    EXPECT_EQ(*good, 42);
    EXPECT_EQ(bad.error(), "not positive");
}

// [EXAMPLE]
// Running the Authentication Pipeline
// [/EXAMPLE]

// [DESCRIPTION]
// `Authenticator` takes the user lookup, password check and notifier as
// plain callables, plus an `AuditLog` that sees every attempt.
// [/DESCRIPTION]

TEST(QuickstartSnippet, AuthenticationPipeline) {
    // [SNIPPET]
    using namespace railyard::auth;
    using railyard::Outcome;

    std::map<std::string, User, std::less<>> users{
        {"alice", User{.id = "1", .name = "alice", .email = "a@test.com", .password = "secret"}}};

    auto lookup = [&users](std::string_view name) -> Outcome<User, std::string> {
        if (auto it = users.find(name); it != users.end()) {
            return it->second;
        }
        return railyard::failure(std::string("not found"));
    };
    auto check = [](std::string_view stored, std::string_view given) -> Outcome<void, std::string> {
        if (stored != given) {
            return railyard::failure(std::string("mismatch"));
        }
        return {};
    };
    auto notify = [](std::string_view, std::string_view) -> Outcome<void, std::string> { return {}; };

    std::ostringstream audit;
    StreamAuditLog log(audit);
    Authenticator auth(lookup, check, notify, log);

    auto ok = auth.authenticate("alice", "secret");
    auto wrong = auth.authenticate("alice", "wrong");
    // [/SNIPPET]

    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->id, "1");
    EXPECT_EQ(wrong.error().message(), "mismatch");
    EXPECT_EQ(audit.str(),
              "[auth] success user=1\n"
              "[auth] failure kind=credential_mismatch detail=mismatch\n");
}
