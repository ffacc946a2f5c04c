#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <railyard/railyard.hpp>

using namespace railyard;
using namespace railyard::auth;

// Exit codes
constexpr int kExitAuthenticated = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

// In-memory user directory standing in for a real store
class UserDirectory {
public:
    UserDirectory() {
        add(User{.id = "1", .name = "alice", .email = "alice@example.com", .password = "secret"});
        add(User{.id = "2", .name = "bob", .email = "bob@example.com", .password = "hunter2"});
    }

    Outcome<User, std::string> find(std::string_view name) const {
        if (auto it = users_.find(name); it != users_.end()) {
            return it->second;
        }
        return failure("no user named '" + std::string(name) + "'");
    }

private:
    void add(User user) { users_.emplace(user.name, std::move(user)); }

    std::map<std::string, User, std::less<>> users_;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <username> <password> [--best-effort-notify] [--fail-notify] [--history]\n";
}

int main(int argc, char** argv) {
    std::vector<std::string_view> positional;
    AuthOptions options;
    bool fail_notify = false;
    bool with_history = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--best-effort-notify") {
            options.notify_policy = NotifyPolicy::best_effort;
        } else if (arg == "--fail-notify") {
            fail_notify = true;
        } else if (arg == "--history") {
            with_history = true;
        } else if (arg.starts_with("--")) {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return kExitUsage;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    UserDirectory directory;
    std::vector<std::string> history;

    LookupCallback lookup = [&directory](std::string_view name) { return directory.find(name); };

    PasswordCheckCallback check = [](std::string_view stored,
                                     std::string_view provided) -> Outcome<void, std::string> {
        if (stored != provided) {
            return failure(std::string("password does not match"));
        }
        return {};
    };

    NotifyCallback notify = [fail_notify](std::string_view email,
                                          std::string_view message) -> Outcome<void, std::string> {
        if (fail_notify) {
            return failure("mail relay refused " + std::string(email));
        }
        std::cout << "To: " << email << "\n" << message << "\n\n";
        return {};
    };

    HistoryCallback record;
    if (with_history) {
        record = [&history](const User& user) -> Outcome<void, std::string> {
            history.push_back(user.id);
            return {};
        };
    }

    StreamAuditLog log(std::clog);
    SimpleAuthenticator auth(lookup, check, notify, record, log, options);

    std::cout << "Authenticating '" << positional[0] << "' (notify policy: "
              << notify_policy_string(options.notify_policy) << ")\n";

    auto result = auth.authenticate(positional[0], positional[1]);
    if (!result.has_value()) {
        std::cout << "Rejected: " << result.error().message() << " ("
                  << error_kind_string(result.error().kind) << ")\n";
        return result.error().kind == ErrorKind::invalid_input ? kExitUsage : kExitRejected;
    }

    std::cout << "Welcome, " << result->name << " (id " << result->id << ")\n";
    if (with_history) {
        std::cout << "Logins recorded: " << history.size() << "\n";
    }
    return kExitAuthenticated;
}
