#pragma once

#include <string>

namespace railyard::auth {

/**
 * @brief User record as returned by the lookup collaborator
 *
 * The pipeline only reads it. `password` holds whatever stored credential
 * the password checker expects to compare against.
 */
struct User {
    std::string id;
    std::string name;
    std::string email;
    std::string password;

    friend bool operator==(const User&, const User&) = default;
};

/**
 * Username and password as supplied by the caller.
 */
struct Credentials {
    std::string username;
    std::string password;

    friend bool operator==(const Credentials&, const Credentials&) = default;
};

/**
 * A looked-up user paired with the password the caller supplied.
 *
 * Threaded from the lookup step to the response step so the password
 * check can see both sides.
 */
struct AuthenticatedPair {
    User user;
    std::string password;

    friend bool operator==(const AuthenticatedPair&, const AuthenticatedPair&) = default;
};

} // namespace railyard::auth
