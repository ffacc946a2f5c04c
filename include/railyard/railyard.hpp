#pragma once

/**
 * @file railyard.hpp
 * @brief Convenience header for the railyard library
 *
 * Core:
 * - Outcome<T, E>: success-or-failure value threaded through a pipeline
 * - bind / map / tee / observe / inspect / map_error: railway combinators
 * - guard / try_with / try_map: fault boundary for steps that throw
 *
 * Authentication pipeline (railyard::auth):
 * - Authenticator: validate -> lookup -> password -> notify -> history -> audit
 * - SimpleAuthenticator: Authenticator over std::function collaborators
 * - AuditLog, StreamAuditLog, NullAuditLog: audit sinks
 * - AuthError, ErrorKind: failure values
 */

#include "combinators.hpp"
#include "expected.hpp"
#include "outcome.hpp"

#include "auth/audit_log.hpp"
#include "auth/auth_error.hpp"
#include "auth/auth_options.hpp"
#include "auth/authenticator.hpp"
#include "auth/dependencies.hpp"
#include "auth/user.hpp"
