#pragma once

// RAILYARD Expected Type
//
// Brings tl::expected and its helpers into the railyard namespace. Code
// normally spells the type through the Outcome alias in outcome.hpp and
// builds the failure branch with failure():
//
//   railyard::Outcome<User, std::string> lookup(std::string_view name) {
//       if (auto it = users.find(name); it != users.end()) {
//           return it->second;
//       }
//       return railyard::failure("no user named " + std::string(name));
//   }
//
// The unexpect tag constructs the failure branch in place, which the
// combinators use when an error value changes track:
//
//   railyard::Outcome<int, std::string> out(railyard::unexpect, "no such user");

#include <tl/expected.hpp>

namespace railyard {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace railyard
