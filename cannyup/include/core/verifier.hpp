//! # Verifier
//!
//! Checks that an installed binary can be run by name. Never fatal: the
//! install pipeline turns a negative answer into PATH advice.

#ifndef CANNYUP_CORE_VERIFIER_HPP
#define CANNYUP_CORE_VERIFIER_HPP

#include "core/environment.hpp"

#include <optional>
#include <string_view>

namespace cannyup {

/// What `name` resolves to via the search path (like `command -v`).
std::optional<fs::path> resolve_command(std::string_view name, const ProcessEnvironment& env);

/// True if `name` resolves to an executable via the search path.
bool verify(std::string_view name, const ProcessEnvironment& env);

/// True if `resolved` and `installed` name the same file.
bool same_binary(const fs::path& resolved, const fs::path& installed);

} // namespace cannyup

#endif // CANNYUP_CORE_VERIFIER_HPP
