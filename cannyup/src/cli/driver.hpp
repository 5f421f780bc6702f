//! # Installer Driver Interface
//!
//! `cannyup_main()` wires the real process runner, sudo elevator and
//! terminal status output, then hands off to `dispatch()`.

#pragma once

#include "cli/context.hpp"

#include <string>

namespace cannyup::cli {

/// Runs one named command. Prints fatal errors through `ctx.status`.
/// @return 0 on success, 1 on any error or unknown command
int dispatch(const std::string& command, CommandContext& ctx);

} // namespace cannyup::cli

int cannyup_main(int argc, char* argv[]);
