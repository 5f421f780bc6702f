//! # Build and Pass-Through Commands
//!
//! - `cannyup build` / `release`: compile canny (debug / optimized)
//! - `cannyup clean|test|check|fmt|lint`: forwarded to cargo as-is

#ifndef CANNYUP_CLI_CMD_BUILD_HPP
#define CANNYUP_CLI_CMD_BUILD_HPP

#include "cli/context.hpp"
#include "core/builder.hpp"

namespace cannyup::cli {

Status run_build(CommandContext& ctx, BuildProfile profile);

Status run_cargo_task(CommandContext& ctx, CargoTask task);

} // namespace cannyup::cli

#endif // CANNYUP_CLI_CMD_BUILD_HPP
