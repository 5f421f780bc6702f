//! # Install / Uninstall Commands
//!
//! - `cannyup install`: toolchains → release build → /usr/local/bin (sudo) → verify
//! - `cannyup install-user`: same, into ~/.cargo/bin without sudo
//! - `cannyup uninstall` / `uninstall-user`: remove from the matching location

#ifndef CANNYUP_CLI_CMD_INSTALL_HPP
#define CANNYUP_CLI_CMD_INSTALL_HPP

#include "cli/context.hpp"
#include "core/installer.hpp"
#include "core/toolchain.hpp"

namespace cannyup::cli {

/// The install target selected by a command.
Result<InstallTarget, Error> resolve_target(const CommandContext& ctx, TargetKind kind);

/// Probes `spec` and installs it if absent. On success the toolchain is
/// merged into `build_env`; on failure `build_env` is left untouched.
Status ensure_toolchain(CommandContext& ctx, const ToolchainSpec& spec,
                        ProcessEnvironment& build_env);

/// Full install pipeline. Fails fast; a PATH problem is only a warning.
Status run_install(CommandContext& ctx, TargetKind kind);

/// Removes the binary from the target; a missing binary is not an error.
Status run_uninstall(CommandContext& ctx, TargetKind kind);

} // namespace cannyup::cli

#endif // CANNYUP_CLI_CMD_INSTALL_HPP
