//! # Install Pipeline
//!
//! ```text
//! run_install()
//!   ├─ resolve_target()        system: /usr/local/bin, user: ~/.cargo/bin
//!   ├─ ensure_toolchain()      platform, then rust (probe → [install] → merge)
//!   ├─ Builder::build()        cargo build --release, always rebuilt
//!   ├─ BinaryInstaller         staged copy + rename, sudo for system target
//!   └─ resolve_command()       PATH check against the user's own environment
//! ```
//!
//! Every step returns on the first error, so a failed build never reaches
//! the installer and nothing is written to the target.

#include "cmd_install.hpp"

#include "core/builder.hpp"
#include "core/verifier.hpp"
#include "log/log.hpp"

namespace cannyup::cli {

Result<InstallTarget, Error> resolve_target(const CommandContext& ctx, TargetKind kind) {
    if (kind == TargetKind::System) {
        return InstallTarget::system(ctx.config.system_dir);
    }
    auto dir = user_bin_dir(ctx.env);
    if (is_err(dir)) {
        return unwrap_err(dir);
    }
    return InstallTarget::user(unwrap(dir));
}

Status ensure_toolchain(CommandContext& ctx, const ToolchainSpec& spec,
                        ProcessEnvironment& build_env) {
    ctx.status.info("Checking for " + spec.display_name + "...");

    ToolchainProbe probe(ctx.runner);
    auto state = probe.probe(spec, build_env);
    if (is_err(state)) {
        return unwrap_err(state);
    }
    if (unwrap(state).present()) {
        const auto& version = unwrap(state).version();
        ctx.status.success(spec.display_name + " found" + (version ? " (" + *version + ")" : ""));
        return Unit{};
    }

    ctx.status.warn(spec.display_name + " not found, installing...");
    ToolchainInstaller installer(ctx.runner);
    auto installed = installer.install(spec, build_env);
    if (is_err(installed)) {
        return unwrap_err(installed);
    }

    unwrap(installed).merge_into(build_env);
    const auto& version = unwrap(installed).version();
    ctx.status.success(spec.display_name + " installed" + (version ? " (" + *version + ")" : ""));
    return Unit{};
}

Status run_install(CommandContext& ctx, TargetKind kind) {
    auto target = resolve_target(ctx, kind);
    if (is_err(target)) {
        return unwrap_err(target);
    }
    const std::string& name = ctx.config.binary_name;
    CANNYUP_LOG_DEBUG("cli", "install " << name << " (" << target_kind_name(kind) << " target "
                                        << unwrap(target).directory.string() << ", source "
                                        << ctx.config.source_root.string() << ")");

    ProcessEnvironment build_env = ctx.env;
    for (const ToolchainSpec* spec : {&platform_toolchain(), &rust_toolchain()}) {
        if (auto ready = ensure_toolchain(ctx, *spec, build_env); is_err(ready)) {
            return unwrap_err(ready);
        }
    }

    ctx.status.info("Building " + name + "...");
    Builder builder(ctx.runner, ctx.config.source_root, name);
    auto artifact = builder.build(BuildProfile::Release, build_env);
    if (is_err(artifact)) {
        return unwrap_err(artifact);
    }

    const fs::path& dir = unwrap(target).directory;
    ctx.status.info("Installing " + name + " to " + dir.string() + "...");
    BinaryInstaller installer(ctx.runner, ctx.elevator, name);
    auto installed = installer.install(unwrap(artifact), unwrap(target), ctx.env);
    if (is_err(installed)) {
        return unwrap_err(installed);
    }
    const fs::path& installed_path = unwrap(installed).path;
    ctx.status.success("Installed " + name + " to " + installed_path.string());

    // Checked against the user's environment, not build_env: a freshly
    // installed toolchain directory is not on the user's PATH yet.
    auto resolved = resolve_command(name, ctx.env);
    if (!resolved) {
        ctx.status.warn(dir.string() + " is not on your PATH");
        ctx.status.note("Add it to your shell profile, for example:");
        ctx.status.note("  export PATH=\"" + dir.string() + ":$PATH\"");
        ctx.status.note("Then run '" + name + " auth' to get started.");
        return Unit{};
    }
    if (!same_binary(*resolved, installed_path)) {
        ctx.status.warn("'" + name + "' currently resolves to " + resolved->string() +
                        ", which shadows " + installed_path.string());
        ctx.status.note("Remove the other copy or put " + dir.string() +
                        " earlier on your PATH.");
        return Unit{};
    }

    ctx.status.success("Done! Run '" + name + " auth' to get started.");
    return Unit{};
}

Status run_uninstall(CommandContext& ctx, TargetKind kind) {
    auto target = resolve_target(ctx, kind);
    if (is_err(target)) {
        return unwrap_err(target);
    }
    const std::string& name = ctx.config.binary_name;

    ctx.status.info("Removing " + name + " from " + unwrap(target).directory.string() + "...");
    BinaryInstaller installer(ctx.runner, ctx.elevator, name);
    auto removed = installer.uninstall(unwrap(target), ctx.env);
    if (is_err(removed)) {
        return unwrap_err(removed);
    }

    if (unwrap(removed)) {
        ctx.status.success("Uninstalled.");
    } else {
        ctx.status.success("Nothing to remove: " + installer.installed_path(unwrap(target)).string() +
                           " is not installed.");
    }
    return Unit{};
}

} // namespace cannyup::cli
