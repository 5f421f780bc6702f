//! # Toolchain Detection and Installation
//!
//! ## Toolchains
//!
//! | Name       | Key command             | Install channel                      |
//! |------------|-------------------------|--------------------------------------|
//! | `platform` | `xcode-select` / `cc`   | macOS dialog / package manager       |
//! | `rust`     | `cargo`                 | rustup script over pinned TLS        |
//!
//! ## Contract
//!
//! `ToolchainProbe::probe()` is a pure query: "absent" is a normal result,
//! and only a broken resolution mechanism (no PATH, fork failure) is an
//! error. `ToolchainInstaller::install()` assumes the caller probed first
//! and never touches the caller's environment: on success it returns a
//! `ToolchainState` whose `bin_dir` the caller merges itself.

#ifndef CANNYUP_CORE_TOOLCHAIN_HPP
#define CANNYUP_CORE_TOOLCHAIN_HPP

#include "core/environment.hpp"
#include "core/error.hpp"
#include "core/process.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cannyup {

// ============================================================================
// Toolchain Description
// ============================================================================

enum class InstallChannel {
    /// Download a script over HTTPS and run it non-interactively.
    RemoteScript,
    /// Launch an OS-provided installer that finishes outside this process.
    SystemPrompt,
    /// Nothing to run; the user must install it.
    Manual,
};

struct ToolchainSpec {
    std::string name;
    std::string display_name;
    /// Must resolve on the search path for the toolchain to be present.
    std::string command;
    /// Optional extra check that must exit 0 (e.g. `xcode-select -p`).
    std::vector<std::string> check_command;
    /// Optional command whose first stdout line is the version.
    std::vector<std::string> version_command;

    InstallChannel channel = InstallChannel::Manual;
    /// RemoteScript: fixed HTTPS URL. SystemPrompt: unused.
    std::string installer_url;
    /// RemoteScript: arguments passed to the script. SystemPrompt: the command.
    std::vector<std::string> installer_args;
    /// Printed when installation cannot complete inside this process.
    std::string manual_hint;

    /// Variable naming the toolchain home, and its default below $HOME.
    std::string home_variable;
    std::string home_default;
};

/// `rust`: cargo + rustc, installed with rustup.
const ToolchainSpec& rust_toolchain();

/// `platform`: the C toolchain cargo links with on this OS.
const ToolchainSpec& platform_toolchain();

/// Directory the toolchain's commands land in after installation
/// (`$<home_variable>/bin`, or `$HOME/<home_default>/bin`). Empty if the
/// spec has no home or neither variable is set.
fs::path toolchain_bin_dir(const ToolchainSpec& spec, const ProcessEnvironment& env);

// ============================================================================
// Toolchain State
// ============================================================================

class ToolchainState {
public:
    static ToolchainState absent(std::string name) {
        return ToolchainState(std::move(name), false, std::nullopt, std::nullopt);
    }
    static ToolchainState found(std::string name, std::optional<std::string> version,
                                std::optional<fs::path> bin_dir = std::nullopt) {
        return ToolchainState(std::move(name), true, std::move(version), std::move(bin_dir));
    }

    const std::string& name() const {
        return name_;
    }
    bool present() const {
        return present_;
    }
    const std::optional<std::string>& version() const {
        return version_;
    }
    /// Set when the commands live outside the caller's search path.
    const std::optional<fs::path>& bin_dir() const {
        return bin_dir_;
    }

    /// Makes this toolchain's commands visible in `env`.
    void merge_into(ProcessEnvironment& env) const;

private:
    ToolchainState(std::string name, bool present, std::optional<std::string> version,
                   std::optional<fs::path> bin_dir)
        : name_(std::move(name)), present_(present), version_(std::move(version)),
          bin_dir_(std::move(bin_dir)) {}

    std::string name_;
    bool present_;
    std::optional<std::string> version_;
    std::optional<fs::path> bin_dir_;
};

// ============================================================================
// Probe
// ============================================================================

class ToolchainProbe {
public:
    explicit ToolchainProbe(ProcessRunner& runner) : runner_(runner) {}

    Result<ToolchainState, Error> probe(const ToolchainSpec& spec,
                                        const ProcessEnvironment& env) const;

private:
    ProcessRunner& runner_;
};

// ============================================================================
// Installer
// ============================================================================

class ToolchainInstaller {
public:
    explicit ToolchainInstaller(ProcessRunner& runner) : runner_(runner) {}

    Result<ToolchainState, Error> install(const ToolchainSpec& spec,
                                          const ProcessEnvironment& env);

private:
    Result<ToolchainState, Error> install_remote_script(const ToolchainSpec& spec,
                                                        const ProcessEnvironment& env);
    Result<ToolchainState, Error> install_system_prompt(const ToolchainSpec& spec,
                                                        const ProcessEnvironment& env);

    ProcessRunner& runner_;
};

} // namespace cannyup

#endif // CANNYUP_CORE_TOOLCHAIN_HPP
