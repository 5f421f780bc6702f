//! # Toolchain Probe and Installer
//!
//! ## Remote Script Channel
//!
//! ```text
//! curl --proto =https --tlsv1.2 -sSf -o <staging>/installer.sh <fixed url>
//!   → sha256 logged
//!   → sh <staging>/installer.sh <installer_args>
//!   → private mkdtemp directory removed (scope guard, every exit path)
//!   → re-probe with bin_dir prepended to a private copy of the environment
//! ```
//!
//! The URL never comes from user input; it is part of the toolchain table.

#include "core/toolchain.hpp"

#include "core/digest.hpp"
#include "log/log.hpp"

#include <cerrno>
#include <memory>
#include <stdlib.h>
#include <system_error>

namespace cannyup {

// ============================================================================
// Toolchain Table
// ============================================================================

const ToolchainSpec& rust_toolchain() {
    static const ToolchainSpec spec = [] {
        ToolchainSpec s;
        s.name = "rust";
        s.display_name = "Rust toolchain";
        s.command = "cargo";
        s.version_command = {"rustc", "--version"};
        s.channel = InstallChannel::RemoteScript;
        s.installer_url = "https://sh.rustup.rs";
        s.installer_args = {"-y"};
        s.manual_hint = "install Rust from https://rustup.rs and re-run";
        s.home_variable = "CARGO_HOME";
        s.home_default = ".cargo";
        return s;
    }();
    return spec;
}

const ToolchainSpec& platform_toolchain() {
    static const ToolchainSpec spec = [] {
        ToolchainSpec s;
        s.name = "platform";
#ifdef __APPLE__
        s.display_name = "Xcode Command Line Tools";
        s.command = "xcode-select";
        s.check_command = {"xcode-select", "-p"};
        s.channel = InstallChannel::SystemPrompt;
        s.installer_args = {"xcode-select", "--install"};
        s.manual_hint = "a system dialog should have appeared; complete the installation, "
                        "then re-run this command";
#else
        s.display_name = "C compiler toolchain";
        s.command = "cc";
        s.version_command = {"cc", "--version"};
        s.channel = InstallChannel::Manual;
        s.manual_hint = "install a C compiler and linker with your package manager "
                        "(e.g. build-essential or gcc), then re-run this command";
#endif
        return s;
    }();
    return spec;
}

fs::path toolchain_bin_dir(const ToolchainSpec& spec, const ProcessEnvironment& env) {
    if (spec.home_variable.empty())
        return {};
    if (auto home = env.get(spec.home_variable); home && !home->empty()) {
        return fs::path(*home) / "bin";
    }
    if (auto user_home = env.get("HOME"); user_home && !user_home->empty()) {
        return fs::path(*user_home) / spec.home_default / "bin";
    }
    return {};
}

void ToolchainState::merge_into(ProcessEnvironment& env) const {
    if (present_ && bin_dir_) {
        env.prepend_search_path(*bin_dir_);
    }
}

// ============================================================================
// Probe
// ============================================================================

static std::string first_line(const std::string& text) {
    auto end = text.find('\n');
    std::string line = text.substr(0, end);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
        line.pop_back();
    return line;
}

Result<ToolchainState, Error> ToolchainProbe::probe(const ToolchainSpec& spec,
                                                    const ProcessEnvironment& env) const {
    auto path = env.get("PATH");
    if (!path || path->empty()) {
        return Error::environment("cannot resolve commands: PATH is not set",
                                  "run from a login shell with a normal PATH");
    }

    auto resolved = env.find_executable(spec.command);
    if (!resolved) {
        CANNYUP_LOG_DEBUG("probe", spec.name << ": " << spec.command << " not on search path");
        return ToolchainState::absent(spec.name);
    }
    CANNYUP_LOG_DEBUG("probe", spec.name << ": " << spec.command << " -> " << resolved->string());

    if (!spec.check_command.empty()) {
        auto check = runner_.run({spec.check_command, std::nullopt, OutputMode::Discard}, env);
        if (is_err(check)) {
            return unwrap_err(check);
        }
        if (!unwrap(check).success()) {
            CANNYUP_LOG_DEBUG("probe", spec.name << ": " << describe_command(spec.check_command)
                                                 << " exited with " << unwrap(check).exit_code);
            return ToolchainState::absent(spec.name);
        }
    }

    std::optional<std::string> version;
    if (!spec.version_command.empty() && env.find_executable(spec.version_command[0])) {
        auto out = runner_.run({spec.version_command, std::nullopt, OutputMode::Capture}, env);
        if (is_err(out)) {
            return unwrap_err(out);
        }
        if (unwrap(out).success()) {
            auto line = first_line(unwrap(out).stdout_output);
            if (!line.empty())
                version = line;
        }
    }

    return ToolchainState::found(spec.name, std::move(version));
}

// ============================================================================
// Installer
// ============================================================================

namespace {

/// Private 0700 directory holding the downloaded installer script. The whole
/// directory is removed when the install attempt ends.
class StagingDir {
public:
    static Result<std::unique_ptr<StagingDir>, Error> create(const fs::path& parent,
                                                             const std::string& name) {
        std::string tmpl = (parent / ("cannyup-" + name + "-XXXXXX")).string();
        if (mkdtemp(tmpl.data()) == nullptr) {
            std::error_code ec(errno, std::generic_category());
            return Error::toolchain_install("cannot create staging directory in " +
                                                parent.string() + ": " + ec.message(),
                                            "set TMPDIR to a writable directory and re-run");
        }
        return std::unique_ptr<StagingDir>(new StagingDir(tmpl));
    }

    ~StagingDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            CANNYUP_LOG_WARN("toolchain", "could not remove " << path_.string() << ": "
                                                              << ec.message());
        }
    }
    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    fs::path script() const {
        return path_ / "installer.sh";
    }

private:
    explicit StagingDir(fs::path path) : path_(std::move(path)) {}

    fs::path path_;
};

std::string trimmed(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
        text.pop_back();
    return text;
}

} // namespace

Result<ToolchainState, Error> ToolchainInstaller::install(const ToolchainSpec& spec,
                                                          const ProcessEnvironment& env) {
    CANNYUP_LOG_INFO("toolchain", "installing " << spec.name);
    switch (spec.channel) {
    case InstallChannel::RemoteScript:
        return install_remote_script(spec, env);
    case InstallChannel::SystemPrompt:
        return install_system_prompt(spec, env);
    case InstallChannel::Manual:
        break;
    }
    return Error::toolchain_install(spec.display_name + " not found and cannot be installed "
                                                        "automatically",
                                    spec.manual_hint);
}

Result<ToolchainState, Error>
ToolchainInstaller::install_remote_script(const ToolchainSpec& spec,
                                          const ProcessEnvironment& env) {
    if (!spec.installer_url.starts_with("https://")) {
        return Error::toolchain_install("refusing non-HTTPS installer URL for " + spec.name);
    }
    if (!env.find_executable("curl")) {
        return Error::toolchain_install("curl is required to download the " + spec.display_name,
                                        spec.manual_hint);
    }

    auto staging = StagingDir::create(env.get_or("TMPDIR", "/tmp"), spec.name);
    if (is_err(staging)) {
        return unwrap_err(staging);
    }
    const fs::path script = unwrap(staging)->script();

    CommandSpec download;
    download.argv = {"curl",          "--proto", "=https", "--tlsv1.2", "-sSf",
                     "-o",            script.string(), spec.installer_url};
    download.mode = OutputMode::Capture;
    auto fetched = runner_.run(download, env);
    if (is_err(fetched)) {
        return Error::toolchain_install("could not run curl: " + unwrap_err(fetched).message);
    }
    if (!unwrap(fetched).success()) {
        auto detail = trimmed(unwrap(fetched).stderr_output);
        return Error::toolchain_install(
            "download of " + spec.installer_url + " failed (curl exit " +
                std::to_string(unwrap(fetched).exit_code) + ")" +
                (detail.empty() ? "" : ": " + detail),
            "check your network connection and re-run");
    }

    std::error_code ec;
    auto size = fs::file_size(script, ec);
    if (ec || size == 0) {
        return Error::toolchain_install("downloaded installer for " + spec.name + " is empty");
    }
    CANNYUP_LOG_INFO("toolchain", spec.installer_url << " " << sha256_file(script) << " ("
                                                     << size << " bytes)");

    CommandSpec run_script;
    run_script.argv = {"sh", script.string()};
    run_script.argv.insert(run_script.argv.end(), spec.installer_args.begin(),
                           spec.installer_args.end());
    auto ran = runner_.run(run_script, env);
    if (is_err(ran)) {
        return Error::toolchain_install("could not run installer: " + unwrap_err(ran).message);
    }
    if (!unwrap(ran).success()) {
        return Error::toolchain_install(spec.display_name + " installer exited with code " +
                                            std::to_string(unwrap(ran).exit_code),
                                        spec.manual_hint);
    }

    // The caller's environment stays untouched until this returns success.
    fs::path bin_dir = toolchain_bin_dir(spec, env);
    ProcessEnvironment updated = env;
    if (!bin_dir.empty()) {
        updated.prepend_search_path(bin_dir);
    }

    auto state = ToolchainProbe(runner_).probe(spec, updated);
    if (is_err(state)) {
        return Error::toolchain_install("installed " + spec.name +
                                        " but could not verify it: " + unwrap_err(state).message);
    }
    if (!unwrap(state).present()) {
        return Error::toolchain_install(
            "installer finished but " + spec.command + " is still not available" +
                (bin_dir.empty() ? std::string() : " in " + bin_dir.string()),
            spec.manual_hint);
    }

    return ToolchainState::found(spec.name, unwrap(state).version(),
                                 bin_dir.empty() ? std::nullopt : std::optional<fs::path>(bin_dir));
}

Result<ToolchainState, Error>
ToolchainInstaller::install_system_prompt(const ToolchainSpec& spec,
                                          const ProcessEnvironment& env) {
    auto launched = runner_.run({spec.installer_args, std::nullopt, OutputMode::Inherit}, env);
    if (is_err(launched)) {
        return Error::toolchain_install("could not start " + spec.display_name +
                                        " installer: " + unwrap_err(launched).message);
    }
    // The dialog completes asynchronously; this run cannot continue.
    return Error::toolchain_install(spec.display_name + " installation started",
                                    spec.manual_hint);
}

} // namespace cannyup
