//! # Binary Installer Implementation
//!
//! Two `PlacementOps` back the same placement sequence:
//!
//! - `DirectOps` uses std::filesystem; EACCES/EPERM become Permission errors.
//! - `PrivilegedOps` runs `sudo install -d`, `sudo install -m 755`,
//!   `sudo mv -f` and `sudo rm -f` through the process runner.

#include "core/installer.hpp"

#include "core/digest.hpp"
#include "log/log.hpp"

#include <system_error>

namespace cannyup {

const char* target_kind_name(TargetKind kind) {
    return kind == TargetKind::System ? "system" : "user";
}

Result<fs::path, Error> user_bin_dir(const ProcessEnvironment& env) {
    if (auto cargo_home = env.get("CARGO_HOME"); cargo_home && !cargo_home->empty()) {
        return fs::path(*cargo_home) / "bin";
    }
    if (auto home = env.get("HOME"); home && !home->empty()) {
        return fs::path(*home) / ".cargo" / "bin";
    }
    return Error::environment("cannot locate the user install directory: neither CARGO_HOME nor "
                              "HOME is set");
}

namespace {

// ============================================================================
// Direct Filesystem Ops
// ============================================================================

Error filesystem_error(const std::string& what, const fs::path& path, const std::error_code& ec) {
    std::string message = what + " " + path.string() + ": " + ec.message();
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return Error::permission(message, "check that you own " + path.parent_path().string());
    }
    return Error::install(message);
}

class DirectOps : public PlacementOps {
public:
    Status make_directory(const fs::path& dir) override {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return filesystem_error("cannot create directory", dir, ec);
        }
        return Unit{};
    }

    Status stage_copy(const fs::path& from, const fs::path& to) override {
        // A leftover staged file, or a symlink planted in its place, is
        // unlinked rather than written through.
        std::error_code ec;
        fs::remove(to, ec);
        if (ec) {
            return filesystem_error("cannot clear", to, ec);
        }
        fs::copy_file(from, to, fs::copy_options::none, ec);
        if (ec) {
            return filesystem_error("cannot copy to", to, ec);
        }
        fs::permissions(to,
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                            fs::perms::others_read | fs::perms::others_exec,
                        fs::perm_options::replace, ec);
        if (ec) {
            return filesystem_error("cannot set permissions on", to, ec);
        }
        return Unit{};
    }

    Status replace(const fs::path& from, const fs::path& to) override {
        std::error_code ec;
        fs::rename(from, to, ec);
        if (ec) {
            return filesystem_error("cannot move into place", to, ec);
        }
        return Unit{};
    }

    Status remove(const fs::path& path) override {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            return filesystem_error("cannot remove", path, ec);
        }
        return Unit{};
    }
};

// ============================================================================
// Privileged Ops
// ============================================================================

class PrivilegedOps : public PlacementOps {
public:
    PrivilegedOps(ProcessRunner& runner, const ProcessEnvironment& env,
                  std::vector<std::string> prefix)
        : runner_(runner), env_(env), prefix_(std::move(prefix)) {}

    Status make_directory(const fs::path& dir) override {
        return run({"install", "-d", "-m", "755", dir.string()});
    }

    Status stage_copy(const fs::path& from, const fs::path& to) override {
        return run({"install", "-m", "755", from.string(), to.string()});
    }

    Status replace(const fs::path& from, const fs::path& to) override {
        return run({"mv", "-f", from.string(), to.string()});
    }

    Status remove(const fs::path& path) override {
        return run({"rm", "-f", path.string()});
    }

private:
    Status run(const std::vector<std::string>& args) {
        CommandSpec cmd;
        cmd.argv = prefix_;
        cmd.argv.insert(cmd.argv.end(), args.begin(), args.end());
        cmd.mode = OutputMode::Capture;

        auto result = runner_.run(cmd, env_);
        if (is_err(result)) {
            return Error::install("could not run " + describe_command(cmd.argv) + ": " +
                                  unwrap_err(result).message);
        }
        if (!unwrap(result).success()) {
            std::string detail = unwrap(result).stderr_output;
            while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r'))
                detail.pop_back();
            return Error::install(describe_command(cmd.argv) + " failed with exit code " +
                                  std::to_string(unwrap(result).exit_code) +
                                  (detail.empty() ? "" : ": " + detail));
        }
        return Unit{};
    }

    ProcessRunner& runner_;
    const ProcessEnvironment& env_;
    std::vector<std::string> prefix_;
};

} // namespace

// ============================================================================
// BinaryInstaller
// ============================================================================

Result<std::unique_ptr<PlacementOps>, Error>
BinaryInstaller::acquire_ops(const InstallTarget& target, const ProcessEnvironment& env,
                             std::string_view alternative) {
    auto request = elevator_.request(target, env);
    CANNYUP_LOG_DEBUG("elevate", target_kind_name(target.kind)
                                     << " target " << target.directory.string()
                                     << ": elevation " << elevation_name(request));

    std::string hint = "use `cannyup " + std::string(alternative) +
                       "` to work in your user directory without elevated privileges";
    switch (request) {
    case ElevationRequest::NotRequired:
        return std::unique_ptr<PlacementOps>(std::make_unique<DirectOps>());
    case ElevationRequest::Granted:
        return std::unique_ptr<PlacementOps>(
            std::make_unique<PrivilegedOps>(runner_, env, elevator_.command_prefix()));
    case ElevationRequest::Denied:
        return Error::permission("elevated privileges were denied for " +
                                     target.directory.string(),
                                 hint);
    case ElevationRequest::Unavailable:
        break;
    }
    return Error::permission("elevated privileges are required for " + target.directory.string() +
                                 " but sudo is not available",
                             hint);
}

Result<InstalledBinary, Error> BinaryInstaller::install(const BuildArtifact& artifact,
                                                        const InstallTarget& target,
                                                        const ProcessEnvironment& env) {
    if (!is_executable_file(artifact.output_path)) {
        return Error::install("build artifact " + artifact.output_path.string() +
                              " is missing or not executable");
    }
    std::string expected = sha256_file(artifact.output_path);
    if (expected.empty()) {
        return Error::install("cannot read build artifact " + artifact.output_path.string());
    }

    auto acquired = acquire_ops(target, env, "install-user");
    if (is_err(acquired)) {
        return unwrap_err(acquired);
    }
    PlacementOps& ops = *unwrap(acquired);

    if (auto made = ops.make_directory(target.directory); is_err(made)) {
        return unwrap_err(made);
    }

    fs::path staged = staging_path(target);
    fs::path final_path = installed_path(target);

    auto discard_staged = [&](Error error) -> Error {
        if (auto removed = ops.remove(staged); is_err(removed)) {
            CANNYUP_LOG_WARN("install", "could not remove staging file " << staged.string()
                                                                         << ": "
                                                                         << unwrap_err(removed).message);
        }
        return error;
    };

    CANNYUP_LOG_DEBUG("install", "staging " << artifact.output_path.string() << " -> "
                                            << staged.string());
    if (auto copied = ops.stage_copy(artifact.output_path, staged); is_err(copied)) {
        return discard_staged(unwrap_err(copied));
    }

    std::string actual = sha256_file(staged);
    if (actual != expected) {
        return discard_staged(Error::install("staged copy " + staged.string() +
                                             " does not match the build artifact (expected " +
                                             expected + ", got " +
                                             (actual.empty() ? "unreadable file" : actual) + ")"));
    }

    if (auto moved = ops.replace(staged, final_path); is_err(moved)) {
        return discard_staged(unwrap_err(moved));
    }

    CANNYUP_LOG_INFO("install", "installed " << final_path.string() << " " << expected);
    return InstalledBinary{final_path, target, expected};
}

Result<bool, Error> BinaryInstaller::uninstall(const InstallTarget& target,
                                               const ProcessEnvironment& env) {
    fs::path path = installed_path(target);

    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return filesystem_error("cannot inspect", path, ec);
    }
    if (!fs::exists(status)) {
        CANNYUP_LOG_DEBUG("install", path.string() << " not present; nothing to remove");
        return false;
    }

    auto acquired = acquire_ops(target, env, "uninstall-user");
    if (is_err(acquired)) {
        return unwrap_err(acquired);
    }

    if (auto removed = unwrap(acquired)->remove(path); is_err(removed)) {
        return unwrap_err(removed);
    }
    CANNYUP_LOG_INFO("install", "removed " << path.string());
    return true;
}

} // namespace cannyup
