//! # Binary Installer
//!
//! Places a build artifact into an install target and removes it again.
//!
//! ## Placement
//!
//! ```text
//! request elevation ── Denied/Unavailable ──▶ Permission error, nothing written
//!   │
//!   ▼
//! mkdir -p <dir>
//! copy artifact → <dir>/.<name>.partial (0755)
//! sha256(staged) == sha256(artifact) ?
//! rename .<name>.partial → <dir>/<name>
//! ```
//!
//! The rename is the only step that touches `<dir>/<name>`, so an interrupted
//! install leaves either the previous binary or the new one. Any failure
//! after staging removes the staged file.
//!
//! ## Targets
//!
//! | Kind   | Directory                              | Elevation |
//! |--------|----------------------------------------|-----------|
//! | System | `/usr/local/bin`                       | yes       |
//! | User   | `${CARGO_HOME:-$HOME/.cargo}/bin`      | no        |

#ifndef CANNYUP_CORE_INSTALLER_HPP
#define CANNYUP_CORE_INSTALLER_HPP

#include "core/builder.hpp"
#include "core/elevation.hpp"
#include "core/environment.hpp"
#include "core/error.hpp"
#include "core/process.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace cannyup {

enum class TargetKind { System, User };

struct InstallTarget {
    TargetKind kind;
    fs::path directory;
    bool requires_elevation;

    static InstallTarget system(fs::path directory) {
        return {TargetKind::System, std::move(directory), true};
    }
    static InstallTarget user(fs::path directory) {
        return {TargetKind::User, std::move(directory), false};
    }
};

const char* target_kind_name(TargetKind kind);

/// `$CARGO_HOME/bin`, else `$HOME/.cargo/bin`. Environment error if neither
/// variable is set.
Result<fs::path, Error> user_bin_dir(const ProcessEnvironment& env);

struct InstalledBinary {
    fs::path path;
    InstallTarget target;
    std::string digest;
};

/// Filesystem steps of a placement, run either directly or through sudo.
class PlacementOps {
public:
    virtual ~PlacementOps() = default;

    virtual Status make_directory(const fs::path& dir) = 0;
    virtual Status stage_copy(const fs::path& from, const fs::path& to) = 0;
    virtual Status replace(const fs::path& from, const fs::path& to) = 0;
    virtual Status remove(const fs::path& path) = 0;
};

class BinaryInstaller {
public:
    BinaryInstaller(ProcessRunner& runner, Elevator& elevator, std::string binary_name)
        : runner_(runner), elevator_(elevator), binary_name_(std::move(binary_name)) {}

    Result<InstalledBinary, Error> install(const BuildArtifact& artifact,
                                           const InstallTarget& target,
                                           const ProcessEnvironment& env);

    /// Returns true if a binary was removed, false if there was none.
    Result<bool, Error> uninstall(const InstallTarget& target, const ProcessEnvironment& env);

    fs::path installed_path(const InstallTarget& target) const {
        return target.directory / binary_name_;
    }
    fs::path staging_path(const InstallTarget& target) const {
        return target.directory / ("." + binary_name_ + ".partial");
    }

private:
    /// Elevates if needed and returns the ops to use. `alternative` names the
    /// unprivileged command suggested when elevation is refused.
    Result<std::unique_ptr<PlacementOps>, Error> acquire_ops(const InstallTarget& target,
                                                             const ProcessEnvironment& env,
                                                             std::string_view alternative);

    ProcessRunner& runner_;
    Elevator& elevator_;
    std::string binary_name_;
};

} // namespace cannyup

#endif // CANNYUP_CORE_INSTALLER_HPP
