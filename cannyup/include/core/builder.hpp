//! # Builder
//!
//! Drives cargo in the canny source tree. `build()` is the only producer of
//! `BuildArtifact`s: a failed or incomplete build never yields one, so the
//! installer cannot be handed a stale or partial binary.
//!
//! | Operation      | cargo invocation          |
//! |----------------|---------------------------|
//! | Debug build    | `cargo build`             |
//! | Release build  | `cargo build --release`   |
//! | clean          | `cargo clean`             |
//! | test           | `cargo test`              |
//! | check          | `cargo check`             |
//! | fmt            | `cargo fmt`               |
//! | lint           | `cargo clippy`            |

#ifndef CANNYUP_CORE_BUILDER_HPP
#define CANNYUP_CORE_BUILDER_HPP

#include "core/environment.hpp"
#include "core/error.hpp"
#include "core/process.hpp"

#include <string>
#include <vector>

namespace cannyup {

enum class BuildProfile { Debug, Release };

/// "debug" / "release": also the cargo output subdirectory.
const char* profile_name(BuildProfile profile);

struct BuildArtifact {
    fs::path source_root;
    fs::path output_path;
    BuildProfile profile;
};

/// cargo subcommands forwarded without orchestration.
enum class CargoTask { Clean, Test, Check, Fmt, Lint };

const char* cargo_task_name(CargoTask task);

class Builder {
public:
    Builder(ProcessRunner& runner, fs::path source_root, std::string binary_name)
        : runner_(runner), source_root_(std::move(source_root)),
          binary_name_(std::move(binary_name)) {}

    /// Compiles the binary. Output goes straight to the terminal.
    Result<BuildArtifact, Error> build(BuildProfile profile, const ProcessEnvironment& env);

    /// Runs a pass-through cargo subcommand; any non-zero exit is a Build error.
    Status run_task(CargoTask task, const ProcessEnvironment& env);

    /// Where `build(profile)` leaves the binary.
    fs::path artifact_path(BuildProfile profile) const;

    const fs::path& source_root() const {
        return source_root_;
    }

private:
    Status run_cargo(const std::vector<std::string>& args, const ProcessEnvironment& env);

    ProcessRunner& runner_;
    fs::path source_root_;
    std::string binary_name_;
};

} // namespace cannyup

#endif // CANNYUP_CORE_BUILDER_HPP
