//! # Subprocess Execution
//!
//! Every external tool (cargo, curl, sh, sudo, xcode-select) is launched
//! through a `ProcessRunner`. The runner receives the environment
//! explicitly, so a freshly installed toolchain is only visible to the
//! commands that were handed the merged environment.
//!
//! ## Output Modes
//!
//! | Mode      | stdout / stderr                               | Used for                |
//! |-----------|-----------------------------------------------|-------------------------|
//! | `Inherit` | Child writes straight to the terminal         | cargo, rustup, sudo -v  |
//! | `Capture` | Collected into `ProcessResult`                | version probes, curl    |
//! | `Discard` | Redirected to /dev/null                       | presence checks         |

#ifndef CANNYUP_CORE_PROCESS_HPP
#define CANNYUP_CORE_PROCESS_HPP

#include "core/environment.hpp"
#include "core/error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cannyup {

enum class OutputMode { Inherit, Capture, Discard };

struct CommandSpec {
    /// argv[0] is resolved through the environment's search path.
    std::vector<std::string> argv;
    /// Working directory; the environment's cwd when unset.
    std::optional<fs::path> cwd;
    OutputMode mode = OutputMode::Inherit;
};

struct ProcessResult {
    /// Exit status, or 128 + signal number if the child was killed.
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;

    bool success() const {
        return exit_code == 0;
    }
};

/// Renders argv as a shell-like string for logs and error messages.
std::string describe_command(const std::vector<std::string>& argv);

/// Launches external programs. Returns an `Environment` error only when the
/// program could not be started at all (not found, fork failure); a program
/// that runs and fails is a successful `ProcessResult` with a non-zero code.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual Result<ProcessResult, Error> run(const CommandSpec& command,
                                             const ProcessEnvironment& env) = 0;
};

/// fork/execve implementation. Blocks until the child exits.
class PosixProcessRunner : public ProcessRunner {
public:
    Result<ProcessResult, Error> run(const CommandSpec& command,
                                     const ProcessEnvironment& env) override;
};

} // namespace cannyup

#endif // CANNYUP_CORE_PROCESS_HPP
