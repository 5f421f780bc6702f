//! # Invocation and Configuration
//!
//! cannyup reads no config file. Everything a command needs is assembled
//! here from argv and the environment snapshot taken in `cannyup_main()`.
//!
//! | Setting       | Source                                   | Default            |
//! |---------------|------------------------------------------|--------------------|
//! | source root   | `--source-dir=<path>`                    | working directory  |
//! | system dir    | fixed                                    | `/usr/local/bin`   |
//! | user dir      | `CARGO_HOME`, `HOME` (see `user_bin_dir`)| `~/.cargo/bin`     |
//! | colors        | `--no-color`, terminal detection         | on for a terminal  |

#pragma once

#include "common.hpp"
#include "core/environment.hpp"
#include "core/error.hpp"

#include <string>
#include <vector>

namespace cannyup::cli {

struct InstallConfig {
    fs::path source_root;
    std::string binary_name = TARGET_BINARY;
    fs::path system_dir = "/usr/local/bin";
};

struct Invocation {
    /// "help" when no command was given.
    std::string command = "help";
    InstallConfig config;
    bool colors = true;
};

/// Parses argv[1..]. Logging options are accepted and skipped (they are
/// consumed by log::parse_log_options). Returns a message on bad usage.
Result<Invocation, std::string> parse_invocation(const std::vector<std::string>& args,
                                                 const ProcessEnvironment& env);

} // namespace cannyup::cli
