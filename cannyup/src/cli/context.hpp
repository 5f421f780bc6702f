//! # Command Context
//!
//! What every command handler receives. The runner and elevator are
//! interfaces so the handlers can be driven with fakes.

#pragma once

#include "config.hpp"
#include "core/elevation.hpp"
#include "core/environment.hpp"
#include "core/process.hpp"
#include "status.hpp"

namespace cannyup::cli {

struct CommandContext {
    InstallConfig config;
    /// The user's environment as captured at startup. Toolchain merges are
    /// applied to copies, never to this value.
    ProcessEnvironment env;
    ProcessRunner& runner;
    Elevator& elevator;
    StatusReporter& status;
};

} // namespace cannyup::cli
