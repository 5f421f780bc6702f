//! # Installer Errors
//!
//! Every fallible step returns `Result<T, Error>`. The kind tells the
//! command surface which failure it is looking at; all kinds are fatal to
//! the current command.
//!
//! | Kind               | Raised by                | Meaning                                 |
//! |--------------------|--------------------------|-----------------------------------------|
//! | `Environment`      | probe, process launch    | Command resolution itself is broken     |
//! | `ToolchainInstall` | toolchain installer      | Remote install failed; retry manually   |
//! | `Build`            | builder, pass-through    | cargo failed; output already on stderr  |
//! | `Permission`       | elevation, file placement| Elevation denied or unavailable         |
//! | `Install`          | file placement           | Filesystem failure                      |
//!
//! "Not on PATH" is deliberately absent: the verifier reports it as `false`.

#ifndef CANNYUP_CORE_ERROR_HPP
#define CANNYUP_CORE_ERROR_HPP

#include "common.hpp"

#include <string>
#include <utility>

namespace cannyup {

enum class ErrorKind {
    Environment,
    ToolchainInstall,
    Build,
    Permission,
    Install,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Environment:
        return "environment error";
    case ErrorKind::ToolchainInstall:
        return "toolchain install error";
    case ErrorKind::Build:
        return "build error";
    case ErrorKind::Permission:
        return "permission error";
    case ErrorKind::Install:
        return "install error";
    }
    return "error";
}

struct Error {
    ErrorKind kind;
    std::string message;
    /// Optional actionable advice printed after the message.
    std::string hint;

    static Error environment(std::string message, std::string hint = {}) {
        return {ErrorKind::Environment, std::move(message), std::move(hint)};
    }
    static Error toolchain_install(std::string message, std::string hint = {}) {
        return {ErrorKind::ToolchainInstall, std::move(message), std::move(hint)};
    }
    static Error build(std::string message, std::string hint = {}) {
        return {ErrorKind::Build, std::move(message), std::move(hint)};
    }
    static Error permission(std::string message, std::string hint = {}) {
        return {ErrorKind::Permission, std::move(message), std::move(hint)};
    }
    static Error install(std::string message, std::string hint = {}) {
        return {ErrorKind::Install, std::move(message), std::move(hint)};
    }
};

/// Result of an operation that has no value on success.
using Status = Result<Unit, Error>;

} // namespace cannyup

#endif // CANNYUP_CORE_ERROR_HPP
