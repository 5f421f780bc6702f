//! # Status Reporter
//!
//! The `==>` progress lines the user reads while a command runs. These are
//! not log records: they are always shown, independent of --log-level.
//!
//! | Method      | Color      | Stream |
//! |-------------|------------|--------|
//! | `info()`    | bold blue  | stdout |
//! | `success()` | bold green | stdout |
//! | `warn()`    | bold yellow| stdout |
//! | `fatal()`   | bold red   | stderr |
//! | `note()`    | none       | stdout |

#pragma once

#include "core/error.hpp"

#include <ostream>
#include <string>

namespace cannyup::cli {

class StatusReporter {
public:
    StatusReporter(std::ostream& out, std::ostream& err, bool colors)
        : out_(out), err_(err), colors_(colors) {}

    void info(const std::string& message);
    void success(const std::string& message);
    void warn(const std::string& message);
    /// Prints "error: <message>" and the hint, if any.
    void fatal(const Error& error);
    /// Indented plain text under the previous status line.
    void note(const std::string& message);

private:
    void line(std::ostream& os, const char* color, const std::string& message);

    std::ostream& out_;
    std::ostream& err_;
    bool colors_;
};

} // namespace cannyup::cli
