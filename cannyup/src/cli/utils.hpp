//! # CLI Utilities Interface
//!
//! | Function          | Description                          |
//! |-------------------|--------------------------------------|
//! | `command_table()` | Every command with its one-line help |
//! | `print_usage()`   | Print CLI help text                  |
//! | `print_version()` | Print installer version              |

#pragma once

#include <ostream>
#include <vector>

namespace cannyup::cli {

struct CommandInfo {
    const char* name;
    const char* summary;
};

const std::vector<CommandInfo>& command_table();

void print_usage(std::ostream& out);
void print_version(std::ostream& out);

} // namespace cannyup::cli
