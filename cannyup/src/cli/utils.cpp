#include "utils.hpp"

#include "common.hpp"

#include <iomanip>

namespace cannyup::cli {

const std::vector<CommandInfo>& command_table() {
    static const std::vector<CommandInfo> table = {
        {"build", "Build debug version"},
        {"release", "Build release version"},
        {"install", "Install to /usr/local/bin (requires sudo)"},
        {"install-user", "Install to ~/.cargo/bin (no sudo required)"},
        {"uninstall", "Remove from /usr/local/bin"},
        {"uninstall-user", "Remove from ~/.cargo/bin"},
        {"clean", "Remove build artifacts"},
        {"test", "Run tests"},
        {"check", "Check code without building"},
        {"fmt", "Format code"},
        {"lint", "Run clippy linter"},
        {"help", "Show this help"},
    };
    return table;
}

void print_usage(std::ostream& out) {
    out << "cannyup " << VERSION << " - build and install the " << TARGET_BINARY << " CLI\n\n";
    out << "Usage: cannyup <command> [options]\n\n";
    out << "Commands:\n";
    for (const auto& cmd : command_table()) {
        out << "  " << std::left << std::setw(16) << cmd.name << cmd.summary << "\n";
    }
    out << "\nOptions:\n";
    out << "  --source-dir=<path>  Directory containing Cargo.toml (default: current)\n";
    out << "  --no-color           Plain status output\n";
    out << "  -v, -vv, -vvv        Increase log verbosity\n";
    out << "  -q, --quiet          Only log errors\n";
    out << "  --log-level=<lvl>    trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<spec>  Per-module levels, e.g. install=debug,*=warn\n";
    out << "  --log-file=<path>    Also write logs to a file\n";
    out << "  --log-format=json    Machine-readable log lines\n";
    out << "  --help, -h           Show this help\n";
    out << "  --version, -V        Show version\n";
    out << "\nEnvironment:\n";
    out << "  CARGO_HOME           Base of the user install directory (default: ~/.cargo)\n";
    out << "  CANNYUP_LOG          Log level or filter when no log option is given\n";
}

void print_version(std::ostream& out) {
    out << "cannyup " << VERSION << "\n";
}

} // namespace cannyup::cli
