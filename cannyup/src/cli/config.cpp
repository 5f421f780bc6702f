#include "config.hpp"

#include "log/log.hpp"

namespace cannyup::cli {

Result<Invocation, std::string> parse_invocation(const std::vector<std::string>& args,
                                                 const ProcessEnvironment& env) {
    Invocation inv;
    inv.config.source_root = env.cwd();
    bool have_command = false;

    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            inv.command = "help";
            have_command = true;
        } else if (arg == "--version" || arg == "-V") {
            inv.command = "version";
            have_command = true;
        } else if (arg.starts_with("--source-dir=")) {
            fs::path dir = arg.substr(13);
            if (dir.empty()) {
                return std::string("--source-dir needs a path");
            }
            inv.config.source_root = dir.is_relative() ? env.cwd() / dir : dir;
        } else if (arg == "--no-color") {
            inv.colors = false;
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg.starts_with("-")) {
            return "unknown option '" + arg + "'";
        } else if (!have_command) {
            inv.command = arg;
            have_command = true;
        } else {
            return "unexpected argument '" + arg + "'";
        }
    }

    inv.config.source_root = inv.config.source_root.lexically_normal();
    return inv;
}

} // namespace cannyup::cli
