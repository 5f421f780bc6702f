//! # CLI Command Dispatcher
//!
//! Parses the command line and routes to the command handlers.
//!
//! ## Architecture
//!
//! ```text
//! cannyup_main()
//!   ├─ log options    → log::parse_log_options() / Logger::init()
//!   ├─ parse_invocation()
//!   └─ dispatch()
//!        ├─ help, --help     → print_usage()
//!        ├─ version          → print_version()
//!        ├─ build, release   → run_build()
//!        ├─ install(-user)   → run_install()
//!        ├─ uninstall(-user) → run_uninstall()
//!        └─ clean, test, check, fmt, lint → run_cargo_task()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                   |
//! |------|-------------------------------------------|
//! | 0    | Success (including PATH warnings)         |
//! | 1    | Any failure, bad usage or unknown command |

#include "cli/commands/cmd_build.hpp"
#include "cli/commands/cmd_install.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <cstdio>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

namespace cannyup::cli {

namespace {

int finish(CommandContext& ctx, const std::string& command, const Status& status) {
    if (is_ok(status)) {
        CANNYUP_LOG_DEBUG("cli", command << " finished");
        return 0;
    }
    const auto& error = unwrap_err(status);
    CANNYUP_LOG_ERROR("cli", command << " failed (" << error_kind_name(error.kind)
                                     << "): " << error.message);
    ctx.status.fatal(error);
    return 1;
}

bool terminal_colors(const ProcessEnvironment& env) {
    if (!isatty(fileno(stdout))) {
        return false;
    }
    auto term = env.get("TERM");
    return !term || *term != "dumb";
}

} // namespace

int dispatch(const std::string& command, CommandContext& ctx) {
    if (command == "help") {
        print_usage(std::cout);
        return 0;
    }

    if (command == "version") {
        print_version(std::cout);
        return 0;
    }

    if (command == "build") {
        return finish(ctx, command, run_build(ctx, BuildProfile::Debug));
    }

    if (command == "release") {
        return finish(ctx, command, run_build(ctx, BuildProfile::Release));
    }

    if (command == "install") {
        return finish(ctx, command, run_install(ctx, TargetKind::System));
    }

    if (command == "install-user") {
        return finish(ctx, command, run_install(ctx, TargetKind::User));
    }

    if (command == "uninstall") {
        return finish(ctx, command, run_uninstall(ctx, TargetKind::System));
    }

    if (command == "uninstall-user") {
        return finish(ctx, command, run_uninstall(ctx, TargetKind::User));
    }

    if (command == "clean") {
        return finish(ctx, command, run_cargo_task(ctx, CargoTask::Clean));
    }

    if (command == "test") {
        return finish(ctx, command, run_cargo_task(ctx, CargoTask::Test));
    }

    if (command == "check") {
        return finish(ctx, command, run_cargo_task(ctx, CargoTask::Check));
    }

    if (command == "fmt") {
        return finish(ctx, command, run_cargo_task(ctx, CargoTask::Fmt));
    }

    if (command == "lint") {
        return finish(ctx, command, run_cargo_task(ctx, CargoTask::Lint));
    }

    std::cerr << "Error: Unknown command '" << command << "'\n";
    std::cerr << "Run 'cannyup help' for usage information.\n";
    return 1;
}

int cannyup_main(int argc, char* argv[]) {
    auto env = ProcessEnvironment::capture();

    auto log_config = log::parse_log_options(argc, argv, env.get_or("CANNYUP_LOG", ""));
    log::Logger::init(log_config);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    auto parsed = parse_invocation(args, env);
    if (is_err(parsed)) {
        std::cerr << "Error: " << unwrap_err(parsed) << "\n";
        std::cerr << "Run 'cannyup help' for usage information.\n";
        return 1;
    }
    auto& invocation = unwrap(parsed);

    bool colors = invocation.colors && terminal_colors(env);
    PosixProcessRunner runner;
    SudoElevator elevator(runner);
    StatusReporter status(std::cout, std::cerr, colors);

    CommandContext ctx{invocation.config, std::move(env), runner, elevator, status};
    CANNYUP_LOG_DEBUG("cli", "command '" << invocation.command << "' in "
                                         << ctx.config.source_root.string());

    int code = dispatch(invocation.command, ctx);
    log::Logger::instance().flush();
    return code;
}

} // namespace cannyup::cli

int cannyup_main(int argc, char* argv[]) {
    return cannyup::cli::cannyup_main(argc, argv);
}
