#include "core/builder.hpp"

#include "log/log.hpp"

#include <system_error>

namespace cannyup {

const char* profile_name(BuildProfile profile) {
    return profile == BuildProfile::Release ? "release" : "debug";
}

const char* cargo_task_name(CargoTask task) {
    switch (task) {
    case CargoTask::Clean:
        return "clean";
    case CargoTask::Test:
        return "test";
    case CargoTask::Check:
        return "check";
    case CargoTask::Fmt:
        return "fmt";
    case CargoTask::Lint:
        return "clippy";
    }
    return "";
}

fs::path Builder::artifact_path(BuildProfile profile) const {
    return source_root_ / "target" / profile_name(profile) / binary_name_;
}

Status Builder::run_cargo(const std::vector<std::string>& args, const ProcessEnvironment& env) {
    std::error_code ec;
    if (!fs::is_regular_file(source_root_ / "Cargo.toml", ec)) {
        return Error::build("no Cargo.toml in " + source_root_.string(),
                            "run from the canny source directory or pass --source-dir=<path>");
    }

    CommandSpec cargo;
    cargo.argv = {"cargo"};
    cargo.argv.insert(cargo.argv.end(), args.begin(), args.end());
    cargo.cwd = source_root_;
    cargo.mode = OutputMode::Inherit;

    auto result = runner_.run(cargo, env);
    if (is_err(result)) {
        return Error::build("could not run cargo: " + unwrap_err(result).message,
                            "install the Rust toolchain (cannyup install-user does this)");
    }
    if (!unwrap(result).success()) {
        return Error::build(describe_command(cargo.argv) + " failed with exit code " +
                            std::to_string(unwrap(result).exit_code));
    }
    return Unit{};
}

Result<BuildArtifact, Error> Builder::build(BuildProfile profile, const ProcessEnvironment& env) {
    std::vector<std::string> args = {"build"};
    if (profile == BuildProfile::Release) {
        args.push_back("--release");
    }

    CANNYUP_LOG_INFO("build", "building " << binary_name_ << " (" << profile_name(profile)
                                          << ") in " << source_root_.string());
    auto status = run_cargo(args, env);
    if (is_err(status)) {
        return unwrap_err(status);
    }

    fs::path output = artifact_path(profile);
    if (!is_executable_file(output)) {
        return Error::build("cargo succeeded but " + output.string() +
                            " is missing or not executable");
    }

    CANNYUP_LOG_DEBUG("build", "artifact " << output.string());
    return BuildArtifact{source_root_, output, profile};
}

Status Builder::run_task(CargoTask task, const ProcessEnvironment& env) {
    CANNYUP_LOG_INFO("build", "cargo " << cargo_task_name(task));
    return run_cargo({cargo_task_name(task)}, env);
}

} // namespace cannyup
