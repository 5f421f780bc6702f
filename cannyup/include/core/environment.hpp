//! # Process Environment
//!
//! An explicit snapshot of the variables and working directory a command
//! runs with. Components never read `getenv()` or `PATH` directly; they
//! are handed a `ProcessEnvironment`, and the toolchain installer returns
//! state that the caller merges instead of sourcing an env file.
//!
//! ## Search Path Resolution
//!
//! `find_executable()` mirrors `command -v`: names containing a `/` are
//! checked as-is, bare names are looked up in each `PATH` entry in order,
//! with empty entries meaning the working directory.

#ifndef CANNYUP_CORE_ENVIRONMENT_HPP
#define CANNYUP_CORE_ENVIRONMENT_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cannyup {

namespace fs = std::filesystem;

class ProcessEnvironment {
public:
    using VarMap = std::map<std::string, std::string, std::less<>>;

    ProcessEnvironment() = default;
    ProcessEnvironment(VarMap vars, fs::path cwd)
        : vars_(std::move(vars)), cwd_(std::move(cwd)) {}

    /// Snapshot of the running process (environ + current directory).
    static ProcessEnvironment capture();

    std::optional<std::string> get(std::string_view name) const;

    /// Value of `name`, or `fallback` if unset or empty.
    std::string get_or(std::string_view name, std::string_view fallback) const;

    void set(const std::string& name, std::string value);
    void unset(std::string_view name);

    const fs::path& cwd() const {
        return cwd_;
    }
    void set_cwd(fs::path cwd) {
        cwd_ = std::move(cwd);
    }

    /// `PATH` split on ':'. Empty entries become ".".
    std::vector<fs::path> search_path() const;

    /// True if `dir` is one of the search path entries (lexically normalized).
    bool on_search_path(const fs::path& dir) const;

    /// Puts `dir` at the front of `PATH` unless it is already on it.
    void prepend_search_path(const fs::path& dir);

    /// Resolves a command name to an executable regular file.
    std::optional<fs::path> find_executable(std::string_view name) const;

    /// "NAME=value" strings for execve().
    std::vector<std::string> to_envp() const;

private:
    VarMap vars_;
    fs::path cwd_;
};

/// True if `path` is a regular file the current user may execute.
bool is_executable_file(const fs::path& path);

} // namespace cannyup

#endif // CANNYUP_CORE_ENVIRONMENT_HPP
