#include "core/environment.hpp"

#include "log/log.hpp"

#include <system_error>
#include <unistd.h>

extern char** environ;

namespace cannyup {

ProcessEnvironment ProcessEnvironment::capture() {
    VarMap vars;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view kv = *entry;
        auto eq = kv.find('=');
        if (eq == std::string_view::npos || eq == 0)
            continue;
        vars.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        CANNYUP_LOG_WARN("env", "cannot determine working directory: " << ec.message());
    }
    return ProcessEnvironment(std::move(vars), std::move(cwd));
}

std::optional<std::string> ProcessEnvironment::get(std::string_view name) const {
    auto it = vars_.find(name);
    if (it == vars_.end())
        return std::nullopt;
    return it->second;
}

std::string ProcessEnvironment::get_or(std::string_view name, std::string_view fallback) const {
    auto it = vars_.find(name);
    if (it == vars_.end() || it->second.empty())
        return std::string(fallback);
    return it->second;
}

void ProcessEnvironment::set(const std::string& name, std::string value) {
    vars_[name] = std::move(value);
}

void ProcessEnvironment::unset(std::string_view name) {
    auto it = vars_.find(name);
    if (it != vars_.end())
        vars_.erase(it);
}

std::vector<fs::path> ProcessEnvironment::search_path() const {
    std::vector<fs::path> dirs;
    auto path = get("PATH");
    if (!path)
        return dirs;

    std::string_view rest = *path;
    while (true) {
        auto colon = rest.find(':');
        auto entry = rest.substr(0, colon);
        dirs.emplace_back(entry.empty() ? fs::path(".") : fs::path(entry));
        if (colon == std::string_view::npos)
            break;
        rest.remove_prefix(colon + 1);
    }
    return dirs;
}

bool ProcessEnvironment::on_search_path(const fs::path& dir) const {
    auto wanted = dir.lexically_normal();
    for (const auto& entry : search_path()) {
        auto normal = entry.lexically_normal();
        if (normal == wanted || normal / "" == wanted || normal == wanted / "")
            return true;
    }
    return false;
}

void ProcessEnvironment::prepend_search_path(const fs::path& dir) {
    if (on_search_path(dir))
        return;
    auto current = get("PATH");
    if (current && !current->empty()) {
        set("PATH", dir.string() + ":" + *current);
    } else {
        set("PATH", dir.string());
    }
}

std::optional<fs::path> ProcessEnvironment::find_executable(std::string_view name) const {
    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string_view::npos) {
        fs::path candidate(name);
        if (candidate.is_relative())
            candidate = cwd_ / candidate;
        if (is_executable_file(candidate))
            return candidate;
        return std::nullopt;
    }

    for (const auto& dir : search_path()) {
        fs::path base = dir.is_relative() ? cwd_ / dir : dir;
        fs::path candidate = base / name;
        if (is_executable_file(candidate)) {
            CANNYUP_LOG_TRACE("env", "resolved " << name << " -> " << candidate.string());
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<std::string> ProcessEnvironment::to_envp() const {
    std::vector<std::string> envp;
    envp.reserve(vars_.size());
    for (const auto& [name, value] : vars_) {
        envp.push_back(name + "=" + value);
    }
    return envp;
}

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return false;
    return access(path.c_str(), X_OK) == 0;
}

} // namespace cannyup
