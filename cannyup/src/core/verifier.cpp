#include "core/verifier.hpp"

#include "log/log.hpp"

#include <system_error>

namespace cannyup {

std::optional<fs::path> resolve_command(std::string_view name, const ProcessEnvironment& env) {
    auto resolved = env.find_executable(name);
    if (resolved) {
        CANNYUP_LOG_DEBUG("verify", name << " resolves to " << resolved->string());
    } else {
        CANNYUP_LOG_DEBUG("verify", name << " does not resolve on the search path");
    }
    return resolved;
}

bool verify(std::string_view name, const ProcessEnvironment& env) {
    return resolve_command(name, env).has_value();
}

bool same_binary(const fs::path& resolved, const fs::path& installed) {
    std::error_code ec;
    bool same = fs::equivalent(resolved, installed, ec);
    if (ec) {
        return resolved.lexically_normal() == installed.lexically_normal();
    }
    return same;
}

} // namespace cannyup
