#include "core/elevation.hpp"

#include "core/installer.hpp"
#include "log/log.hpp"

#include <unistd.h>

namespace cannyup {

const char* elevation_name(ElevationRequest request) {
    switch (request) {
    case ElevationRequest::NotRequired:
        return "not required";
    case ElevationRequest::Granted:
        return "granted";
    case ElevationRequest::Denied:
        return "denied";
    case ElevationRequest::Unavailable:
        return "unavailable";
    }
    return "unknown";
}

ElevationRequest SudoElevator::request(const InstallTarget& target,
                                       const ProcessEnvironment& env) {
    if (!target.requires_elevation || geteuid() == 0) {
        return ElevationRequest::NotRequired;
    }

    if (!env.find_executable("sudo")) {
        CANNYUP_LOG_DEBUG("elevate", "sudo not found on search path");
        return ElevationRequest::Unavailable;
    }

    // Prompts for the password on the terminal if no cached credential exists.
    auto validated = runner_.run({{"sudo", "-v"}, std::nullopt, OutputMode::Inherit}, env);
    if (is_err(validated)) {
        CANNYUP_LOG_DEBUG("elevate", "sudo -v could not run: " << unwrap_err(validated).message);
        return ElevationRequest::Unavailable;
    }
    if (!unwrap(validated).success()) {
        CANNYUP_LOG_DEBUG("elevate", "sudo -v exited with " << unwrap(validated).exit_code);
        return ElevationRequest::Denied;
    }
    return ElevationRequest::Granted;
}

} // namespace cannyup
