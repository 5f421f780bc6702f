//! # Privilege Elevation
//!
//! Writing to the system location needs root. Instead of letting `sudo`
//! prompt from somewhere deep inside a copy, the installer asks an
//! `Elevator` up front and gets an explicit `ElevationRequest` back.
//!
//! | Result        | Meaning                                        |
//! |---------------|------------------------------------------------|
//! | `NotRequired` | Unprivileged target, or already running as root|
//! | `Granted`     | `sudo -v` succeeded; use sudo for file steps   |
//! | `Denied`      | `sudo -v` failed (wrong password, not allowed) |
//! | `Unavailable` | No `sudo` on the search path                   |

#ifndef CANNYUP_CORE_ELEVATION_HPP
#define CANNYUP_CORE_ELEVATION_HPP

#include "core/environment.hpp"
#include "core/process.hpp"

#include <string>
#include <vector>

namespace cannyup {

struct InstallTarget;

enum class ElevationRequest { NotRequired, Granted, Denied, Unavailable };

const char* elevation_name(ElevationRequest request);

class Elevator {
public:
    virtual ~Elevator() = default;

    virtual ElevationRequest request(const InstallTarget& target,
                                     const ProcessEnvironment& env) = 0;

    /// Command prefix for privileged steps once Granted (e.g. {"sudo"}).
    virtual std::vector<std::string> command_prefix() const = 0;
};

class SudoElevator : public Elevator {
public:
    explicit SudoElevator(ProcessRunner& runner) : runner_(runner) {}

    ElevationRequest request(const InstallTarget& target, const ProcessEnvironment& env) override;

    std::vector<std::string> command_prefix() const override {
        return {"sudo"};
    }

private:
    ProcessRunner& runner_;
};

} // namespace cannyup

#endif // CANNYUP_CORE_ELEVATION_HPP
