//! # cannyup Entry Point
//!
//! Builds the canny CLI from source and installs it, making sure the
//! toolchains it needs are present first.
//!
//! ## Usage
//!
//! ```bash
//! cannyup install         # Toolchains, release build, /usr/local/bin (sudo)
//! cannyup install-user    # Same, into ~/.cargo/bin
//! cannyup uninstall       # Remove from /usr/local/bin
//! cannyup build           # Debug build only
//! cannyup test            # cargo test
//! ```
//!
//! All work is done by the CLI driver (`cli/driver.hpp`).

#include "cli/driver.hpp"

/// @return Exit code: 0 for success, 1 for any failure
int main(int argc, char* argv[]) {
    return cannyup_main(argc, argv);
}
