//! # fwtest Entry Point
//!
//! The binary is named `fwtest`. All work happens in the CLI driver.
//!
//! ## Usage
//!
//! ```bash
//! fwtest run                    # Build and run every test in fwtest.toml
//! fwtest list                   # Show declared tests and frameworks
//! fwtest resolve ios_x64        # Print resolved platform metadata
//! ```
//!
//! ## See Also
//!
//! - `cli/driver.hpp` - CLI driver interface
//! - `cli/dispatcher.cpp` - Command dispatching logic

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return fwtest_main(argc, argv);
}
