//! # CLI Driver
//!
//! Entry point shared by `main()` and tests that drive the command line.

#ifndef VCM_CLI_DRIVER_HPP
#define VCM_CLI_DRIVER_HPP

namespace vcm::cli {

/// Parses `argv`, runs one command and returns the process exit code.
int vcm_main(int argc, char* argv[]);

} // namespace vcm::cli

#endif // VCM_CLI_DRIVER_HPP
