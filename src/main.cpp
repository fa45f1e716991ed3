//! # vcm Entry Point
//!
//! `main()` only delegates to the CLI driver (`cli/driver.hpp`), which
//! parses arguments, configures logging and runs one command.
//!
//! ```bash
//! vcm toggle src/app.py     # hide or show the comments of a file
//! vcm save src/app.py       # store comment edits
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return vcm::cli::vcm_main(argc, argv);
}
