//! # View Commands Interface
//!
//! Read-only commands that render a file without touching it or the store:
//!
//! - `run_extract(ctx, args)`: comments found in the file, as JSON
//! - `run_strip(ctx, args)`: the clean view
//! - `run_inject(ctx, args)`: stored comments rendered into the file

#ifndef VCM_CLI_CMD_VIEW_HPP
#define VCM_CLI_CMD_VIEW_HPP

#include "cli/utils.hpp"

namespace vcm::cli {

int run_extract(const CliContext& ctx, const CommandArgs& args);
int run_strip(const CliContext& ctx, const CommandArgs& args);
int run_inject(const CliContext& ctx, const CommandArgs& args);

} // namespace vcm::cli

#endif // VCM_CLI_CMD_VIEW_HPP
