//! # Record Commands Interface
//!
//! - `run_mark(ctx, args)`: flag a comment always-visible or private
//! - `run_status(ctx, args)`: detected view and stored counts
//! - `run_forget(ctx, args)`: delete what is stored for a file

#ifndef VCM_CLI_CMD_MARK_HPP
#define VCM_CLI_CMD_MARK_HPP

#include "cli/utils.hpp"

namespace vcm::cli {

int run_mark(const CliContext& ctx, const CommandArgs& args);
int run_status(const CliContext& ctx, const CommandArgs& args);
int run_forget(const CliContext& ctx, const CommandArgs& args);

} // namespace vcm::cli

#endif // VCM_CLI_CMD_MARK_HPP
