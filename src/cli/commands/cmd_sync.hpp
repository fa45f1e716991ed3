//! # Sync Commands Interface
//!
//! Commands that update the store and rewrite the file in place:
//!
//! - `run_save(ctx, args)`: reconcile and persist
//! - `run_toggle(ctx, args)`: switch between commented and clean
//! - `run_private(ctx, args)`: show or hide private comments

#ifndef VCM_CLI_CMD_SYNC_HPP
#define VCM_CLI_CMD_SYNC_HPP

#include "cli/utils.hpp"

namespace vcm::cli {

int run_save(const CliContext& ctx, const CommandArgs& args);
int run_toggle(const CliContext& ctx, const CommandArgs& args);
int run_private(const CliContext& ctx, const CommandArgs& args);

} // namespace vcm::cli

#endif // VCM_CLI_CMD_SYNC_HPP
