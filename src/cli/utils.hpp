//! # CLI Utilities Interface
//!
//! Shared helpers for the command handlers.
//!
//! | Helper                 | Description                                 |
//! |------------------------|---------------------------------------------|
//! | `CommandArgs`          | Positional arguments and flags of a command |
//! | `CliContext`           | Workspace root and its configuration        |
//! | `make_service()`       | `CommentService` for the workspace          |
//! | `read_source()`        | Read a source file                          |
//! | `emit()`               | Write output to stdout or a file            |
//! | `print_usage()`        | Print CLI help text                         |

#ifndef VCM_CLI_UTILS_HPP
#define VCM_CLI_UTILS_HPP

#include "common.hpp"
#include "config/config.hpp"
#include "session/comment_service.hpp"
#include "store/comment_store.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vcm::cli {

namespace fs = std::filesystem;

struct CommandArgs {
    std::vector<std::string> positional;
    std::set<std::string> flags;   ///< Bare `--name` options
    std::optional<std::string> output; ///< `-o <path>` / `--output=<path>`

    [[nodiscard]] bool has(const std::string& flag) const {
        return flags.count(flag) > 0;
    }
};

struct CliContext {
    fs::path root;
    config::WorkspaceConfig config;
};

std::string to_forward_slashes(const std::string& path);

[[nodiscard]] session::CommentService make_service(const CliContext& ctx);

/// The file argument as a workspace-relative path.
[[nodiscard]] std::string relative_to_root(const CliContext& ctx, const std::string& file);

[[nodiscard]] Result<std::string, store::StoreError> read_source(const std::string& path);

/// Prints `text` to stdout, or writes it atomically to `output`.
/// Returns the exit code.
int emit(const std::string& text, const std::optional<std::string>& output);

/// Reports an error on stderr and returns exit code 1.
int fail(const std::string& message);

void print_usage();
void print_version();

} // namespace vcm::cli

#endif // VCM_CLI_UTILS_HPP
