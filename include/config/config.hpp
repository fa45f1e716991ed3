//! # Workspace Configuration
//!
//! Settings loaded from `vcm.toml` in the workspace root.
//!
//! ```toml
//! [vcm]
//! storage-dir = ".vcm"
//! show-private = false
//! log-level = "warn"
//!
//! [markers]
//! tpl = "#, //"
//! ```
//!
//! A missing file gives the defaults. Unknown keys and malformed lines are
//! logged and skipped, never fatal.

#ifndef VCM_CONFIG_CONFIG_HPP
#define VCM_CONFIG_CONFIG_HPP

#include "anchor/markers.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace vcm::config {

namespace fs = std::filesystem;

inline constexpr const char* CONFIG_FILE_NAME = "vcm.toml";

struct WorkspaceConfig {
    std::string storage_dir = ".vcm";
    bool show_private = false;
    std::optional<log::LogLevel> log_level;
    std::map<std::string, anchor::MarkerList> markers; ///< File type -> markers

    /// The built-in table with `markers` applied.
    [[nodiscard]] anchor::CommentMarkerTable marker_table() const;
};

/// Parses the contents of a configuration file. `source` names it in
/// log messages.
WorkspaceConfig parse_config(std::string_view text, const std::string& source = CONFIG_FILE_NAME);

/// Loads `<root>/vcm.toml`, or the defaults when it does not exist.
WorkspaceConfig load_config(const fs::path& root);

} // namespace vcm::config

#endif // VCM_CONFIG_CONFIG_HPP
