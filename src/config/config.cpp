//! # Workspace Configuration
//!
//! Line-oriented reader for the small TOML subset `vcm.toml` uses:
//! `[section]` headers, `key = value` pairs, `#` comments, quoted or bare
//! values.

#include "config/config.hpp"

#include "anchor/lines.hpp"

#include <fstream>
#include <sstream>

namespace vcm::config {

namespace {

enum class Section { None, Vcm, Markers, Unknown };

/// Drops a `#` comment that is not inside a quoted string.
std::string strip_comment(const std::string& line) {
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            quoted = !quoted;
        } else if (line[i] == '#' && !quoted) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string unquote(std::string value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::optional<bool> parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    return std::nullopt;
}

anchor::MarkerList parse_markers(const std::string& value) {
    anchor::MarkerList markers;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto marker = std::string(anchor::trim(item));
        if (!marker.empty()) {
            markers.push_back(std::move(marker));
        }
    }
    return markers;
}

void apply_vcm_key(WorkspaceConfig& config, const std::string& key, const std::string& value,
                   const std::string& where) {
    if (key == "storage-dir") {
        if (value.empty()) {
            VCM_LOG_WARN("config", where << ": storage-dir must not be empty");
        } else {
            config.storage_dir = value;
        }
    } else if (key == "show-private") {
        if (auto flag = parse_bool(value)) {
            config.show_private = *flag;
        } else {
            VCM_LOG_WARN("config", where << ": show-private expects true or false");
        }
    } else if (key == "log-level") {
        auto level = log::parse_level(value);
        if (level == log::LogLevel::Info && value != "info" && value != "INFO") {
            VCM_LOG_WARN("config", where << ": unknown log level '" << value << "'");
        } else {
            config.log_level = level;
        }
    } else {
        VCM_LOG_DEBUG("config", where << ": ignoring unknown key '" << key << "'");
    }
}

} // namespace

anchor::CommentMarkerTable WorkspaceConfig::marker_table() const {
    return anchor::CommentMarkerTable::builtin().with_overrides(markers);
}

WorkspaceConfig parse_config(std::string_view text, const std::string& source) {
    WorkspaceConfig config;
    Section section = Section::None;

    std::istringstream in{std::string(text)};
    std::string raw;
    size_t line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        auto line = std::string(anchor::trim(strip_comment(raw)));
        if (line.empty()) {
            continue;
        }
        std::string where = source + ":" + std::to_string(line_no);

        // Check for section headers
        if (line.front() == '[') {
            if (line.back() != ']') {
                VCM_LOG_WARN("config", where << ": malformed section header");
                section = Section::Unknown;
            } else if (line == "[vcm]") {
                section = Section::Vcm;
            } else if (line == "[markers]") {
                section = Section::Markers;
            } else {
                VCM_LOG_DEBUG("config", where << ": ignoring section " << line);
                section = Section::Unknown;
            }
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            VCM_LOG_WARN("config", where << ": expected 'key = value'");
            continue;
        }
        auto key = std::string(anchor::trim(std::string_view(line).substr(0, eq_pos)));
        auto value = unquote(std::string(anchor::trim(std::string_view(line).substr(eq_pos + 1))));
        if (key.empty()) {
            VCM_LOG_WARN("config", where << ": missing key");
            continue;
        }

        switch (section) {
        case Section::Vcm:
            apply_vcm_key(config, key, value, where);
            break;
        case Section::Markers: {
            auto markers = parse_markers(value);
            if (markers.empty()) {
                VCM_LOG_WARN("config", where << ": no markers given for '" << key << "'");
            } else {
                config.markers[key] = std::move(markers);
            }
            break;
        }
        case Section::None:
            VCM_LOG_WARN("config", where << ": key '" << key << "' outside of a section");
            break;
        case Section::Unknown:
            break;
        }
    }

    return config;
}

WorkspaceConfig load_config(const fs::path& root) {
    fs::path config_path = root / CONFIG_FILE_NAME;
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        return WorkspaceConfig{};
    }

    std::ifstream file(config_path);
    if (!file) {
        VCM_LOG_WARN("config", "Cannot read " << config_path.string() << ", using defaults");
        return WorkspaceConfig{};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config(buffer.str(), config_path.string());
    VCM_LOG_DEBUG("config", "Loaded " << config_path.string() << " (storage-dir="
                                      << config.storage_dir << ", " << config.markers.size()
                                      << " marker overrides)");
    return config;
}

} // namespace vcm::config
