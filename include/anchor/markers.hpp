//! # Comment Marker Table
//!
//! Maps a file-type tag (lowercase extension, `"py"`, `"cpp"`) to the
//! line-comment markers of that language. Unknown types fall back to a
//! catch-all set that recognizes the common families.
//!
//! The built-in table is created once and never changes. Workspace
//! configuration builds a separate table on top of it with `with_overrides`.

#ifndef VCM_ANCHOR_MARKERS_HPP
#define VCM_ANCHOR_MARKERS_HPP

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vcm::anchor {

using MarkerList = std::vector<std::string>;

class CommentMarkerTable {
public:
    /// Table with only the fallback set.
    CommentMarkerTable();

    /// The built-in table, constructed on first use.
    static const CommentMarkerTable& builtin();

    /// Markers for `file_type` in match order, or the fallback set.
    [[nodiscard]] const MarkerList& markers_for(std::string_view file_type) const;

    [[nodiscard]] bool knows(std::string_view file_type) const;

    [[nodiscard]] const MarkerList& fallback() const {
        return fallback_;
    }

    /// Copy of this table with `overrides` replacing or adding entries.
    /// Empty marker lists in `overrides` are ignored.
    [[nodiscard]] CommentMarkerTable
    with_overrides(const std::map<std::string, MarkerList>& overrides) const;

private:
    std::unordered_map<std::string, MarkerList> table_;
    MarkerList fallback_;

    void assign(std::initializer_list<const char*> types, const MarkerList& markers);
};

/// File-type tag of a path: the lowercase extension without the dot, or
/// an empty string when there is none.
[[nodiscard]] std::string file_type_for_path(std::string_view path);

} // namespace vcm::anchor

#endif // VCM_ANCHOR_MARKERS_HPP
