//! # Stripper
//!
//! Produces the clean view of a text: whole-line comments removed, inline
//! comments cut off together with the whitespace gap before them.
//!
//! The text is re-extracted first, so the physical lines of every record are
//! known exactly: blank lines inside a removed block go with it, while the
//! blank lines around it stay, which is what lets `inject` restore the
//! original spacing.
//!
//! Each extracted comment is matched to the persisted records. A comment
//! whose record is always-visible (and shared), or private while
//! `keep_private` is set, is left in place.

#ifndef VCM_ANCHOR_STRIPPER_HPP
#define VCM_ANCHOR_STRIPPER_HPP

#include "anchor/classifier.hpp"
#include "anchor/record.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vcm::anchor {

enum class StripScope : uint8_t {
    All,        ///< Every comment not exempt
    PrivateOnly ///< Only comments belonging to private records
};

struct StripOptions {
    bool keep_private = false;
    StripScope scope = StripScope::All;
};

[[nodiscard]] std::string strip(std::string_view text, const CommentClassifier& classifier,
                                const std::vector<CommentRecord>& persisted,
                                const StripOptions& options = {});

/// Uses the built-in marker table.
[[nodiscard]] std::string strip(std::string_view text, std::string_view file_type,
                                const std::vector<CommentRecord>& persisted, bool keep_private);

} // namespace vcm::anchor

#endif // VCM_ANCHOR_STRIPPER_HPP
