//! # Extractor
//!
//! One pass over a text that turns its comments into anchored records.
//!
//! Consecutive whole-line comments form a block, attached to the first code
//! line below them. Blank lines between two comment lines stay inside the
//! block; blank lines around it are only counted, so that the block can be
//! put back with the same spacing. A trailing comment on a code line becomes
//! an inline record anchored to the code before it.
//!
//! Comments with no code below them (file footers, comment-only files) are
//! attached to the first code line of the file, or to the zero line when the
//! file has none.
//!
//! Records come out in ascending order of their first line; callers rely on
//! that order as the tie-break for everything downstream.

#ifndef VCM_ANCHOR_EXTRACTOR_HPP
#define VCM_ANCHOR_EXTRACTOR_HPP

#include "anchor/classifier.hpp"
#include "anchor/record.hpp"

#include <string_view>
#include <vector>

namespace vcm::anchor {

[[nodiscard]] std::vector<CommentRecord> extract(std::string_view text,
                                                 const CommentClassifier& classifier);

/// Uses the built-in marker table.
[[nodiscard]] std::vector<CommentRecord> extract(std::string_view text,
                                                 std::string_view file_type);

} // namespace vcm::anchor

#endif // VCM_ANCHOR_EXTRACTOR_HPP
