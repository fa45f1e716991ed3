//! # Injector
//!
//! Puts persisted comments back into code that may have changed since they
//! were extracted.
//!
//! Each record is re-located by its anchor fingerprint. When several lines
//! share the anchor, the candidate whose neighbouring code lines match the
//! record's context fingerprints wins (10 points per side), and the lowest
//! line index breaks ties. Records are placed in ascending original-line
//! order, so of two records with identical anchor and context the earlier
//! one takes the earlier line. A block claims its line so that a second
//! block with the same anchor lands on another occurrence; inline records do
//! not claim lines.
//!
//! A footer block (no code below it) is anchored to the first code line and
//! comes back above it. Its recorded blank-line spacing is not applied:
//! `"x\n\n# footer\n"` stripped and re-injected reads `"# footer\nx\n\n"`.
//!
//! Records whose anchor no longer exists are returned as orphans rather than
//! dropped silently, so that the caller can warn about them.

#ifndef VCM_ANCHOR_INJECTOR_HPP
#define VCM_ANCHOR_INJECTOR_HPP

#include "anchor/classifier.hpp"
#include "anchor/record.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vcm::anchor {

struct InjectOptions {
    /// Render private records too.
    bool include_private = false;

    /// Set when the target text may still contain comments; comment lines
    /// are then never anchor candidates and code lines are matched on their
    /// code portion. Null treats every non-blank line as code.
    const CommentClassifier* classifier = nullptr;
};

struct InjectResult {
    std::string text;
    std::vector<CommentRecord> orphans; ///< Anchor not found; not rendered
    size_t placed = 0;                  ///< Records rendered into `text`
};

[[nodiscard]] InjectResult inject(std::string_view clean_text,
                                  const std::vector<CommentRecord>& records,
                                  const InjectOptions& options);

/// Text only. Orphans are lost; prefer the `InjectOptions` form.
[[nodiscard]] std::string inject(std::string_view clean_text,
                                 const std::vector<CommentRecord>& records, bool include_private);

} // namespace vcm::anchor

#endif // VCM_ANCHOR_INJECTOR_HPP
