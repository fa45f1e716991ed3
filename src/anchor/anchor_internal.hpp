//! # Anchor Internals
//!
//! Line scanning shared by the extractor, injector, stripper and
//! reconciler. Not part of the public headers.

#ifndef VCM_ANCHOR_INTERNAL_HPP
#define VCM_ANCHOR_INTERNAL_HPP

#include "anchor/classifier.hpp"
#include "anchor/fingerprint.hpp"
#include "anchor/record.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vcm::anchor::detail {

/// Points awarded per matching context fingerprint.
inline constexpr int CONTEXT_MATCH_SCORE = 10;

/// Precomputed code/comment classification of a line vector.
///
/// Without a classifier every non-blank line counts as code and is
/// fingerprinted whole; with one, comment lines are skipped and code lines
/// are fingerprinted without their inline comment.
class LineScan {
public:
    LineScan(const std::vector<std::string>& lines, const CommentClassifier* classifier);

    [[nodiscard]] size_t size() const {
        return code_.size();
    }

    [[nodiscard]] bool is_code(size_t i) const {
        return code_[i];
    }

    /// Fingerprint of the code portion of line `i`.
    [[nodiscard]] LineFingerprint code_fingerprint(size_t i) const {
        return fingerprints_[i];
    }

    /// Nearest code line strictly before / after `i`.
    [[nodiscard]] std::optional<size_t> prev_code(size_t i) const;
    [[nodiscard]] std::optional<size_t> next_code(size_t i) const;

    [[nodiscard]] std::optional<size_t> first_code() const;

    [[nodiscard]] std::optional<LineFingerprint> prev_context(size_t i) const;
    [[nodiscard]] std::optional<LineFingerprint> next_context(size_t i) const;

    /// Context score of line `i` against stored context fingerprints.
    [[nodiscard]] int context_score(size_t i, const std::optional<LineFingerprint>& prev,
                                    const std::optional<LineFingerprint>& next) const;

private:
    std::vector<bool> code_;
    std::vector<LineFingerprint> fingerprints_;
    std::vector<size_t> prev_; ///< npos when none
    std::vector<size_t> next_;
};

// ============================================================================
// Record Matching
// ============================================================================

using RecordFilter = std::function<bool(const CommentRecord&)>;

/// Same verbatim text in `payload`, or in `clean_mode_payload` of `stored`.
[[nodiscard]] bool same_text(const CommentRecord& probe, const CommentRecord& stored);

/// Finds the record of `pool` that `probe` is a newer observation of.
///
/// Records sharing kind and anchor compete on context fingerprints, then on
/// identical text, then on original line; the lowest index wins remaining
/// ties. Failing that, a record of the same kind with identical text is
/// accepted, which follows a comment whose code line was edited. Entries
/// marked in `taken` or rejected by `eligible` are skipped.
[[nodiscard]] std::optional<size_t> match_record(const CommentRecord& probe,
                                                 const std::vector<CommentRecord>& pool,
                                                 const std::vector<bool>& taken,
                                                 const RecordFilter& eligible = {});

/// Number of blank lines directly above line `i`.
[[nodiscard]] size_t blank_run_above(const std::vector<std::string>& lines, size_t i);

} // namespace vcm::anchor::detail

#endif // VCM_ANCHOR_INTERNAL_HPP
