//! # Reconciler
//!
//! Merges the comments found in an edited text with the persisted set of
//! that file, without losing what the current view cannot show.
//!
//! A document is either **Commented** (comments rendered) or **Clean**
//! (hidden). In Commented mode the text is the truth: the new set is the
//! extraction, with the visibility flags of matching old records carried
//! over. In Clean mode the persisted payloads are the truth: comments typed
//! into the clean view are collected in `clean_mode_payload` and only merged
//! into `payload` when the view goes back to Commented.
//!
//! All functions are pure: no I/O, no clock, no shared state.

#ifndef VCM_ANCHOR_RECONCILER_HPP
#define VCM_ANCHOR_RECONCILER_HPP

#include "anchor/classifier.hpp"
#include "anchor/record.hpp"
#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace vcm::anchor {

enum class Mode : uint8_t { Commented, Clean };

[[nodiscard]] const char* mode_name(Mode mode);

struct ReconcileOptions {
    /// Private comments are currently rendered in the text.
    bool private_visible = true;
};

[[nodiscard]] PersistedCommentSet reconcile(std::string_view current_text,
                                            const CommentClassifier& classifier,
                                            const PersistedCommentSet& persisted, Mode mode,
                                            const ReconcileOptions& options = {});

/// Uses the built-in marker table.
[[nodiscard]] PersistedCommentSet reconcile(std::string_view current_text,
                                            std::string_view file_type,
                                            const PersistedCommentSet& persisted, Mode mode);

/// Guesses whether `current_text` shows the comments of `persisted`.
///
/// Up to 10 shared, not always-visible records are probed: the first line of
/// their payload must still appear on the line it was extracted from. More
/// than half missing means Clean. Without a set, or without anything to
/// probe, the text is Commented exactly when it contains any comment.
[[nodiscard]] Mode detect_mode(std::string_view current_text, const CommentClassifier& classifier,
                               const PersistedCommentSet* persisted);

/// Classifier taken from the set's file extension.
[[nodiscard]] Mode detect_mode(std::string_view current_text,
                               const PersistedCommentSet* persisted);

/// Same probe over private records. Nullopt when there is none to probe.
[[nodiscard]] std::optional<bool> detect_private_visible(std::string_view current_text,
                                                         const PersistedCommentSet& persisted);

/// Moves every `clean_mode_payload` in front of its `payload`, skipping
/// lines the payload already has, and clears it.
[[nodiscard]] PersistedCommentSet merge_clean_mode_payloads(PersistedCommentSet set);

enum class RecordFlag : uint8_t { AlwaysVisible, Private };

/// Sets `flag` on the comment covering 0-based `line` of `current_text`.
///
/// The comment is matched to a persisted record of the same kind and anchor,
/// by original line first and context second. Unknown comments are added
/// to the set; a missing set starts a new one for `file`. Fails when no
/// comment covers `line`.
[[nodiscard]] Result<PersistedCommentSet, std::string>
mark_record(std::string_view current_text, const CommentClassifier& classifier,
            const PersistedCommentSet* persisted, const std::string& file, size_t line,
            RecordFlag flag, bool value);

} // namespace vcm::anchor

#endif // VCM_ANCHOR_RECONCILER_HPP
