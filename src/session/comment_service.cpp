//! # Comment Service
//!
//! Glue between document sessions, the pure engine in `anchor/` and the
//! store. Every operation holds the document's session lock; toggles also
//! hold a `SyncSuppressor` so the save events their own write triggers are
//! ignored.

#include "session/comment_service.hpp"

#include "anchor/injector.hpp"
#include "anchor/stripper.hpp"
#include "common/crc32c.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace vcm::session {

using anchor::CommentClassifier;
using anchor::Mode;
using anchor::PersistedCommentSet;

namespace {

constexpr const char* NO_DATA_MESSAGE =
    "no annotation data yet: save once while comments are visible";

PersistedCommentSet empty_set(const std::string& rel) {
    PersistedCommentSet set;
    set.file = rel;
    return set;
}

void log_orphans(const std::string& rel, const std::vector<anchor::CommentRecord>& orphans) {
    if (orphans.empty()) {
        return;
    }
    VCM_LOG_WARN("session", orphans.size() << " comment(s) in " << rel
                                           << " could not be re-anchored");
    for (const auto& orphan : orphans) {
        VCM_LOG_DEBUG("session", "  orphan " << anchor::kind_name(orphan.kind()) << " anchored to "
                                             << orphan.anchor.to_hex() << ": "
                                             << anchor::payload_probe(orphan.payload));
    }
}

} // namespace

CommentService::CommentService(store::CommentStore store, anchor::CommentMarkerTable markers,
                               bool default_private_visible)
    : store_(std::move(store)), markers_(std::move(markers)),
      sessions_(default_private_visible) {}

CommentClassifier CommentService::classifier_for(const std::string& rel) const {
    return CommentClassifier::for_file_type(anchor::file_type_for_path(rel), markers_);
}

Result<std::optional<PersistedCommentSet>, VcmError>
CommentService::load(const std::string& rel) const {
    auto loaded = store_.load(rel);
    if (is_ok(loaded)) {
        return std::optional<PersistedCommentSet>(std::move(unwrap(loaded)));
    }
    const auto& error = unwrap_err(loaded);
    switch (error.kind) {
    case store::StoreErrorKind::NotFound:
        return std::optional<PersistedCommentSet>();
    case store::StoreErrorKind::Malformed:
        VCM_LOG_WARN("session", "Ignoring unreadable comment set: " << error.message);
        return std::optional<PersistedCommentSet>();
    case store::StoreErrorKind::Io:
        break;
    }
    return VcmError::make(VcmErrorKind::IoError, error.message);
}

Result<bool, VcmError> CommentService::persist(PersistedCommentSet& set) const {
    auto saved = store_.save(set);
    if (is_err(saved)) {
        return VcmError::make(VcmErrorKind::IoError, unwrap_err(saved).message);
    }
    return true;
}

void CommentService::settle(DocumentSession& session, std::string_view text,
                            const CommentClassifier& classifier,
                            const std::optional<PersistedCommentSet>& set) const {
    if (!session.private_known && set) {
        if (auto visible = anchor::detect_private_visible(text, *set)) {
            session.private_visible = *visible;
            session.private_known = true;
        }
    }
    if (!session.mode) {
        session.mode = anchor::detect_mode(text, classifier, set ? &*set : nullptr);
        VCM_LOG_DEBUG("session", session.path << " detected as " << anchor::mode_name(*session.mode));
    }
}

// ============================================================================
// Save
// ============================================================================

Result<SaveOutcome, VcmError> CommentService::on_save(const std::string& rel,
                                                      std::string_view text) {
    auto session = sessions_.open(rel);
    std::lock_guard<std::mutex> guard(session->lock);

    if (session->sync_suppressed) {
        VCM_LOG_DEBUG("session", "Save of " << rel << " skipped during toggle");
        return SaveOutcome{};
    }
    if (session->last_injected && *session->last_injected == crc32c(text)) {
        VCM_LOG_DEBUG("session", "Save of " << rel << " is our own write, skipped");
        return SaveOutcome{};
    }

    auto loaded = load(rel);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }
    auto& set = unwrap(loaded);

    auto classifier = classifier_for(rel);
    settle(*session, text, classifier, set);
    if (!set) {
        if (!classifier.contains_comments(text)) {
            return SaveOutcome{};
        }
        // Nothing can be hidden yet
        session->mode = Mode::Commented;
    }

    anchor::ReconcileOptions options{session->private_visible};
    auto reconciled = anchor::reconcile(text, classifier, set ? *set : empty_set(rel),
                                        *session->mode, options);
    reconciled.file = rel;

    if (set && reconciled.records == set->records) {
        VCM_LOG_DEBUG("session", "No comment changes in " << rel);
        return SaveOutcome{false, reconciled.records.size()};
    }

    auto persisted = persist(reconciled);
    if (is_err(persisted)) {
        return unwrap_err(persisted);
    }
    return SaveOutcome{true, reconciled.records.size()};
}

// ============================================================================
// Toggle
// ============================================================================

Result<ToggleOutcome, VcmError> CommentService::toggle(const std::string& rel,
                                                       std::string_view text) {
    auto session = sessions_.open(rel);
    std::lock_guard<std::mutex> guard(session->lock);
    SyncSuppressor suppress(*session);

    auto loaded = load(rel);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }
    auto& set = unwrap(loaded);

    auto classifier = classifier_for(rel);
    settle(*session, text, classifier, set);
    anchor::ReconcileOptions options{session->private_visible};

    ToggleOutcome outcome;

    if (!set) {
        if (!classifier.contains_comments(text)) {
            return VcmError::make(VcmErrorKind::NoPersistedSet, NO_DATA_MESSAGE);
        }
        // Comments are on screen whatever the session believed
        session->mode = Mode::Commented;
    }

    if (*session->mode == Mode::Commented) {
        auto reconciled = anchor::reconcile(text, classifier, set ? *set : empty_set(rel),
                                            Mode::Commented, options);
        reconciled.file = rel;
        auto persisted = persist(reconciled);
        if (is_err(persisted)) {
            return unwrap_err(persisted);
        }

        anchor::StripOptions strip_options;
        strip_options.keep_private = session->private_visible;
        outcome.text = anchor::strip(text, classifier, reconciled.records, strip_options);
        outcome.mode = Mode::Clean;
    } else {
        auto reconciled = anchor::merge_clean_mode_payloads(
            anchor::reconcile(text, classifier, *set, Mode::Clean, options));
        reconciled.file = rel;

        // Drop whatever the clean view shows; every record is re-rendered
        auto base = anchor::strip(text, classifier, reconciled.records, {});

        anchor::InjectOptions inject_options;
        inject_options.include_private = session->private_visible;
        inject_options.classifier = &classifier;
        auto injected = anchor::inject(base, reconciled.records, inject_options);

        auto persisted = persist(reconciled);
        if (is_err(persisted)) {
            return unwrap_err(persisted);
        }

        log_orphans(rel, injected.orphans);
        outcome.text = std::move(injected.text);
        outcome.placed = injected.placed;
        outcome.orphans = std::move(injected.orphans);
        outcome.mode = Mode::Commented;
    }

    session->mode = outcome.mode;
    session->last_injected = crc32c(outcome.text);
    VCM_LOG_INFO("session", rel << " is now " << anchor::mode_name(outcome.mode));
    return outcome;
}

// ============================================================================
// Private Visibility
// ============================================================================

Result<ToggleOutcome, VcmError> CommentService::set_private_visible(const std::string& rel,
                                                                    std::string_view text,
                                                                    bool visible) {
    auto session = sessions_.open(rel);
    std::lock_guard<std::mutex> guard(session->lock);
    SyncSuppressor suppress(*session);

    auto loaded = load(rel);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }
    auto& set = unwrap(loaded);

    auto classifier = classifier_for(rel);
    settle(*session, text, classifier, set);

    ToggleOutcome outcome;
    outcome.mode = *session->mode;

    if (!set || set->private_count() == 0 || session->private_visible == visible) {
        session->private_visible = visible;
        session->private_known = true;
        outcome.text = std::string(text);
        return outcome;
    }

    // Keep edits made so far before the text changes under them
    anchor::ReconcileOptions options{session->private_visible};
    auto reconciled = anchor::reconcile(text, classifier, *set, *session->mode, options);
    reconciled.file = rel;
    auto persisted = persist(reconciled);
    if (is_err(persisted)) {
        return unwrap_err(persisted);
    }

    if (visible) {
        anchor::InjectOptions inject_options;
        inject_options.include_private = true;
        inject_options.classifier = &classifier;
        auto injected = anchor::inject(text, reconciled.private_records(), inject_options);
        log_orphans(rel, injected.orphans);
        outcome.text = std::move(injected.text);
        outcome.placed = injected.placed;
        outcome.orphans = std::move(injected.orphans);
    } else {
        anchor::StripOptions strip_options;
        strip_options.scope = anchor::StripScope::PrivateOnly;
        outcome.text = anchor::strip(text, classifier, reconciled.records, strip_options);
    }

    session->private_visible = visible;
    session->private_known = true;
    session->last_injected = crc32c(outcome.text);
    VCM_LOG_INFO("session", "Private comments of " << rel << (visible ? " shown" : " hidden"));
    return outcome;
}

// ============================================================================
// Flags and Removal
// ============================================================================

Result<bool, VcmError> CommentService::mark(const std::string& rel, std::string_view text,
                                            size_t line, anchor::RecordFlag flag, bool value) {
    auto session = sessions_.open(rel);
    std::lock_guard<std::mutex> guard(session->lock);

    auto loaded = load(rel);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }
    auto& set = unwrap(loaded);

    auto marked = anchor::mark_record(text, classifier_for(rel), set ? &*set : nullptr, rel, line,
                                      flag, value);
    if (is_err(marked)) {
        return VcmError::make(VcmErrorKind::CommentNotFound, unwrap_err(marked));
    }
    auto persisted = persist(unwrap(marked));
    if (is_err(persisted)) {
        return unwrap_err(persisted);
    }
    VCM_LOG_INFO("session", "Line " << line + 1 << " of " << rel << " marked "
                                    << (flag == anchor::RecordFlag::Private ? "private"
                                                                            : "always-visible")
                                    << (value ? "" : " (unset)"));
    return true;
}

Result<bool, VcmError> CommentService::forget(const std::string& rel) {
    auto removed = store_.remove(rel);
    if (is_err(removed)) {
        return VcmError::make(VcmErrorKind::IoError, unwrap_err(removed).message);
    }
    sessions_.close(rel);
    return unwrap(removed);
}

Result<StatusReport, VcmError> CommentService::status(const std::string& rel,
                                                      std::string_view text) {
    auto session = sessions_.open(rel);
    std::lock_guard<std::mutex> guard(session->lock);

    auto loaded = load(rel);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }
    auto& set = unwrap(loaded);

    settle(*session, text, classifier_for(rel), set);

    StatusReport report;
    report.mode = *session->mode;
    report.private_visible = session->private_visible;
    if (set) {
        report.stored = true;
        for (const auto& record : set->records) {
            if (record.is_private) {
                ++report.private_records;
            } else {
                ++report.shared;
            }
            if (record.always_visible) {
                ++report.always_visible;
            }
            if (record.has_clean_mode_payload()) {
                ++report.pending_clean;
            }
        }
    }
    return report;
}

} // namespace vcm::session
