//! # Comment Service
//!
//! The editor-facing operations: save, toggle between the commented and the
//! clean view, show or hide private comments, flag a comment, forget a
//! file. Each call takes the current document text and returns the text to
//! put back (if any), persisting through a `CommentStore`.
//!
//! ```cpp
//! CommentService service(store::CommentStore(root), table);
//! auto outcome = service.toggle("src/app.py", text);
//! if (is_ok(outcome)) {
//!     write_back(unwrap(outcome).text);
//! }
//! ```

#ifndef VCM_SESSION_COMMENT_SERVICE_HPP
#define VCM_SESSION_COMMENT_SERVICE_HPP

#include "anchor/classifier.hpp"
#include "anchor/reconciler.hpp"
#include "common.hpp"
#include "session/session.hpp"
#include "session/session_error.hpp"
#include "store/comment_store.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vcm::session {

struct SaveOutcome {
    bool persisted = false;
    size_t records = 0;
};

struct ToggleOutcome {
    std::string text;            ///< The document as it should now read
    anchor::Mode mode = anchor::Mode::Commented; ///< Mode of `text`
    size_t placed = 0;           ///< Records rendered by injection
    std::vector<anchor::CommentRecord> orphans; ///< Records whose anchor is gone
};

struct StatusReport {
    anchor::Mode mode = anchor::Mode::Commented;
    bool stored = false;
    bool private_visible = false;
    size_t shared = 0;
    size_t private_records = 0;
    size_t always_visible = 0;
    size_t pending_clean = 0; ///< Records holding comments typed in the clean view
};

class CommentService {
public:
    CommentService(store::CommentStore store,
                   anchor::CommentMarkerTable markers = anchor::CommentMarkerTable::builtin(),
                   bool default_private_visible = false);

    [[nodiscard]] SessionRegistry& sessions() {
        return sessions_;
    }

    [[nodiscard]] const store::CommentStore& store() const {
        return store_;
    }

    [[nodiscard]] anchor::CommentClassifier classifier_for(const std::string& rel) const;

    /// The stored set, or nullopt when there is none. A malformed set is
    /// logged and treated as missing.
    Result<std::optional<anchor::PersistedCommentSet>, VcmError> load(const std::string& rel) const;

    /// Reconciles the saved text with the store. Skipped while a toggle
    /// runs and for the echo of vcm's own last write.
    Result<SaveOutcome, VcmError> on_save(const std::string& rel, std::string_view text);

    /// Switches the document between Commented and Clean.
    Result<ToggleOutcome, VcmError> toggle(const std::string& rel, std::string_view text);

    /// Shows or hides private comments without touching the others.
    Result<ToggleOutcome, VcmError> set_private_visible(const std::string& rel,
                                                        std::string_view text, bool visible);

    /// Flags the comment on 0-based `line`.
    Result<bool, VcmError> mark(const std::string& rel, std::string_view text, size_t line,
                                anchor::RecordFlag flag, bool value);

    /// Deletes everything stored for the file and its session.
    Result<bool, VcmError> forget(const std::string& rel);

    Result<StatusReport, VcmError> status(const std::string& rel, std::string_view text);

private:
    store::CommentStore store_;
    anchor::CommentMarkerTable markers_;
    SessionRegistry sessions_;

    /// Fills in mode and private visibility the session does not know yet.
    void settle(DocumentSession& session, std::string_view text,
                const anchor::CommentClassifier& classifier,
                const std::optional<anchor::PersistedCommentSet>& set) const;

    Result<bool, VcmError> persist(anchor::PersistedCommentSet& set) const;
};

} // namespace vcm::session

#endif // VCM_SESSION_COMMENT_SERVICE_HPP
