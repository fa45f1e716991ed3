//! # Document Sessions
//!
//! Per-document state kept between operations: the mode the document is
//! shown in, whether saves are currently ignored, whether private comments
//! are rendered, and a checksum of the last text vcm wrote itself.
//!
//! The engine functions in `anchor/` stay stateless; everything that has to
//! survive from one call to the next lives here.

#ifndef VCM_SESSION_SESSION_HPP
#define VCM_SESSION_SESSION_HPP

#include "anchor/reconciler.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace vcm::session {

struct DocumentSession {
    std::string path; ///< Workspace-relative

    /// Unset until the first operation detects or chooses it.
    std::optional<anchor::Mode> mode;

    /// Saves are skipped while set (a toggle is rewriting the document).
    bool sync_suppressed = false;

    bool private_visible = false;

    /// Private visibility was detected or chosen, not just defaulted.
    bool private_known = false;

    /// CRC32C of the last text produced by a toggle; a save of exactly that
    /// text is the echo of our own write.
    std::optional<uint32_t> last_injected;

    /// Serializes operations on this document.
    std::mutex lock;

    DocumentSession(std::string path, bool private_visible)
        : path(std::move(path)), private_visible(private_visible) {}
};

/// Sessions keyed by document path. Safe to call from several threads.
class SessionRegistry {
public:
    explicit SessionRegistry(bool default_private_visible = false)
        : default_private_visible_(default_private_visible) {}

    /// The session for `path`, created on first use.
    std::shared_ptr<DocumentSession> open(const std::string& path);

    /// The session for `path`, or null.
    [[nodiscard]] std::shared_ptr<DocumentSession> find(const std::string& path) const;

    /// Drops the session. Returns false if there was none.
    bool close(const std::string& path);

    [[nodiscard]] size_t size() const;

    [[nodiscard]] bool default_private_visible() const {
        return default_private_visible_;
    }

private:
    bool default_private_visible_;
    std::map<std::string, std::shared_ptr<DocumentSession>> sessions_;
    mutable std::mutex mutex_;
};

/// Sets `sync_suppressed` for its lifetime and restores the previous value.
class SyncSuppressor {
public:
    explicit SyncSuppressor(DocumentSession& session)
        : session_(session), previous_(session.sync_suppressed) {
        session_.sync_suppressed = true;
    }

    ~SyncSuppressor() {
        session_.sync_suppressed = previous_;
    }

    SyncSuppressor(const SyncSuppressor&) = delete;
    SyncSuppressor& operator=(const SyncSuppressor&) = delete;

private:
    DocumentSession& session_;
    bool previous_;
};

} // namespace vcm::session

#endif // VCM_SESSION_SESSION_HPP
