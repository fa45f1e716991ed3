#include "session/session.hpp"

#include "session/session_error.hpp"

namespace vcm::session {

const char* error_kind_name(VcmErrorKind kind) {
    switch (kind) {
    case VcmErrorKind::NoPersistedSet:
        return "no persisted set";
    case VcmErrorKind::MalformedPersistedSet:
        return "malformed persisted set";
    case VcmErrorKind::AnchorNotFound:
        return "anchor not found";
    case VcmErrorKind::CommentNotFound:
        return "comment not found";
    case VcmErrorKind::IoError:
        return "I/O error";
    }
    return "unknown";
}

// ============================================================================
// SessionRegistry
// ============================================================================

std::shared_ptr<DocumentSession> SessionRegistry::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(path);
    if (it != sessions_.end()) {
        return it->second;
    }
    auto session = std::make_shared<DocumentSession>(path, default_private_visible_);
    sessions_.emplace(path, session);
    return session;
}

std::shared_ptr<DocumentSession> SessionRegistry::find(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(path);
    return it != sessions_.end() ? it->second : nullptr;
}

bool SessionRegistry::close(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(path) > 0;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace vcm::session
