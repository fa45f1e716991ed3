//! # Session Errors
//!
//! Failures reported by `CommentService` to an editor adapter or the CLI.

#ifndef VCM_SESSION_SESSION_ERROR_HPP
#define VCM_SESSION_SESSION_ERROR_HPP

#include <cstdint>
#include <string>

namespace vcm::session {

enum class VcmErrorKind : uint8_t {
    NoPersistedSet,        ///< Nothing stored and nothing to extract
    MalformedPersistedSet, ///< Stored file does not parse
    AnchorNotFound,        ///< Records could not be placed
    CommentNotFound,       ///< `mark` targeted a line without a comment
    IoError                ///< Store or source file access failed
};

[[nodiscard]] const char* error_kind_name(VcmErrorKind kind);

struct VcmError {
    VcmErrorKind kind;
    std::string message;

    static VcmError make(VcmErrorKind kind, std::string message) {
        return VcmError{kind, std::move(message)};
    }

    [[nodiscard]] std::string to_string() const {
        return std::string(error_kind_name(kind)) + ": " + message;
    }
};

} // namespace vcm::session

#endif // VCM_SESSION_SESSION_ERROR_HPP
