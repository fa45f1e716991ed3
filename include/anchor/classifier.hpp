//! # Comment Classifier
//!
//! Decides, line by line, whether text is a whole-line comment, code with a
//! trailing comment, or plain code. Inline detection scans left to right
//! and ignores markers inside single, double or backtick quoted literals.
//! Outside literals a marker only starts a comment when whitespace precedes
//! it, so `a//b` or `x--` in an expression stay code.
//!
//! ```cpp
//! auto cls = CommentClassifier::for_file_type("py");
//! cls.is_pure_comment("    # note");               // true
//! cls.find_inline_comment("x = 1  # one")->start;  // 5
//! cls.find_inline_comment("s = 'a # b'");          // nullopt
//! ```

#ifndef VCM_ANCHOR_CLASSIFIER_HPP
#define VCM_ANCHOR_CLASSIFIER_HPP

#include "anchor/markers.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace vcm::anchor {

/// Location of a trailing comment inside a code line.
struct InlineComment {
    size_t start;  ///< First byte of the whitespace gap before the marker
    size_t marker; ///< First byte of the marker
};

/// A whole-line comment cut into its verbatim pieces.
struct CommentLineParts {
    std::string indent;
    std::string marker;
    std::string text;
};

class CommentClassifier {
public:
    explicit CommentClassifier(MarkerList markers);

    static CommentClassifier
    for_file_type(std::string_view file_type,
                  const CommentMarkerTable& table = CommentMarkerTable::builtin());

    [[nodiscard]] const MarkerList& markers() const {
        return markers_;
    }

    /// The trimmed line starts with a marker.
    [[nodiscard]] bool is_pure_comment(std::string_view line) const;

    /// Non-blank and not a whole-line comment.
    [[nodiscard]] bool is_code(std::string_view line) const;

    /// Trailing comment on a code line, if any. Whole-line comments and
    /// markers with nothing but whitespace before them return nullopt.
    [[nodiscard]] std::optional<InlineComment> find_inline_comment(std::string_view line) const;

    /// The line up to its inline comment gap, or the whole line.
    [[nodiscard]] std::string_view code_portion(std::string_view line) const;

    /// Splits a line for which `is_pure_comment` holds.
    [[nodiscard]] CommentLineParts split_comment_line(std::string_view line) const;

    /// Any line of `text` is a whole-line comment or carries an inline one.
    [[nodiscard]] bool contains_comments(std::string_view text) const;

private:
    MarkerList markers_;

    /// Longest marker starting at `pos`, or null.
    const std::string* marker_at(std::string_view line, size_t pos) const;
};

} // namespace vcm::anchor

#endif // VCM_ANCHOR_CLASSIFIER_HPP
