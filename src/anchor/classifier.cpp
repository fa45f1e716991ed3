#include "anchor/classifier.hpp"

#include "anchor/lines.hpp"

namespace vcm::anchor {

CommentClassifier::CommentClassifier(MarkerList markers) : markers_(std::move(markers)) {}

CommentClassifier CommentClassifier::for_file_type(std::string_view file_type,
                                                   const CommentMarkerTable& table) {
    return CommentClassifier(table.markers_for(file_type));
}

const std::string* CommentClassifier::marker_at(std::string_view line, size_t pos) const {
    const std::string* best = nullptr;
    for (const auto& marker : markers_) {
        if (marker.empty() || line.size() - pos < marker.size()) {
            continue;
        }
        if (line.compare(pos, marker.size(), marker) == 0 &&
            (!best || marker.size() > best->size())) {
            best = &marker;
        }
    }
    return best;
}

bool CommentClassifier::is_pure_comment(std::string_view line) const {
    auto trimmed = trim_start(line);
    return !trimmed.empty() && marker_at(trimmed, 0) != nullptr;
}

bool CommentClassifier::is_code(std::string_view line) const {
    return !is_blank(line) && !is_pure_comment(line);
}

std::optional<InlineComment> CommentClassifier::find_inline_comment(std::string_view line) const {
    char quote = 0;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (quote != 0) {
            if (c == '\\') {
                ++i; // escaped character never closes the literal
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }

        if (c == '"' || c == '\'' || c == '`') {
            quote = c;
            continue;
        }

        if (i == 0 || !is_space(line[i - 1]) || marker_at(line, i) == nullptr) {
            continue;
        }

        size_t start = i;
        while (start > 0 && is_space(line[start - 1])) {
            --start;
        }
        if (start == 0) {
            return std::nullopt; // whole-line comment
        }
        return InlineComment{start, i};
    }

    return std::nullopt;
}

std::string_view CommentClassifier::code_portion(std::string_view line) const {
    if (auto found = find_inline_comment(line)) {
        return line.substr(0, found->start);
    }
    return line;
}

CommentLineParts CommentClassifier::split_comment_line(std::string_view line) const {
    size_t indent = line.size() - trim_start(line).size();
    CommentLineParts parts;
    parts.indent = std::string(line.substr(0, indent));
    if (const auto* marker = marker_at(line, indent)) {
        parts.marker = *marker;
        parts.text = std::string(line.substr(indent + marker->size()));
    } else {
        parts.text = std::string(line.substr(indent));
    }
    return parts;
}

bool CommentClassifier::contains_comments(std::string_view text) const {
    for (const auto& line : split_lines(text)) {
        if (is_pure_comment(line) || find_inline_comment(line)) {
            return true;
        }
    }
    return false;
}

} // namespace vcm::anchor
