#include "anchor/extractor.hpp"

#include "anchor/anchor_internal.hpp"
#include "anchor/lines.hpp"

namespace vcm::anchor {

using detail::blank_run_above;
using detail::LineScan;

namespace {

/// The next non-blank line after `i` is a whole-line comment.
bool comment_follows(const std::vector<std::string>& lines, size_t i,
                     const CommentClassifier& classifier) {
    for (size_t j = i + 1; j < lines.size(); ++j) {
        if (!is_blank(lines[j])) {
            return classifier.is_pure_comment(lines[j]);
        }
    }
    return false;
}

CommentRecord make_block(BlockPayload lines_in_block, const std::vector<std::string>& lines) {
    CommentRecord record;
    record.original_line = lines_in_block.front().original_line;
    record.leading_blank_count = blank_run_above(lines, record.original_line);
    record.payload = std::move(lines_in_block);
    return record;
}

} // namespace

std::vector<CommentRecord> extract(std::string_view text, const CommentClassifier& classifier) {
    auto lines = split_lines(text);
    LineScan scan(lines, &classifier);

    std::vector<CommentRecord> records;
    BlockPayload buffer;

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];

        if (is_blank(line)) {
            if (!buffer.empty() && comment_follows(lines, i, classifier)) {
                buffer.push_back(BlockLine{"", "", line, i});
            }
            continue;
        }

        if (classifier.is_pure_comment(line)) {
            auto parts = classifier.split_comment_line(line);
            buffer.push_back(
                BlockLine{std::move(parts.indent), std::move(parts.marker), std::move(parts.text), i});
            continue;
        }

        if (!buffer.empty()) {
            CommentRecord block = make_block(std::move(buffer), lines);
            buffer.clear();
            block.anchor = scan.code_fingerprint(i);
            block.context_prev = scan.prev_context(i);
            block.context_next = scan.next_context(i);
            block.trailing_blank_count = blank_run_above(lines, i);
            records.push_back(std::move(block));
        }

        if (auto found = classifier.find_inline_comment(line)) {
            CommentRecord record;
            record.anchor = fingerprint(std::string_view(line).substr(0, found->start));
            record.context_prev = scan.prev_context(i);
            record.context_next = scan.next_context(i);
            record.payload = InlinePayload(line.substr(found->start));
            record.original_line = i;
            records.push_back(std::move(record));
        }
    }

    if (!buffer.empty()) {
        // Nothing below: attach to the top of the file
        CommentRecord block = make_block(std::move(buffer), lines);
        if (auto first = scan.first_code()) {
            block.anchor = scan.code_fingerprint(*first);
            block.context_next = scan.next_context(*first);
        }
        records.push_back(std::move(block));
    }

    return records;
}

std::vector<CommentRecord> extract(std::string_view text, std::string_view file_type) {
    return extract(text, CommentClassifier::for_file_type(file_type));
}

} // namespace vcm::anchor
