#include "anchor/injector.hpp"

#include "anchor/anchor_internal.hpp"
#include "anchor/lines.hpp"

#include <algorithm>
#include <unordered_map>

namespace vcm::anchor {

using detail::LineScan;

namespace {

using AnchorIndex = std::unordered_map<LineFingerprint, std::vector<size_t>, LineFingerprintHash>;

bool should_render(const CommentRecord& record, bool include_private) {
    if (record.is_private) {
        if (!include_private) {
            return false;
        }
    } else if (record.always_visible) {
        return false; // never stripped, already in the text
    }
    return record.has_payload() || record.has_clean_mode_payload();
}

class AnchorResolver {
public:
    AnchorResolver(const LineScan& scan, size_t line_count) : scan_(scan), used_(line_count) {
        for (size_t i = 0; i < line_count; ++i) {
            if (scan.is_code(i)) {
                index_[scan.code_fingerprint(i)].push_back(i);
            }
        }
    }

    /// Target line of `record`, claiming it for blocks.
    std::optional<size_t> resolve(const CommentRecord& record) {
        auto it = index_.find(record.anchor);
        if (it == index_.end()) {
            // Comments of a file without code hang off the top line
            if (record.anchor.is_zero() && record.is_block()) {
                return 0;
            }
            return std::nullopt;
        }

        const auto& candidates = it->second;
        const bool claims = record.is_block();

        std::vector<size_t> open;
        for (size_t c : candidates) {
            if (!claims || !used_[c]) {
                open.push_back(c);
            }
        }

        size_t chosen = candidates.front();
        if (open.size() == 1) {
            chosen = open.front();
        } else if (!open.empty()) {
            int best = -1;
            for (size_t c : open) {
                int score = scan_.context_score(c, record.context_prev, record.context_next);
                if (score > best) {
                    best = score;
                    chosen = c;
                }
            }
        }

        if (claims) {
            used_[chosen] = true;
        }
        return chosen;
    }

private:
    const LineScan& scan_;
    AnchorIndex index_;
    std::vector<bool> used_;
};

void append_block_lines(std::vector<std::string>& out, const Payload& payload) {
    if (const auto* block = std::get_if<BlockPayload>(&payload)) {
        for (const auto& line : *block) {
            out.push_back(line.raw());
        }
    }
}

/// Emits a block above the line being built. The blank lines already at the
/// end of the output that belong to the block's trailing spacing move below
/// the comment.
void emit_block(std::vector<std::string>& out, const CommentRecord& record) {
    size_t tail = 0;
    while (tail < out.size() && is_blank(out[out.size() - 1 - tail])) {
        ++tail;
    }
    size_t take = std::min(record.trailing_blank_count, tail);
    std::vector<std::string> held(out.end() - static_cast<std::ptrdiff_t>(take), out.end());
    out.resize(out.size() - take);

    if (record.clean_mode_payload) {
        append_block_lines(out, *record.clean_mode_payload);
    }
    append_block_lines(out, record.payload);

    out.insert(out.end(), held.begin(), held.end());
}

void append_inline(std::string& line, const CommentRecord& record) {
    if (record.clean_mode_payload) {
        if (const auto* text = std::get_if<InlinePayload>(&*record.clean_mode_payload)) {
            line += *text;
        }
    }
    if (const auto* text = std::get_if<InlinePayload>(&record.payload)) {
        line += *text;
    }
}

} // namespace

InjectResult inject(std::string_view clean_text, const std::vector<CommentRecord>& records,
                    const InjectOptions& options) {
    auto lines = split_lines(clean_text);
    LineScan scan(lines, options.classifier);
    AnchorResolver resolver(scan, lines.size());

    std::vector<std::vector<const CommentRecord*>> blocks_at(lines.size());
    std::vector<std::vector<const CommentRecord*>> inlines_at(lines.size());

    // Duplicate anchors are claimed in document order
    std::vector<const CommentRecord*> ordered;
    ordered.reserve(records.size());
    for (const auto& record : records) {
        if (should_render(record, options.include_private)) {
            ordered.push_back(&record);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const CommentRecord* a, const CommentRecord* b) {
                         return a->original_line < b->original_line;
                     });

    InjectResult result;
    for (const auto* record : ordered) {
        auto target = resolver.resolve(*record);
        if (!target) {
            result.orphans.push_back(*record);
            continue;
        }
        (record->is_block() ? blocks_at : inlines_at)[*target].push_back(record);
        ++result.placed;
    }

    std::vector<std::string> out;
    out.reserve(lines.size() + records.size() * 2);
    for (size_t i = 0; i < lines.size(); ++i) {
        for (const auto* block : blocks_at[i]) {
            emit_block(out, *block);
        }
        std::string line = std::move(lines[i]);
        for (const auto* record : inlines_at[i]) {
            append_inline(line, *record);
        }
        out.push_back(std::move(line));
    }

    result.text = join_lines(out);
    return result;
}

std::string inject(std::string_view clean_text, const std::vector<CommentRecord>& records,
                   bool include_private) {
    InjectOptions options;
    options.include_private = include_private;
    return inject(clean_text, records, options).text;
}

} // namespace vcm::anchor
