#include "anchor/record.hpp"

#include "anchor/lines.hpp"

#include <algorithm>
#include <iterator>

namespace vcm::anchor {

const char* kind_name(RecordKind kind) {
    return kind == RecordKind::Block ? "block" : "inline";
}

std::optional<RecordKind> parse_kind(std::string_view name) {
    if (name == "block") {
        return RecordKind::Block;
    }
    if (name == "inline") {
        return RecordKind::Inline;
    }
    return std::nullopt;
}

Payload empty_payload(RecordKind kind) {
    if (kind == RecordKind::Block) {
        return BlockPayload{};
    }
    return InlinePayload{};
}

bool payload_empty(const Payload& payload) {
    if (const auto* block = std::get_if<BlockPayload>(&payload)) {
        return block->empty();
    }
    return std::get<InlinePayload>(payload).empty();
}

std::string payload_text(const Payload& payload) {
    if (const auto* text = std::get_if<InlinePayload>(&payload)) {
        return *text;
    }
    std::string out;
    for (const auto& line : std::get<BlockPayload>(payload)) {
        if (!out.empty()) {
            out += '\n';
        }
        out += line.raw();
    }
    return out;
}

std::string payload_probe(const Payload& payload) {
    if (const auto* text = std::get_if<InlinePayload>(&payload)) {
        return std::string(trim(*text));
    }
    for (const auto& line : std::get<BlockPayload>(payload)) {
        if (!line.is_spacer()) {
            return std::string(trim(line.raw()));
        }
    }
    return {};
}

bool CommentRecord::has_payload() const {
    return !payload_empty(payload);
}

bool CommentRecord::has_clean_mode_payload() const {
    return clean_mode_payload.has_value() && !payload_empty(*clean_mode_payload);
}

std::vector<CommentRecord> PersistedCommentSet::shared_records() const {
    std::vector<CommentRecord> out;
    std::copy_if(records.begin(), records.end(), std::back_inserter(out),
                 [](const CommentRecord& r) { return !r.is_private; });
    return out;
}

std::vector<CommentRecord> PersistedCommentSet::private_records() const {
    std::vector<CommentRecord> out;
    std::copy_if(records.begin(), records.end(), std::back_inserter(out),
                 [](const CommentRecord& r) { return r.is_private; });
    return out;
}

size_t PersistedCommentSet::private_count() const {
    return static_cast<size_t>(std::count_if(records.begin(), records.end(),
                                              [](const CommentRecord& r) { return r.is_private; }));
}

} // namespace vcm::anchor
