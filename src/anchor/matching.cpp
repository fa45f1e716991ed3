#include "anchor/anchor_internal.hpp"

namespace vcm::anchor::detail {

namespace {

bool same_context(const std::optional<LineFingerprint>& a, const std::optional<LineFingerprint>& b) {
    return a.has_value() && a == b;
}

} // namespace

bool same_text(const CommentRecord& probe, const CommentRecord& stored) {
    // Line numbers differ between views, so compare the verbatim text only
    auto text = payload_text(probe.payload);
    if (text == payload_text(stored.payload)) {
        return true;
    }
    return stored.clean_mode_payload && text == payload_text(*stored.clean_mode_payload);
}

std::optional<size_t> match_record(const CommentRecord& probe,
                                   const std::vector<CommentRecord>& pool,
                                   const std::vector<bool>& taken, const RecordFilter& eligible) {
    auto open = [&](size_t i) {
        return !taken[i] && pool[i].kind() == probe.kind() && (!eligible || eligible(pool[i]));
    };

    std::optional<size_t> best;
    int best_score = -1;
    for (size_t i = 0; i < pool.size(); ++i) {
        if (!open(i) || pool[i].anchor != probe.anchor) {
            continue;
        }
        const auto& candidate = pool[i];
        int score = 0;
        if (same_context(probe.context_prev, candidate.context_prev)) {
            score += CONTEXT_MATCH_SCORE;
        }
        if (same_context(probe.context_next, candidate.context_next)) {
            score += CONTEXT_MATCH_SCORE;
        }
        if (same_text(probe, candidate)) {
            score += 2;
        }
        if (probe.original_line == candidate.original_line) {
            score += 1;
        }
        if (score > best_score) {
            best_score = score;
            best = i;
        }
    }
    if (best) {
        return best;
    }

    for (size_t i = 0; i < pool.size(); ++i) {
        if (open(i) && same_text(probe, pool[i])) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace vcm::anchor::detail
