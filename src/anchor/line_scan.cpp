#include "anchor/anchor_internal.hpp"
#include "anchor/lines.hpp"

namespace vcm::anchor::detail {

static constexpr size_t NONE = static_cast<size_t>(-1);

LineScan::LineScan(const std::vector<std::string>& lines, const CommentClassifier* classifier)
    : code_(lines.size(), false), fingerprints_(lines.size()), prev_(lines.size(), NONE),
      next_(lines.size(), NONE) {
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (classifier) {
            code_[i] = classifier->is_code(line);
            if (code_[i]) {
                fingerprints_[i] = fingerprint(classifier->code_portion(line));
            }
        } else {
            code_[i] = !is_blank(line);
            if (code_[i]) {
                fingerprints_[i] = fingerprint(line);
            }
        }
    }

    size_t last = NONE;
    for (size_t i = 0; i < lines.size(); ++i) {
        prev_[i] = last;
        if (code_[i]) {
            last = i;
        }
    }
    last = NONE;
    for (size_t i = lines.size(); i-- > 0;) {
        next_[i] = last;
        if (code_[i]) {
            last = i;
        }
    }
}

std::optional<size_t> LineScan::prev_code(size_t i) const {
    return prev_[i] == NONE ? std::nullopt : std::optional<size_t>(prev_[i]);
}

std::optional<size_t> LineScan::next_code(size_t i) const {
    return next_[i] == NONE ? std::nullopt : std::optional<size_t>(next_[i]);
}

std::optional<size_t> LineScan::first_code() const {
    if (code_.empty()) {
        return std::nullopt;
    }
    if (code_[0]) {
        return 0;
    }
    return next_code(0);
}

std::optional<LineFingerprint> LineScan::prev_context(size_t i) const {
    if (auto p = prev_code(i)) {
        return fingerprints_[*p];
    }
    return std::nullopt;
}

std::optional<LineFingerprint> LineScan::next_context(size_t i) const {
    if (auto n = next_code(i)) {
        return fingerprints_[*n];
    }
    return std::nullopt;
}

int LineScan::context_score(size_t i, const std::optional<LineFingerprint>& prev,
                            const std::optional<LineFingerprint>& next) const {
    int score = 0;
    if (prev && prev_context(i) == prev) {
        score += CONTEXT_MATCH_SCORE;
    }
    if (next && next_context(i) == next) {
        score += CONTEXT_MATCH_SCORE;
    }
    return score;
}

size_t blank_run_above(const std::vector<std::string>& lines, size_t i) {
    size_t count = 0;
    while (i > count && is_blank(lines[i - count - 1])) {
        ++count;
    }
    return count;
}

} // namespace vcm::anchor::detail
