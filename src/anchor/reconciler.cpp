#include "anchor/reconciler.hpp"

#include "anchor/anchor_internal.hpp"
#include "anchor/extractor.hpp"
#include "anchor/lines.hpp"

#include <algorithm>

namespace vcm::anchor {

using detail::match_record;

namespace {

constexpr size_t MODE_SAMPLE_SIZE = 10;

struct PresenceProbe {
    size_t checks = 0;
    size_t failures = 0;
};

/// Looks for the first line of each sampled record where it was extracted.
PresenceProbe probe_presence(const std::vector<std::string>& lines,
                             const std::vector<CommentRecord>& records,
                             const detail::RecordFilter& sampled) {
    PresenceProbe probe;
    size_t taken = 0;
    for (const auto& record : records) {
        if (taken == MODE_SAMPLE_SIZE) {
            break;
        }
        if (!sampled(record) || !record.has_payload()) {
            continue;
        }
        ++taken;
        if (record.original_line >= lines.size()) {
            continue;
        }
        auto text = payload_probe(record.payload);
        if (text.empty()) {
            continue;
        }
        ++probe.checks;
        if (lines[record.original_line].find(text) == std::string::npos) {
            ++probe.failures;
        }
    }
    return probe;
}

PersistedCommentSet reconcile_commented(std::vector<CommentRecord> current,
                                        const PersistedCommentSet& persisted,
                                        const ReconcileOptions& options) {
    PersistedCommentSet result;
    result.file = persisted.file;
    result.last_modified = persisted.last_modified;

    const auto& previous = persisted.records;
    std::vector<bool> taken(previous.size(), false);
    auto renderable = [&](const CommentRecord& r) { return options.private_visible || !r.is_private; };

    for (auto& record : current) {
        if (auto index = match_record(record, previous, taken, renderable)) {
            taken[*index] = true;
            record.always_visible = previous[*index].always_visible;
            record.is_private = previous[*index].is_private;
        }
        result.records.push_back(std::move(record));
    }

    // Hidden private comments are absent from the text, not deleted
    if (!options.private_visible) {
        for (size_t i = 0; i < previous.size(); ++i) {
            if (!taken[i] && previous[i].is_private) {
                result.records.push_back(previous[i]);
            }
        }
        std::stable_sort(result.records.begin(), result.records.end(),
                         [](const CommentRecord& a, const CommentRecord& b) {
                             return a.original_line < b.original_line;
                         });
    }

    return result;
}

PersistedCommentSet reconcile_clean(std::vector<CommentRecord> current,
                                    const PersistedCommentSet& persisted,
                                    const ReconcileOptions& options) {
    PersistedCommentSet result = persisted;
    auto& records = result.records;
    const size_t existing = records.size();

    std::vector<bool> taken(existing, false);
    std::vector<bool> routed(existing, false);
    std::vector<CommentRecord> added;

    auto shown = [&](const CommentRecord& r) { return r.visible_when_clean(options.private_visible); };
    auto hidden_shared = [](const CommentRecord& r) { return !r.is_private && !r.always_visible; };

    for (auto& record : current) {
        // A comment the clean view renders is edited in place
        if (auto index = match_record(record, records, taken, shown)) {
            taken[*index] = true;
            auto& target = records[*index];
            target.payload = std::move(record.payload);
            target.anchor = record.anchor;
            target.context_prev = record.context_prev;
            target.context_next = record.context_next;
            target.leading_blank_count = record.leading_blank_count;
            target.trailing_blank_count = record.trailing_blank_count;
            target.original_line = record.original_line;
            continue;
        }

        if (auto index = match_record(record, records, taken, hidden_shared)) {
            taken[*index] = true;
            routed[*index] = true;
            records[*index].clean_mode_payload = std::move(record.payload);
            continue;
        }

        CommentRecord fresh = std::move(record);
        fresh.clean_mode_payload = std::move(fresh.payload);
        fresh.payload = empty_payload(fresh.clean_mode_payload->index() == 0 ? RecordKind::Block
                                                                           : RecordKind::Inline);
        fresh.always_visible = false;
        fresh.is_private = false;
        added.push_back(std::move(fresh));
    }

    std::vector<bool> keep(existing, true);
    for (size_t i = 0; i < existing; ++i) {
        auto& record = records[i];
        if (hidden_shared(record)) {
            if (!routed[i]) {
                record.clean_mode_payload.reset();
            }
        } else if (shown(record) && !taken[i]) {
            keep[i] = false; // deleted from the view that showed it
        }
        if (!record.has_payload() && !record.has_clean_mode_payload()) {
            keep[i] = false;
        }
    }

    std::vector<CommentRecord> merged;
    merged.reserve(existing + added.size());
    for (size_t i = 0; i < existing; ++i) {
        if (keep[i]) {
            merged.push_back(std::move(records[i]));
        }
    }
    for (auto& record : added) {
        merged.push_back(std::move(record));
    }
    records = std::move(merged);
    return result;
}

void merge_block(CommentRecord& record, const BlockPayload& clean) {
    auto& payload = std::get<BlockPayload>(record.payload);
    BlockPayload merged;
    for (const auto& line : clean) {
        bool present = !line.is_spacer() &&
                       std::any_of(payload.begin(), payload.end(), [&](const BlockLine& existing) {
                           return !existing.is_spacer() && trim(existing.raw()) == trim(line.raw());
                       });
        if (!present) {
            merged.push_back(line);
        }
    }
    // Spacers only separate comment lines
    while (!merged.empty() && merged.back().is_spacer()) {
        merged.pop_back();
    }
    if (payload.empty()) {
        while (!merged.empty() && merged.front().is_spacer()) {
            merged.erase(merged.begin());
        }
    }
    merged.insert(merged.end(), payload.begin(), payload.end());
    payload = std::move(merged);
}

void merge_inline(CommentRecord& record, const InlinePayload& clean) {
    auto& payload = std::get<InlinePayload>(record.payload);
    auto added = trim(clean);
    if (added.empty() || payload.find(added) != std::string::npos) {
        return;
    }
    payload = clean + payload;
}

} // namespace

const char* mode_name(Mode mode) {
    return mode == Mode::Commented ? "commented" : "clean";
}

PersistedCommentSet reconcile(std::string_view current_text, const CommentClassifier& classifier,
                              const PersistedCommentSet& persisted, Mode mode,
                              const ReconcileOptions& options) {
    auto current = extract(current_text, classifier);
    if (mode == Mode::Commented) {
        return reconcile_commented(std::move(current), persisted, options);
    }
    return reconcile_clean(std::move(current), persisted, options);
}

PersistedCommentSet reconcile(std::string_view current_text, std::string_view file_type,
                              const PersistedCommentSet& persisted, Mode mode) {
    return reconcile(current_text, CommentClassifier::for_file_type(file_type), persisted, mode);
}

Mode detect_mode(std::string_view current_text, const CommentClassifier& classifier,
                 const PersistedCommentSet* persisted) {
    if (persisted) {
        auto lines = split_lines(current_text);
        auto probe = probe_presence(lines, persisted->records, [](const CommentRecord& r) {
            return !r.is_private && !r.always_visible;
        });
        if (probe.checks > 0) {
            return probe.failures * 2 > probe.checks ? Mode::Clean : Mode::Commented;
        }
    }
    return classifier.contains_comments(current_text) ? Mode::Commented : Mode::Clean;
}

Mode detect_mode(std::string_view current_text, const PersistedCommentSet* persisted) {
    std::string file_type = persisted ? file_type_for_path(persisted->file) : std::string();
    return detect_mode(current_text, CommentClassifier::for_file_type(file_type), persisted);
}

std::optional<bool> detect_private_visible(std::string_view current_text,
                                           const PersistedCommentSet& persisted) {
    auto lines = split_lines(current_text);
    auto probe = probe_presence(lines, persisted.records,
                                [](const CommentRecord& r) { return r.is_private; });
    if (probe.checks == 0) {
        return std::nullopt;
    }
    return probe.failures * 2 <= probe.checks;
}

PersistedCommentSet merge_clean_mode_payloads(PersistedCommentSet set) {
    for (auto& record : set.records) {
        if (!record.clean_mode_payload) {
            continue;
        }
        if (record.clean_mode_payload->index() == record.payload.index()) {
            if (const auto* block = std::get_if<BlockPayload>(&*record.clean_mode_payload)) {
                merge_block(record, *block);
            } else {
                merge_inline(record, std::get<InlinePayload>(*record.clean_mode_payload));
            }
        }
        record.clean_mode_payload.reset();
    }
    return set;
}

Result<PersistedCommentSet, std::string>
mark_record(std::string_view current_text, const CommentClassifier& classifier,
            const PersistedCommentSet* persisted, const std::string& file, size_t line,
            RecordFlag flag, bool value) {
    auto current = extract(current_text, classifier);

    auto covers = [line](const CommentRecord& r) {
        if (r.is_inline()) {
            return r.original_line == line;
        }
        return std::any_of(r.block().begin(), r.block().end(),
                           [line](const BlockLine& l) { return l.original_line == line; });
    };
    auto target = std::find_if(current.begin(), current.end(), covers);
    if (target == current.end()) {
        return std::string("no comment on line ") + std::to_string(line + 1);
    }

    PersistedCommentSet result;
    if (persisted) {
        result = *persisted;
    } else {
        result.file = file;
    }

    std::optional<size_t> index;
    for (size_t i = 0; i < result.records.size(); ++i) {
        const auto& r = result.records[i];
        if (r.kind() == target->kind() && r.anchor == target->anchor &&
            r.original_line == target->original_line) {
            index = i;
            break;
        }
    }
    if (!index) {
        std::vector<bool> taken(result.records.size(), false);
        index = match_record(*target, result.records, taken);
    }
    if (!index) {
        result.records.push_back(std::move(*target));
        index = result.records.size() - 1;
    }

    auto& record = result.records[*index];
    if (flag == RecordFlag::AlwaysVisible) {
        record.always_visible = value;
    } else {
        record.is_private = value;
    }
    return result;
}

} // namespace vcm::anchor
