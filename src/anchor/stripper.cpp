#include "anchor/stripper.hpp"

#include "anchor/anchor_internal.hpp"
#include "anchor/extractor.hpp"
#include "anchor/lines.hpp"

namespace vcm::anchor {

namespace {

bool should_remove(const CommentRecord* stored, const StripOptions& options) {
    if (options.scope == StripScope::PrivateOnly) {
        return stored && stored->is_private;
    }
    if (!stored) {
        return true;
    }
    if (stored->is_private) {
        return !options.keep_private;
    }
    return !stored->always_visible;
}

} // namespace

std::string strip(std::string_view text, const CommentClassifier& classifier,
                  const std::vector<CommentRecord>& persisted, const StripOptions& options) {
    auto lines = split_lines(text);
    auto current = extract(text, classifier);

    std::vector<bool> taken(persisted.size(), false);
    std::vector<bool> drop(lines.size(), false);
    std::vector<std::optional<size_t>> cut(lines.size());

    for (const auto& record : current) {
        const CommentRecord* stored = nullptr;
        if (auto index = detail::match_record(record, persisted, taken)) {
            taken[*index] = true;
            stored = &persisted[*index];
        }
        if (!should_remove(stored, options)) {
            continue;
        }

        if (record.is_block()) {
            for (const auto& line : record.block()) {
                drop[line.original_line] = true;
            }
        } else {
            const auto& line = lines[record.original_line];
            cut[record.original_line] = line.size() - record.inline_text().size();
        }
    }

    std::vector<std::string> out;
    out.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        if (drop[i]) {
            continue;
        }
        if (cut[i]) {
            out.push_back(lines[i].substr(0, *cut[i]));
        } else {
            out.push_back(std::move(lines[i]));
        }
    }
    return join_lines(out);
}

std::string strip(std::string_view text, std::string_view file_type,
                  const std::vector<CommentRecord>& persisted, bool keep_private) {
    StripOptions options;
    options.keep_private = keep_private;
    return strip(text, CommentClassifier::for_file_type(file_type), persisted, options);
}

} // namespace vcm::anchor
