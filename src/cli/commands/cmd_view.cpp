//! # View Commands
//!
//! ```bash
//! vcm extract src/app.py                  # JSON of the comments in the file
//! vcm strip src/app.py -o /tmp/clean.py   # clean view into a file
//! vcm inject src/app.py --include-private # stored comments rendered back
//! ```
//!
//! `strip` and `inject` use the stored set when there is one, so
//! always-visible and private comments are treated the way `toggle` treats
//! them.

#include "cli/commands/cmd_view.hpp"

#include "anchor/extractor.hpp"
#include "anchor/injector.hpp"
#include "anchor/stripper.hpp"
#include "log/log.hpp"
#include "store/record_json.hpp"

#include <iostream>

namespace vcm::cli {

namespace {

struct LoadedFile {
    std::string rel;
    std::string text;
    std::vector<anchor::CommentRecord> records; ///< Stored records, if any
};

Result<LoadedFile, std::string> load_file(const CliContext& ctx, const CommandArgs& args,
                                          const session::CommentService& service) {
    LoadedFile loaded;
    const auto& file = args.positional[0];
    auto text = read_source(file);
    if (is_err(text)) {
        return unwrap_err(text).message;
    }
    loaded.text = std::move(unwrap(text));
    loaded.rel = relative_to_root(ctx, file);

    auto set = service.load(loaded.rel);
    if (is_err(set)) {
        return unwrap_err(set).to_string();
    }
    if (auto& stored = unwrap(set)) {
        loaded.records = std::move(stored->records);
    }
    return loaded;
}

} // namespace

int run_extract(const CliContext& ctx, const CommandArgs& args) {
    const auto& file = args.positional[0];
    auto text = read_source(file);
    if (is_err(text)) {
        return fail(unwrap_err(text).message);
    }

    anchor::PersistedCommentSet set;
    set.file = relative_to_root(ctx, file);
    auto classifier = anchor::CommentClassifier::for_file_type(
        anchor::file_type_for_path(set.file), ctx.config.marker_table());
    set.records = anchor::extract(unwrap(text), classifier);

    VCM_LOG_DEBUG("cli", "Extracted " << set.records.size() << " comments from " << file);
    std::cout << store::set_to_json(set).to_string_pretty() << "\n";
    return 0;
}

int run_strip(const CliContext& ctx, const CommandArgs& args) {
    auto service = make_service(ctx);
    auto loaded = load_file(ctx, args, service);
    if (is_err(loaded)) {
        return fail(unwrap_err(loaded));
    }
    auto& file = unwrap(loaded);

    anchor::StripOptions options;
    options.keep_private = args.has("--keep-private");
    auto clean =
        anchor::strip(file.text, service.classifier_for(file.rel), file.records, options);
    return emit(clean, args.output);
}

int run_inject(const CliContext& ctx, const CommandArgs& args) {
    auto service = make_service(ctx);
    auto loaded = load_file(ctx, args, service);
    if (is_err(loaded)) {
        return fail(unwrap_err(loaded));
    }
    auto& file = unwrap(loaded);
    if (file.records.empty()) {
        VCM_LOG_WARN("cli", "No stored comments for " << file.rel);
    }

    auto classifier = service.classifier_for(file.rel);
    anchor::InjectOptions options;
    options.include_private = args.has("--include-private");
    options.classifier = &classifier;
    auto result = anchor::inject(file.text, file.records, options);
    if (!result.orphans.empty()) {
        std::cerr << "warning: " << result.orphans.size()
                  << " comment(s) could not be placed\n";
    }
    return emit(result.text, args.output);
}

} // namespace vcm::cli
