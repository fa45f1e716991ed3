//! # Sync Commands
//!
//! ```bash
//! vcm save src/app.py           # after editing, in either view
//! vcm toggle src/app.py         # commented <-> clean, file rewritten
//! vcm private src/app.py hide   # private comments out of the file
//! ```
//!
//! Each invocation is a fresh session: the view a file is in is detected
//! from its text and the stored set.

#include "cli/commands/cmd_sync.hpp"

#include "log/log.hpp"
#include "store/comment_store.hpp"

#include <iostream>

namespace vcm::cli {

namespace {

/// Writes a rewritten document back and reports what happened.
int write_back(const std::string& file, const session::ToggleOutcome& outcome,
               const std::string& what) {
    auto written = store::write_file_atomic(file, outcome.text);
    if (is_err(written)) {
        return fail(unwrap_err(written).message);
    }
    std::cout << file << ": " << what << "\n";
    if (!outcome.orphans.empty()) {
        std::cerr << "warning: " << outcome.orphans.size()
                  << " comment(s) could not be re-anchored and stay stored\n";
    }
    return 0;
}

} // namespace

int run_save(const CliContext& ctx, const CommandArgs& args) {
    const auto& file = args.positional[0];
    auto text = read_source(file);
    if (is_err(text)) {
        return fail(unwrap_err(text).message);
    }

    auto service = make_service(ctx);
    auto saved = service.on_save(relative_to_root(ctx, file), unwrap(text));
    if (is_err(saved)) {
        return fail(unwrap_err(saved).to_string());
    }

    const auto& outcome = unwrap(saved);
    if (outcome.persisted) {
        std::cout << file << ": stored " << outcome.records << " comment(s)\n";
    } else {
        std::cout << file << ": up to date\n";
    }
    return 0;
}

int run_toggle(const CliContext& ctx, const CommandArgs& args) {
    const auto& file = args.positional[0];
    auto text = read_source(file);
    if (is_err(text)) {
        return fail(unwrap_err(text).message);
    }

    auto service = make_service(ctx);
    auto toggled = service.toggle(relative_to_root(ctx, file), unwrap(text));
    if (is_err(toggled)) {
        return fail(unwrap_err(toggled).message);
    }

    const auto& outcome = unwrap(toggled);
    return write_back(file, outcome, std::string("now ") + anchor::mode_name(outcome.mode));
}

int run_private(const CliContext& ctx, const CommandArgs& args) {
    if (args.positional.size() < 2 ||
        (args.positional[1] != "show" && args.positional[1] != "hide")) {
        std::cerr << "Usage: vcm private <file> show|hide\n";
        return 1;
    }
    const auto& file = args.positional[0];
    bool visible = args.positional[1] == "show";

    auto text = read_source(file);
    if (is_err(text)) {
        return fail(unwrap_err(text).message);
    }

    auto service = make_service(ctx);
    auto changed = service.set_private_visible(relative_to_root(ctx, file), unwrap(text), visible);
    if (is_err(changed)) {
        return fail(unwrap_err(changed).to_string());
    }
    return write_back(file, unwrap(changed),
                      visible ? "private comments shown" : "private comments hidden");
}

} // namespace vcm::cli
