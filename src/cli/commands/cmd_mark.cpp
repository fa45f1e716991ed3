#include "cli/commands/cmd_mark.hpp"

#include <charconv>
#include <iostream>
#include <system_error>

namespace vcm::cli {

int run_mark(const CliContext& ctx, const CommandArgs& args) {
    bool always = args.has("--always-visible");
    bool priv = args.has("--private");
    if (args.positional.size() < 2 || always == priv) {
        std::cerr << "Usage: vcm mark <file> <line> --always-visible|--private [--unset]\n";
        return 1;
    }

    const auto& file = args.positional[0];
    const auto& line_arg = args.positional[1];
    size_t line = 0;
    auto [ptr, ec] = std::from_chars(line_arg.data(), line_arg.data() + line_arg.size(), line);
    if (ec != std::errc{} || ptr != line_arg.data() + line_arg.size() || line == 0) {
        return fail("line must be a positive number, got '" + line_arg + "'");
    }

    auto text = read_source(file);
    if (is_err(text)) {
        return fail(unwrap_err(text).message);
    }

    auto flag = always ? anchor::RecordFlag::AlwaysVisible : anchor::RecordFlag::Private;
    bool value = !args.has("--unset");

    auto service = make_service(ctx);
    auto marked = service.mark(relative_to_root(ctx, file), unwrap(text), line - 1, flag, value);
    if (is_err(marked)) {
        return fail(unwrap_err(marked).message);
    }
    std::cout << file << ":" << line << ": " << (value ? "marked " : "unmarked ")
              << (always ? "always-visible" : "private") << "\n";
    return 0;
}

int run_status(const CliContext& ctx, const CommandArgs& args) {
    const auto& file = args.positional[0];
    auto text = read_source(file);
    if (is_err(text)) {
        return fail(unwrap_err(text).message);
    }

    auto service = make_service(ctx);
    auto status = service.status(relative_to_root(ctx, file), unwrap(text));
    if (is_err(status)) {
        return fail(unwrap_err(status).to_string());
    }

    const auto& report = unwrap(status);
    std::cout << file << "\n";
    std::cout << "  view:            " << anchor::mode_name(report.mode) << "\n";
    if (!report.stored) {
        std::cout << "  stored:          nothing\n";
        return 0;
    }
    std::cout << "  shared:          " << report.shared << "\n";
    std::cout << "  private:         " << report.private_records
              << (report.private_visible ? " (shown)" : " (hidden)") << "\n";
    std::cout << "  always visible:  " << report.always_visible << "\n";
    if (report.pending_clean > 0) {
        std::cout << "  typed in clean:  " << report.pending_clean << "\n";
    }
    return 0;
}

int run_forget(const CliContext& ctx, const CommandArgs& args) {
    const auto& file = args.positional[0];
    auto service = make_service(ctx);
    auto removed = service.forget(relative_to_root(ctx, file));
    if (is_err(removed)) {
        return fail(unwrap_err(removed).message);
    }
    std::cout << file << ": " << (unwrap(removed) ? "forgotten" : "nothing stored") << "\n";
    return 0;
}

} // namespace vcm::cli
