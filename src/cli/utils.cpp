#include "cli/utils.hpp"

#include "log/log.hpp"
#include "store/comment_store.hpp"

#include <iostream>

namespace vcm::cli {

std::string to_forward_slashes(const std::string& path) {
    std::string result = path;
    for (char& c : result) {
        if (c == '\\')
            c = '/';
    }
    return result;
}

session::CommentService make_service(const CliContext& ctx) {
    return session::CommentService(store::CommentStore(ctx.root, ctx.config.storage_dir),
                                   ctx.config.marker_table(), ctx.config.show_private);
}

std::string relative_to_root(const CliContext& ctx, const std::string& file) {
    store::CommentStore store(ctx.root, ctx.config.storage_dir);
    return to_forward_slashes(store.relative_path(file));
}

Result<std::string, store::StoreError> read_source(const std::string& path) {
    return store::read_file(path);
}

int emit(const std::string& text, const std::optional<std::string>& output) {
    if (!output) {
        std::cout << text;
        return 0;
    }
    auto written = store::write_file_atomic(*output, text);
    if (is_err(written)) {
        return fail(unwrap_err(written).message);
    }
    VCM_LOG_INFO("cli", "Wrote " << *output);
    return 0;
}

int fail(const std::string& message) {
    std::cerr << "error: " << message << "\n";
    return 1;
}

void print_usage() {
    std::cout << "vcm " << VERSION << " - keep comments out of the way without losing them\n\n";
    std::cout << "Usage: vcm <command> [options] <file>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  extract <file>                       Print the comments of a file as JSON\n";
    std::cout << "  strip <file> [--keep-private]        Print the clean view\n";
    std::cout << "  inject <file> [--include-private]    Print the commented view\n";
    std::cout << "  save <file>                          Store the comments of a file\n";
    std::cout << "  toggle <file>                        Switch between commented and clean\n";
    std::cout << "  private <file> show|hide             Show or hide private comments\n";
    std::cout << "  mark <file> <line> --always-visible|--private [--unset]\n";
    std::cout << "                                       Flag the comment on a line\n";
    std::cout << "  status <file>                        Show mode and stored counts\n";
    std::cout << "  forget <file>                        Delete stored comments of a file\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --root=<dir>         Workspace root (default: current directory)\n";
    std::cout << "  -o <path>            Write strip/inject output to a file\n";
    std::cout << "  --log-level=<level>  trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>  Per-module levels, e.g. store=debug,*=warn\n";
    std::cout << "  --log-file=<path>    Also log to a file\n";
    std::cout << "  -q, -v, -vv, -vvv    Quieter or more verbose logging\n";
    std::cout << "  --help, -h           Show this help\n";
    std::cout << "  --version, -V        Show version\n";
}

void print_version() {
    std::cout << "vcm " << VERSION << "\n";
}

} // namespace vcm::cli
