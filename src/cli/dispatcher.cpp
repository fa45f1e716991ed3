//! # CLI Command Dispatcher
//!
//! Parses the command line and routes to the command handlers.
//!
//! ```text
//! vcm_main()
//!   ├─ help, --help, -h       → print_usage()
//!   ├─ version, --version, -V → print_version()
//!   ├─ extract                → run_extract()
//!   ├─ strip                  → run_strip()
//!   ├─ inject                 → run_inject()
//!   ├─ save                   → run_save()
//!   ├─ toggle                 → run_toggle()
//!   ├─ private                → run_private()
//!   ├─ mark                   → run_mark()
//!   ├─ status                 → run_status()
//!   └─ forget                 → run_forget()
//! ```
//!
//! Logging is configured before anything else runs; `log-level` from
//! `vcm.toml` applies only when no logging option was given.

#include "cli/driver.hpp"

#include "cli/commands/cmd_mark.hpp"
#include "cli/commands/cmd_sync.hpp"
#include "cli/commands/cmd_view.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>

namespace vcm::cli {

namespace {

/// Splits the arguments after the command. Logging options and `--root=`
/// are consumed elsewhere and skipped here.
bool is_global_option(const std::string& arg) {
    return log::is_log_option(arg) || arg.rfind("--root=", 0) == 0;
}

/// Index of the command word, or `argc` when there is none.
int find_command(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (!is_global_option(argv[i])) {
            return i;
        }
    }
    return argc;
}

CommandArgs parse_command_args(int argc, char* argv[], int command_index) {
    CommandArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i == command_index || is_global_option(arg)) {
            continue;
        }
        if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                args.output = argv[++i];
            }
            continue;
        }
        if (arg.rfind("--output=", 0) == 0) {
            args.output = arg.substr(9);
            continue;
        }
        if (arg.size() > 2 && arg.rfind("--", 0) == 0) {
            args.flags.insert(arg);
            continue;
        }
        args.positional.push_back(std::move(arg));
    }
    return args;
}

fs::path parse_root(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--root=", 0) == 0) {
            return fs::path(arg.substr(7));
        }
    }
    return fs::current_path();
}

} // namespace

int vcm_main(int argc, char* argv[]) {
    auto log_config = log::parse_log_options(argc, argv);
    log::Logger::init(log_config);

    int command_index = find_command(argc, argv);
    if (command_index == argc) {
        print_usage();
        return 0;
    }

    std::string command = argv[command_index];

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "version" || command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    CliContext ctx;
    ctx.root = parse_root(argc, argv);
    ctx.config = config::load_config(ctx.root);
    if (ctx.config.log_level && !log_config.level_from_cli) {
        log::Logger::instance().set_level(*ctx.config.log_level);
    }

    auto args = parse_command_args(argc, argv, command_index);
    auto needs_file = [&](const char* usage) {
        if (args.positional.empty()) {
            std::cerr << "Usage: vcm " << usage << "\n";
            return false;
        }
        return true;
    };

    VCM_LOG_DEBUG("cli", "Command '" << command << "' in " << ctx.root.string());

    if (command == "extract") {
        if (!needs_file("extract <file>"))
            return 1;
        return run_extract(ctx, args);
    }

    if (command == "strip") {
        if (!needs_file("strip <file> [--keep-private] [-o <path>]"))
            return 1;
        return run_strip(ctx, args);
    }

    if (command == "inject") {
        if (!needs_file("inject <file> [--include-private] [-o <path>]"))
            return 1;
        return run_inject(ctx, args);
    }

    if (command == "save") {
        if (!needs_file("save <file>"))
            return 1;
        return run_save(ctx, args);
    }

    if (command == "toggle") {
        if (!needs_file("toggle <file>"))
            return 1;
        return run_toggle(ctx, args);
    }

    if (command == "private") {
        return run_private(ctx, args);
    }

    if (command == "mark") {
        return run_mark(ctx, args);
    }

    if (command == "status") {
        if (!needs_file("status <file>"))
            return 1;
        return run_status(ctx, args);
    }

    if (command == "forget") {
        if (!needs_file("forget <file>"))
            return 1;
        return run_forget(ctx, args);
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'vcm --help' for usage.\n";
    return 1;
}

} // namespace vcm::cli
