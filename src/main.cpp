// wharf: find or create a local checkout of a git remote at a revision.
//
//     wharf resolve git@github.com:acme/widgets.git?main
//     wharf scan ~/code
//     wharf lookup https://github.com/acme/widgets
//     wharf index
//     wharf canonical git@github.com:Acme/widgets.git
//
// Decisions are logged on stderr; results go to stdout.

#include <wharf/config.hpp>
#include <wharf/crawler.hpp>
#include <wharf/git.hpp>
#include <wharf/log.hpp>
#include <wharf/remote.hpp>
#include <wharf/remote_index.hpp>
#include <wharf/repository.hpp>
#include <wharf/resolver.hpp>
#include <wharf/result.hpp>
#include <wharf/terminal_prompter.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace wharf;

static const char* kUsage =
    "usage: wharf [--config FILE] [-v] <command> [args]\n"
    "\n"
    "commands:\n"
    "  resolve <url[?rev]> [--root DIR]... [--open DIR]...\n"
    "                      print a local checkout of url at rev, cloning if needed\n"
    "  scan [DIR]          rebuild the remote index from repositories under DIR\n"
    "  lookup <url>        print the indexed checkout of url\n"
    "  index               list the remote index\n"
    "  canonical <url>     print the canonical form of url\n";

struct Args {
    std::string config_file;
    bool verbose = false;
    std::string command;
    std::vector<std::string> positional;
    std::vector<std::string> roots;
    std::vector<std::string> open;
};

// ---------------------------------------------------------------------------
// Setup
// ---------------------------------------------------------------------------

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return WharfError{WharfError::InvalidArg, flag + " needs a value"};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (a == "--config") {
            auto v = next(a);
            if (v.is_err()) return std::move(v).error();
            args.config_file = v.value();
        } else if (a == "-v" || a == "--verbose") {
            args.verbose = true;
        } else if (a == "--root") {
            auto v = next(a);
            if (v.is_err()) return std::move(v).error();
            args.roots.push_back(v.value());
        } else if (a == "--open") {
            auto v = next(a);
            if (v.is_err()) return std::move(v).error();
            args.open.push_back(v.value());
        } else if (a == "-h" || a == "--help") {
            return WharfError{WharfError::InvalidArg, "help requested"};
        } else if (a.size() > 1 && a[0] == '-') {
            return WharfError{WharfError::InvalidArg, "unknown option " + a};
        } else if (args.command.empty()) {
            args.command = a;
        } else {
            args.positional.push_back(a);
        }
    }
    if (args.command.empty()) {
        return WharfError{WharfError::InvalidArg, "no command given"};
    }

    size_t min_args = 0, max_args = 0;
    if (args.command == "resolve" || args.command == "lookup" ||
        args.command == "canonical") {
        min_args = max_args = 1;
    } else if (args.command == "scan") {
        max_args = 1;
    } else if (args.command != "index") {
        return WharfError{WharfError::InvalidArg, "unknown command " + args.command};
    }
    if (args.positional.size() < min_args || args.positional.size() > max_args) {
        return WharfError{WharfError::InvalidArg,
            "wrong number of arguments for " + args.command};
    }
    return Result<Args>::ok(std::move(args));
}

static Result<Config> load_config(const Args& args) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto cfg = Config::load(global_path);
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    }

    std::optional<Config> local;
    if (!args.config_file.empty()) {
        auto cfg = Config::load(args.config_file);
        if (cfg.is_err()) return std::move(cfg).error();
        local = std::move(cfg).value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static Status cmd_canonical(const Args& args) {
    auto canonical = canonical_remote(args.positional[0]);
    if (!canonical) {
        return WharfError{WharfError::InvalidArg,
            "Invalid git clone URL: " + args.positional[0]};
    }
    std::cout << *canonical << "\n";
    return ok_status();
}

static Status cmd_index(RemoteIndex& index) {
    for (const auto& [remote, path] : index.entries()) {
        std::cout << remote << "\t" << path << "\n";
    }
    return ok_status();
}

static Status cmd_lookup(const Args& args, RemoteIndex& index) {
    auto locator = RemoteLocator::parse(args.positional[0]);
    if (locator.is_err()) return std::move(locator).error();

    auto path = index.resolve_remote(locator.value().canonical);
    if (!path) {
        return WharfError{WharfError::NotFound,
            locator.value().canonical + " is not in the remote index",
            "run `wharf scan` to rebuild it"};
    }
    std::cout << *path << "\n";
    return ok_status();
}

static Status cmd_scan(const Args& args, const Config& cfg, RemoteIndex& index) {
    std::string dir;
    if (!args.positional.empty()) {
        dir = args.positional[0];
    } else {
        auto configured = cfg.expanded_scan_directory();
        if (configured.is_err()) return std::move(configured).error();
        dir = configured.value();
    }
    if (dir.empty()) {
        return WharfError{WharfError::Config, "no directory to scan",
            "pass one or set [scan] directory"};
    }

    auto done = index.rebuild(dir);
    WHARF_TRY(done.get());
    std::cout << index.entries().size() << " remotes indexed\n";
    return ok_status();
}

static Status cmd_resolve(const Args& args, const Config& cfg, GitCli& git,
                          RemoteIndex& index) {
    auto locator = RemoteLocator::parse(args.positional[0]);
    if (locator.is_err()) return std::move(locator).error();

    RepositoryRegistry registry;
    for (const auto& dir : args.open) {
        auto repo = Repository::open(git, dir);
        if (repo.is_err()) {
            log::warn("ignoring --open %s: %s", dir.c_str(), repo.error().message.c_str());
            continue;
        }
        registry.add(std::move(repo).value());
    }

    ResolverOptions options;
    options.clone_template = cfg.folders.path;
    options.auto_select_workspace_roots = cfg.auto_select_workspace_roots;
    options.workspace_roots = args.roots;

    TerminalPrompter prompter(std::cin, std::cerr);
    RepositoryResolver resolver(git, prompter, registry, {&index}, options);

    auto resolved = resolver.resolve(locator.value());
    if (resolved.is_err()) return std::move(resolved).error();

    std::cout << resolved.value().root << "\n";
    return ok_status();
}

static Status run(const Args& args) {
    if (args.command == "canonical") return cmd_canonical(args);

    auto cfg = load_config(args);
    if (cfg.is_err()) return std::move(cfg).error();
    const Config& config = cfg.value();

    log::set_level(args.verbose ? log::Debug : config.log_level);

    GitCli git;
    git.set_timeout(config.git_timeout);

    auto index_file = config.expanded_index_file();
    if (index_file.is_err()) return std::move(index_file).error();
    RemoteIndex index(git, index_file.value(),
                      default_crawler_factory(config.scan.max_depth, config.scan.prune));
    WHARF_TRY(index.load());

    if (args.command == "index") return cmd_index(index);
    if (args.command == "lookup") return cmd_lookup(args, index);

    auto version = git.check_version();
    if (version.is_err()) return std::move(version).error();
    log::debug("using git %s", version.value().c_str());

    if (args.command == "scan") return cmd_scan(args, config, index);
    return cmd_resolve(args, config, git, index);
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        if (args.error().message != "help requested") {
            std::cerr << args.error().format() << "\n\n";
        }
        std::cerr << kUsage;
        return 2;
    }

    auto status = run(args.value());
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
