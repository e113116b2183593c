#include <wharf/git.hpp>
#include <wharf/remote.hpp>
#include <wharf/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace wharf {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string trim_trailing(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

static bool contains_ci(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(),
                          needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

// Map a failed git invocation onto an error code by its stderr
static WharfError git_failure(const CommandResult& cmd, WharfError::Code fallback,
                              const std::string& what) {
    std::string err = trim_trailing(cmd.stderr_str);
    if (err.empty()) err = trim_trailing(cmd.stdout_str);

    WharfError::Code code = fallback;
    if (contains_ci(err, "couldn't find remote ref") ||
        contains_ci(err, "did not match any") ||
        contains_ci(err, "invalid reference")) {
        code = WharfError::RemoteRefNotFound;
    } else if (contains_ci(err, "not a git repository")) {
        code = WharfError::NotARepository;
    } else if (contains_ci(err, "not possible to fast-forward")) {
        code = WharfError::NonFastForward;
    }

    return WharfError{code, what + " failed (exit " +
        std::to_string(cmd.exit_code) + "): " + err};
}

std::vector<RemoteEntry> parse_remote_verbose(const std::string& output) {
    std::vector<RemoteEntry> remotes;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string name, url;
        if (!(fields >> name >> url)) continue;

        bool seen = std::any_of(remotes.begin(), remotes.end(),
                                [&](const RemoteEntry& r) {
                                    return r.name == name && r.url == url;
                                });
        if (seen) continue;

        RemoteEntry entry;
        entry.name = name;
        entry.url = url;
        entry.canonical = canonical_remote(url).value_or("");
        remotes.push_back(std::move(entry));
    }
    return remotes;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<CommandResult> GitCli::run(const std::string& repo, std::vector<std::string> args) {
    if (trace_) trace_(args);

    std::vector<std::string> argv;
    argv.reserve(args.size() + 3);
    argv.push_back("git");
    if (!repo.empty()) {
        argv.push_back("-C");
        argv.push_back(repo);
    }
    for (auto& a : args) argv.push_back(std::move(a));

    return run_command(argv, "", timeout_seconds_);
}

Result<std::string> GitCli::check_version() {
    auto r = run("", {"--version"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return WharfError{WharfError::NotFound,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_trailing(cmd.stdout_str);

    // "git version X.Y.Z..."
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return WharfError{WharfError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (std::sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return WharfError{WharfError::Parse,
            "cannot parse git version: " + ver_str};
    }

    if (major < 2 || (major == 2 && minor < 20)) {
        return WharfError{WharfError::Git,
            "git version " + ver_str + " too old",
            "upgrade to git >= 2.20"};
    }

    return Result<std::string>::ok(std::move(ver_str));
}

Result<std::string> GitCli::toplevel(const std::string& path) {
    auto r = run(path, {"rev-parse", "--show-toplevel"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        auto e = git_failure(cmd, WharfError::NotARepository, "git rev-parse --show-toplevel");
        // Anything that is not a work tree (bare repo, .git dir, missing dir)
        e.code = WharfError::NotARepository;
        return e;
    }

    std::string top = trim_trailing(cmd.stdout_str);
    if (top.empty()) {
        return WharfError{WharfError::NotARepository,
            path + " is not inside a work tree"};
    }
    return Result<std::string>::ok(std::move(top));
}

Result<Head> GitCli::head(const std::string& repo) {
    Head h;

    auto branch = run(repo, {"symbolic-ref", "-q", "--short", "HEAD"});
    if (branch.is_err()) return std::move(branch).error();
    if (branch.value().exit_code == 0) {
        h.branch = trim_trailing(branch.value().stdout_str);
    } else if (branch.value().exit_code != 1) {
        return git_failure(branch.value(), WharfError::Git, "git symbolic-ref HEAD");
    }

    // Fails in a repository without commits; HEAD then has no commit
    auto commit = run(repo, {"rev-parse", "--verify", "-q", "HEAD"});
    if (commit.is_err()) return std::move(commit).error();
    if (commit.value().exit_code == 0) {
        h.commit = trim_trailing(commit.value().stdout_str);
    }

    return Result<Head>::ok(std::move(h));
}

Result<std::string> GitCli::config_value(const std::string& repo, const std::string& key) {
    auto r = run(repo, {"config", "--get", key});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code == 1) {
        return Result<std::string>::ok("");
    }
    if (cmd.exit_code != 0) {
        return git_failure(cmd, WharfError::Git, "git config " + key);
    }
    return Result<std::string>::ok(trim_trailing(cmd.stdout_str));
}

Result<std::string> GitCli::upstream_branch(const std::string& repo,
                                            const std::string& branch) {
    auto r = config_value(repo, "branch." + branch + ".merge");
    if (r.is_err()) return r;

    std::string merge = std::move(r).value();
    const std::string prefix = "refs/heads/";
    if (merge.compare(0, prefix.size(), prefix) == 0) {
        merge.erase(0, prefix.size());
    }
    return Result<std::string>::ok(std::move(merge));
}

Result<std::string> GitCli::upstream_remote(const std::string& repo,
                                            const std::string& branch) {
    return config_value(repo, "branch." + branch + ".remote");
}

Result<std::string> GitCli::remote_verbose(const std::string& repo) {
    auto r = run(repo, {"remote", "--verbose"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return git_failure(cmd, WharfError::Git, "git remote --verbose");
    }
    return Result<std::string>::ok(std::move(cmd.stdout_str));
}

Result<std::vector<RemoteEntry>> GitCli::remotes(const std::string& repo) {
    auto out = remote_verbose(repo);
    if (out.is_err()) return std::move(out).error();
    return Result<std::vector<RemoteEntry>>::ok(parse_remote_verbose(out.value()));
}

Result<std::string> GitCli::resolve_commit(const std::string& repo, const std::string& ref) {
    auto r = run(repo, {"rev-parse", "--verify", "-q", ref + "^{commit}"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return WharfError{WharfError::NotFound,
            "cannot resolve ref '" + ref + "' in " + repo};
    }
    return Result<std::string>::ok(trim_trailing(cmd.stdout_str));
}

Result<bool> GitCli::has_commit(const std::string& repo, const std::string& commit) {
    auto r = run(repo, {"cat-file", "-e", commit + "^{commit}"});
    if (r.is_err()) return std::move(r).error();
    return Result<bool>::ok(r.value().exit_code == 0);
}

Status GitCli::fetch(const std::string& repo, const std::string& repository,
                     const std::optional<std::string>& refspec) {
    std::vector<std::string> args = {"fetch", "--prune", repository};
    if (refspec) args.push_back(*refspec);

    log::debug("git -C %s fetch --prune %s %s", repo.c_str(), repository.c_str(),
               refspec ? refspec->c_str() : "");
    auto r = run(repo, std::move(args));
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code != 0) {
        return git_failure(r.value(), WharfError::Git, "git fetch " + repository);
    }
    return ok_status();
}

Result<bool> GitCli::is_ancestor(const std::string& repo,
                                 const std::string& from, const std::string& to) {
    auto r = run(repo, {"merge-base", "--is-ancestor", from, to});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code == 0) return Result<bool>::ok(true);
    if (cmd.exit_code == 1) return Result<bool>::ok(false);
    return git_failure(cmd, WharfError::Git, "git merge-base --is-ancestor");
}

Status GitCli::merge_ff_only(const std::string& repo, const std::string& target) {
    log::debug("git -C %s merge --ff-only %s", repo.c_str(), target.c_str());
    auto r = run(repo, {"merge", "--ff-only", target});
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code != 0) {
        return git_failure(r.value(), WharfError::Git, "git merge --ff-only " + target);
    }
    return ok_status();
}

Status GitCli::checkout(const std::string& repo, const std::string& rev) {
    log::debug("git -C %s checkout %s", repo.c_str(), rev.c_str());
    auto r = run(repo, {"checkout", "-q", rev, "--"});
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code != 0) {
        return git_failure(r.value(), WharfError::Git, "git checkout " + rev);
    }
    return ok_status();
}

Result<bool> GitCli::branch_exists(const std::string& repo, const std::string& name) {
    auto r = run(repo, {"rev-parse", "--verify", "-q", "refs/heads/" + name});
    if (r.is_err()) return std::move(r).error();
    return Result<bool>::ok(r.value().exit_code == 0);
}

Status GitCli::create_branch(const std::string& repo, const std::string& name,
                             const std::string& commit) {
    log::debug("git -C %s branch %s %s", repo.c_str(), name.c_str(), commit.c_str());
    auto r = run(repo, {"branch", name, commit});
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code != 0) {
        return git_failure(r.value(), WharfError::Git, "git branch " + name);
    }
    return ok_status();
}

Result<bool> GitCli::stash(const std::string& repo, const std::string& message) {
    auto r = run(repo, {"stash", "push", "-m", message});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code == 0) {
        // git exits 0 and says so on stdout when the tree is clean
        bool nothing = contains_ci(cmd.stdout_str, "No local changes to save") ||
                       contains_ci(cmd.stderr_str, "No local changes to save");
        return Result<bool>::ok(!nothing);
    }
    if (contains_ci(cmd.stderr_str, "No local changes to save")) {
        return Result<bool>::ok(false);
    }
    return git_failure(cmd, WharfError::StashFailed, "git stash");
}

Status GitCli::reset_hard(const std::string& repo, const std::string& commit) {
    log::debug("git -C %s reset --hard %s", repo.c_str(), commit.c_str());
    auto r = run(repo, {"reset", "-q", "--hard", commit});
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code != 0) {
        return git_failure(r.value(), WharfError::Git, "git reset --hard " + commit);
    }
    return ok_status();
}

Status GitCli::clone(const std::string& url, const std::string& dest) {
    log::debug("git clone %s %s", url.c_str(), dest.c_str());
    auto r = run("", {"clone", "-q", url, dest});
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code != 0) {
        auto e = git_failure(r.value(), WharfError::CloneFailed, "git clone " + url);
        e.code = WharfError::CloneFailed;
        return e;
    }
    return ok_status();
}

} // namespace wharf
