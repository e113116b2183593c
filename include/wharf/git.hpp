#pragma once

#include <wharf/process.hpp>
#include <wharf/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wharf {

// Current HEAD of a working copy
struct Head {
    std::string commit;                  // empty in a repository with no commits
    std::optional<std::string> branch;   // unset when detached

    bool detached() const { return !branch.has_value(); }
};

// One configured remote, as listed by `git remote --verbose`
struct RemoteEntry {
    std::string name;
    std::string url;
    std::string canonical;   // empty when the url has no canonical form
};

// Parse `git remote --verbose` output (fetch and push lines collapse to one entry)
std::vector<RemoteEntry> parse_remote_verbose(const std::string& output);

// Wrapper around git CLI operations on working copies
class GitCli {
public:
    using TraceFn = std::function<void(const std::vector<std::string>& argv)>;

    // Check git is available and version >= 2.20
    Result<std::string> check_version();

    // `git rev-parse --show-toplevel`; NotARepository outside a work tree
    Result<std::string> toplevel(const std::string& path);

    Result<Head> head(const std::string& repo);

    // Short name of the branch's configured upstream merge ref
    // (branch.<name>.merge without refs/heads/), or "" when none is set
    Result<std::string> upstream_branch(const std::string& repo,
                                        const std::string& branch);

    // branch.<name>.remote, or "" when none is set
    Result<std::string> upstream_remote(const std::string& repo,
                                        const std::string& branch);

    Result<std::vector<RemoteEntry>> remotes(const std::string& repo);

    // Raw `git remote --verbose` output
    Result<std::string> remote_verbose(const std::string& repo);

    // Resolve a ref to a full commit id; NotFound when it does not resolve
    Result<std::string> resolve_commit(const std::string& repo, const std::string& ref);

    Result<bool> has_commit(const std::string& repo, const std::string& commit);

    // `git fetch --prune <repository> [refspec]`
    Status fetch(const std::string& repo, const std::string& repository,
                 const std::optional<std::string>& refspec = {});

    // `git merge-base --is-ancestor <from> <to>`: exit 0 true, exit 1 false
    Result<bool> is_ancestor(const std::string& repo,
                             const std::string& from, const std::string& to);

    // Fast-forward-only merge; NonFastForward when the merge would not be one
    Status merge_ff_only(const std::string& repo, const std::string& target);

    Status checkout(const std::string& repo, const std::string& rev);

    Result<bool> branch_exists(const std::string& repo, const std::string& name);
    Status create_branch(const std::string& repo, const std::string& name,
                         const std::string& commit);

    // Stash local changes. Returns false when there was nothing to stash.
    Result<bool> stash(const std::string& repo, const std::string& message);

    Status reset_hard(const std::string& repo, const std::string& commit);

    Status clone(const std::string& url, const std::string& dest);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    int timeout() const { return timeout_seconds_; }

    // Observe every git invocation (argv without the leading "git").
    // Must be set before concurrent use.
    void set_trace(TraceFn trace) { trace_ = std::move(trace); }

private:
    int timeout_seconds_ = 300;
    TraceFn trace_;

    Result<CommandResult> run(const std::string& repo, std::vector<std::string> args);

    // `git config --get key`, "" when unset
    Result<std::string> config_value(const std::string& repo, const std::string& key);
};

} // namespace wharf
