#pragma once

#include <wharf/git.hpp>
#include <wharf/result.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace wharf {

// A local git working copy: its root, HEAD and configured remotes.
// A snapshot; refresh() re-reads it after the working copy changes.
class Repository {
public:
    Repository(std::string root, Head head, std::vector<RemoteEntry> remotes);

    // Open the working copy whose root is exactly `path`.
    // NotARepository if `path` is missing, not a work tree, or only a
    // subdirectory of one (including case-only path mismatches).
    static Result<Repository> open(GitCli& git, const std::string& path);

    const std::string& root() const { return root_; }
    const Head& head() const { return head_; }
    const std::vector<RemoteEntry>& remotes() const { return remotes_; }

    bool has_remote(const std::string& canonical) const;

    // First remote whose canonical form is `canonical`, or nullptr
    const RemoteEntry* remote_for(const std::string& canonical) const;

    Status refresh(GitCli& git);

private:
    std::string root_;
    Head head_;
    std::vector<RemoteEntry> remotes_;
};

// Repositories the host currently has open. Safe to share between threads.
class RepositoryRegistry {
public:
    // Add or replace (by root) a repository
    void add(Repository repo);

    bool remove(const std::string& root);
    bool contains(const std::string& root) const;

    // Copy of the open repositories in the order they were first added
    std::vector<Repository> snapshot() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Repository> repos_;
};

} // namespace wharf
