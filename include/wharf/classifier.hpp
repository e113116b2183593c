#pragma once

#include <wharf/git.hpp>
#include <wharf/remote.hpp>
#include <wharf/repository.hpp>
#include <wharf/result.hpp>

#include <optional>
#include <string>
#include <vector>

namespace wharf {

// How one candidate relates to a requested revision
struct Classification {
    std::string root;
    bool eligible = false;               // detached, or on the revision's branch
    std::optional<std::string> target;   // commit the revision resolved to
    bool forwardable = false;            // HEAD is an ancestor of target
    std::optional<WharfError> error;     // git failure that excluded the candidate
};

class RevisionClassifier {
public:
    explicit RevisionClassifier(GitCli& git);

    // Detached HEADs always match. A branch matches when its name or its
    // commit equals the locator's revision, or when its upstream branch does
    // and that upstream's remote is the locator's remote.
    Result<bool> head_matches_upstream(const Repository& repo, const RemoteLocator& locator);

    // Commit id the locator's revision resolves to in `repo`. Ref names
    // are always fetched from the clone URL; absolute commit ids are
    // fetched (unscoped) only when missing. RemoteRefNotFound when the
    // revision cannot be found after fetching.
    Result<std::string> fetch_target(const Repository& repo, const RemoteLocator& locator);

    Classification classify(const Repository& repo, const RemoteLocator& locator);

    // classify() every candidate concurrently; results keep candidate order
    std::vector<Classification> classify_all(const std::vector<Repository>& repos,
                                             const RemoteLocator& locator);

private:
    GitCli& git_;
};

} // namespace wharf
