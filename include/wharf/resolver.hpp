#pragma once

#include <wharf/candidates.hpp>
#include <wharf/classifier.hpp>
#include <wharf/executor.hpp>
#include <wharf/git.hpp>
#include <wharf/prompter.hpp>
#include <wharf/remote.hpp>
#include <wharf/remote_index.hpp>
#include <wharf/repository.hpp>
#include <wharf/result.hpp>
#include <wharf/strategy.hpp>

#include <optional>
#include <string>
#include <vector>

namespace wharf {

struct ResolverOptions {
    std::string clone_template =
        "${homePath}${separator}src${separator}${folderRelativePath}";
    bool auto_select_workspace_roots = true;
    std::vector<std::string> workspace_roots;
};

// Outcome of one resolution
struct Resolution {
    std::string root;
    Strategy strategy = Strategy::Clone;
    std::optional<CheckoutMode> checkout_mode;   // set for stash-and-checkout
};

// Turns a RemoteLocator into a local working copy at the requested revision,
// cloning, fast-forwarding or checking out as needed.
class RepositoryResolver {
public:
    RepositoryResolver(GitCli& git, Prompter& prompter, RepositoryRegistry& registry,
                       std::vector<const RemoteLookup*> lookups = {},
                       ResolverOptions options = {});

    // On success the working copy is also added to the registry
    Result<Resolution> resolve(const RemoteLocator& locator);

    void set_workspace_roots(std::vector<std::string> roots) {
        options_.workspace_roots = std::move(roots);
    }

    CandidateCollector& collector() { return collector_; }

private:
    GitCli& git_;
    Prompter& prompter_;
    RepositoryRegistry& registry_;
    ResolverOptions options_;
    CandidateCollector collector_;
    RevisionClassifier classifier_;
    SyncExecutor executor_;

    Result<Resolution> run(const RemoteLocator& locator, Strategy& attempted);
    Result<Resolution> clone(const RemoteLocator& locator);
    Result<Resolution> pick_and_fast_forward(const RemoteLocator& locator,
                                             const std::vector<Repository>& candidates,
                                             const std::vector<Classification>& classes);
    Result<Resolution> pick_and_stash_checkout(const RemoteLocator& locator,
                                               const std::vector<Repository>& candidates,
                                               const std::vector<Classification>& classes);

    WharfError decorate(const WharfError& err, const RemoteLocator& locator,
                        Strategy attempted) const;
};

} // namespace wharf
