#pragma once

#include <wharf/git.hpp>
#include <wharf/prompter.hpp>
#include <wharf/remote.hpp>
#include <wharf/repository.hpp>
#include <wharf/result.hpp>

#include <string>

namespace wharf {

// How stash-and-checkout moves a working copy onto the revision
enum class CheckoutMode {
    FastForward,   // check out the local branch, then fast-forward it
    Detached,      // check out the target commit directly
    Reset,         // check out the local branch, then hard-reset it
};

const char* checkout_mode_name(CheckoutMode mode);

// Performs the mutations a resolution strategy needs
class SyncExecutor {
public:
    SyncExecutor(GitCli& git, Prompter& prompter);

    // Clone the locator's remote into `dest` and check out its revision.
    // If the clone fails but `dest` exists, the existing directory is
    // opened instead.
    Result<Repository> clone(const RemoteLocator& locator, const std::string& dest);

    // Fast-forward-only merge of `target` into HEAD (no-op when equal)
    Status fast_forward(const Repository& repo, const std::string& target);

    // Pick how a ref-name revision gets checked out: fast-forward when
    // the local branch is an ancestor of `target`, otherwise ask
    Result<CheckoutMode> choose_checkout_mode(const Repository& repo,
                                              const std::string& revision,
                                              const std::string& target);

    // Stash local changes and force the working copy onto `target`
    Result<CheckoutMode> stash_and_checkout(const Repository& repo,
                                            const RemoteLocator& locator,
                                            const std::string& target);

private:
    GitCli& git_;
    Prompter& prompter_;

    Status ensure_local_branch(const Repository& repo, const std::string& revision,
                               const std::string& target);
};

} // namespace wharf
