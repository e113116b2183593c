#include <wharf/executor.hpp>
#include <wharf/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace wharf {

namespace fs = std::filesystem;

const char* checkout_mode_name(CheckoutMode mode) {
    switch (mode) {
        case CheckoutMode::FastForward: return "ff";
        case CheckoutMode::Detached:    return "detached";
        case CheckoutMode::Reset:       return "reset";
    }
    return "unknown";
}

// Suggest the other clone protocol for GitHub remotes
static std::string clone_hint(const RemoteLocator& locator) {
    std::string lower = locator.clone_url;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.find("github.com") == std::string::npos) return "";

    const std::string host = "github.com/";
    std::string repo_path = locator.canonical.compare(0, host.size(), host) == 0
        ? locator.canonical.substr(host.size()) : locator.canonical;

    if (lower.compare(0, 4, "http") == 0) {
        return "GitHub clone failed; try the ssh URL git@github.com:" + repo_path + ".git";
    }
    return "GitHub clone failed; try the https URL https://github.com/" + repo_path;
}

SyncExecutor::SyncExecutor(GitCli& git, Prompter& prompter)
    : git_(git), prompter_(prompter) {}

Result<Repository> SyncExecutor::clone(const RemoteLocator& locator, const std::string& dest) {
    log::info("cloning %s from %s to %s", locator.display().c_str(),
              locator.clone_url.c_str(), dest.c_str());

    std::error_code ec;
    fs::path parent = fs::path(dest).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return WharfError{WharfError::IO,
                "cannot create " + parent.string() + ": " + ec.message()};
        }
    }

    bool existed = fs::exists(dest, ec);
    auto cloned = git_.clone(locator.clone_url, dest);
    if (cloned.is_err()) {
        auto e = std::move(cloned).error();

        // A killed clone never cleans up after itself
        if (e.code == WharfError::Timeout) {
            if (!existed) {
                fs::remove_all(dest, ec);
                if (ec) {
                    log::warn("cannot remove partial clone %s: %s",
                              dest.c_str(), ec.message().c_str());
                }
            }
            e.hint = clone_hint(locator);
            return e;
        }

        // git removes what it created on failure; a directory left behind
        // was there before or came from a concurrent clone
        if (!fs::exists(dest, ec)) {
            e.hint = clone_hint(locator);
            return e;
        }
        log::warn("clone into %s failed (%s); reusing the existing directory",
                  dest.c_str(), e.message.c_str());
        auto existing = Repository::open(git_, dest);
        if (existing.is_err()) {
            return WharfError{WharfError::NotARepository,
                "directory is not a valid git repository: " + dest,
                "move it aside or change [folders] path"};
        }
        if (existing.value().head().commit.empty()) {
            return WharfError{WharfError::CloneFailed,
                "existing repository " + dest + " has no commits",
                "remove it and resolve again"};
        }
    }

    if (locator.revision) {
        WHARF_TRY(git_.checkout(dest, *locator.revision));
    }
    return Repository::open(git_, dest);
}

Status SyncExecutor::fast_forward(const Repository& repo, const std::string& target) {
    if (repo.head().commit == target) {
        log::debug("%s already at %s", repo.root().c_str(), target.c_str());
        return ok_status();
    }

    log::info("fast-forwarding %s to %s", repo.root().c_str(), target.c_str());
    auto merged = git_.merge_ff_only(repo.root(), target);
    if (merged.is_err() && merged.error().code == WharfError::NonFastForward) {
        // The classifier only hands over candidates that can fast-forward
        log::error("%s cannot fast-forward to %s", repo.root().c_str(), target.c_str());
    }
    return merged;
}

Status SyncExecutor::ensure_local_branch(const Repository& repo, const std::string& revision,
                                         const std::string& target) {
    auto exists = git_.branch_exists(repo.root(), revision);
    if (exists.is_err()) return std::move(exists).error();
    if (exists.value()) return ok_status();

    // A tag or other ref of that name is checked out as is
    if (git_.resolve_commit(repo.root(), revision).is_ok()) return ok_status();

    log::info("creating branch %s at %s in %s", revision.c_str(), target.c_str(),
              repo.root().c_str());
    return git_.create_branch(repo.root(), revision, target);
}

Result<CheckoutMode> SyncExecutor::choose_checkout_mode(const Repository& repo,
                                                        const std::string& revision,
                                                        const std::string& target) {
    if (is_absolute_commit_id(revision)) {
        return Result<CheckoutMode>::ok(CheckoutMode::Detached);
    }

    auto forwardable = git_.is_ancestor(repo.root(), revision, target);
    if (forwardable.is_err()) return std::move(forwardable).error();
    if (forwardable.value()) {
        return Result<CheckoutMode>::ok(CheckoutMode::FastForward);
    }

    std::vector<PickItem> items = {
        {"Checkout detached head", "leave " + revision + " where it is"},
        {"Force update", "reset " + revision + " to " + target},
    };
    auto choice = prompter_.present(
        items, "Can't checkout " + revision + " and fast-forward to remote " + revision + ".");
    if (!choice) {
        return WharfError{WharfError::NoSelection, "no checkout option selected"};
    }
    if (*choice == 0) return Result<CheckoutMode>::ok(CheckoutMode::Detached);
    if (*choice == 1) return Result<CheckoutMode>::ok(CheckoutMode::Reset);
    return WharfError{WharfError::InvalidArg,
        "selection " + std::to_string(*choice) + " out of range"};
}

Result<CheckoutMode> SyncExecutor::stash_and_checkout(const Repository& repo,
                                                      const RemoteLocator& locator,
                                                      const std::string& target) {
    const std::string& revision = *locator.revision;

    if (!is_absolute_commit_id(revision)) {
        WHARF_TRY(ensure_local_branch(repo, revision, target));
    }

    auto mode = choose_checkout_mode(repo, revision, target);
    if (mode.is_err()) return mode;
    log::info("will use %s checkout for %s", checkout_mode_name(mode.value()),
              repo.root().c_str());

    auto head = git_.head(repo.root());
    if (head.is_err()) return std::move(head).error();
    std::string on = head.value().branch.value_or(head.value().commit);
    std::string message = "WIP on " + on + " to checkout " + revision;

    auto stashed = git_.stash(repo.root(), message);
    if (stashed.is_err()) return std::move(stashed).error();
    if (stashed.value()) {
        log::info("stashed %s: %s", repo.root().c_str(), message.c_str());
    } else {
        log::info("checking out %s to %s", repo.root().c_str(), revision.c_str());
    }

    switch (mode.value()) {
        case CheckoutMode::FastForward: {
            WHARF_TRY(git_.checkout(repo.root(), revision));
            auto moved = Repository::open(git_, repo.root());
            if (moved.is_err()) return std::move(moved).error();
            WHARF_TRY(fast_forward(moved.value(), target));
            break;
        }
        case CheckoutMode::Detached:
            WHARF_TRY(git_.checkout(repo.root(), target));
            break;
        case CheckoutMode::Reset:
            WHARF_TRY(git_.checkout(repo.root(), revision));
            WHARF_TRY(git_.reset_hard(repo.root(), target));
            break;
    }
    return mode;
}

} // namespace wharf
