#include <wharf/resolver.hpp>
#include <wharf/log.hpp>

namespace wharf {

// ---------------------------------------------------------------------------
// Constructor
// ---------------------------------------------------------------------------

RepositoryResolver::RepositoryResolver(GitCli& git, Prompter& prompter,
                                       RepositoryRegistry& registry,
                                       std::vector<const RemoteLookup*> lookups,
                                       ResolverOptions options)
    : git_(git), prompter_(prompter), registry_(registry),
      options_(std::move(options)),
      collector_(git, options_.clone_template, registry, std::move(lookups)),
      classifier_(git),
      executor_(git, prompter) {}

// ---------------------------------------------------------------------------
// resolve()
// ---------------------------------------------------------------------------

Result<Resolution> RepositoryResolver::resolve(const RemoteLocator& locator) {
    log::info("resolving %s", locator.display().c_str());

    Strategy attempted = Strategy::Clone;
    auto resolved = run(locator, attempted);
    if (resolved.is_err()) {
        return decorate(resolved.error(), locator, attempted);
    }

    auto repo = Repository::open(git_, resolved.value().root);
    if (repo.is_err()) {
        return decorate(repo.error(), locator, attempted);
    }
    registry_.add(std::move(repo).value());

    log::info("resolved %s to %s (%s)", locator.display().c_str(),
              resolved.value().root.c_str(), strategy_name(attempted));
    return resolved;
}

Result<Resolution> RepositoryResolver::run(const RemoteLocator& locator, Strategy& attempted) {
    auto candidates = collector_.find_candidates(locator.canonical);

    if (!locator.has_revision()) {
        attempted = select_strategy(false, candidates.size(), 0);
        log::info("strategy for %s: %s", locator.display().c_str(), strategy_name(attempted));
        if (attempted == Strategy::Clone) {
            return clone(locator);
        }

        PickOptions opts;
        opts.placeholder = "Choose a clone for repository " + locator.canonical;
        opts.auto_select_workspace_roots = options_.auto_select_workspace_roots;
        auto picked = pick_repository(prompter_, candidates, options_.workspace_roots, opts);
        if (picked.is_err()) return std::move(picked).error();

        Resolution r;
        r.root = picked.value().root();
        r.strategy = attempted;
        return Result<Resolution>::ok(std::move(r));
    }

    if (candidates.empty()) {
        attempted = Strategy::Clone;
        log::info("strategy for %s: %s", locator.display().c_str(), strategy_name(attempted));
        return clone(locator);
    }

    auto classes = classifier_.classify_all(candidates, locator);
    size_t forwardable = 0;
    for (const auto& c : classes) {
        if (c.forwardable) ++forwardable;
    }

    attempted = select_strategy(true, candidates.size(), forwardable);
    log::info("strategy for %s: %s", locator.display().c_str(), strategy_name(attempted));

    if (attempted == Strategy::PickAndFastForward) {
        return pick_and_fast_forward(locator, candidates, classes);
    }
    return pick_and_stash_checkout(locator, candidates, classes);
}

// ---------------------------------------------------------------------------
// Strategies
// ---------------------------------------------------------------------------

Result<Resolution> RepositoryResolver::clone(const RemoteLocator& locator) {
    auto dest = collector_.well_known_path(locator.canonical);
    if (dest.is_err()) return std::move(dest).error();

    auto repo = executor_.clone(locator, dest.value());
    if (repo.is_err()) return std::move(repo).error();

    Resolution r;
    r.root = repo.value().root();
    r.strategy = Strategy::Clone;
    return Result<Resolution>::ok(std::move(r));
}

Result<Resolution> RepositoryResolver::pick_and_fast_forward(
    const RemoteLocator& locator,
    const std::vector<Repository>& candidates,
    const std::vector<Classification>& classes)
{
    std::vector<Repository> at_revision;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (classes[i].forwardable) at_revision.push_back(candidates[i]);
    }

    PickOptions opts;
    opts.placeholder = "Choose a clone for repository " + locator.canonical;
    opts.auto_select_workspace_roots = options_.auto_select_workspace_roots;
    auto picked = pick_repository(prompter_, at_revision, options_.workspace_roots, opts);
    if (picked.is_err()) return std::move(picked).error();

    const Repository& repo = picked.value();
    const Classification* cls = nullptr;
    for (const auto& c : classes) {
        if (c.root == repo.root()) cls = &c;
    }
    if (!cls || !cls->target) {
        return WharfError{WharfError::Git,
            "no target commit recorded for " + repo.root()};
    }

    WHARF_TRY(executor_.fast_forward(repo, *cls->target));

    Resolution r;
    r.root = repo.root();
    r.strategy = Strategy::PickAndFastForward;
    return Result<Resolution>::ok(std::move(r));
}

Result<Resolution> RepositoryResolver::pick_and_stash_checkout(
    const RemoteLocator& locator,
    const std::vector<Repository>& candidates,
    const std::vector<Classification>& classes)
{
    PickOptions opts;
    opts.placeholder = "Choose a repository to stash and checkout " +
                       locator.canonical + "@" + *locator.revision;
    auto picked = pick_repository(prompter_, candidates, options_.workspace_roots, opts);
    if (picked.is_err()) return std::move(picked).error();

    const Repository& repo = picked.value();

    // Candidates on another branch were never fetched
    std::optional<std::string> target;
    for (const auto& c : classes) {
        if (c.root == repo.root() && c.target) target = c.target;
    }
    if (!target) {
        auto fetched = classifier_.fetch_target(repo, locator);
        if (fetched.is_err()) return std::move(fetched).error();
        target = fetched.value();
    }

    auto mode = executor_.stash_and_checkout(repo, locator, *target);
    if (mode.is_err()) return std::move(mode).error();

    Resolution r;
    r.root = repo.root();
    r.strategy = Strategy::PickAndStashCheckout;
    r.checkout_mode = mode.value();
    return Result<Resolution>::ok(std::move(r));
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

WharfError RepositoryResolver::decorate(const WharfError& err, const RemoteLocator& locator,
                                        Strategy attempted) const {
    if (err.code == WharfError::RemoteRefNotFound && locator.revision) {
        log::debug("%s", err.message.c_str());
        return WharfError{WharfError::RemoteRefNotFound,
            *locator.revision + " does not exist on remote " + locator.canonical,
            err.hint};
    }
    if (err.code == WharfError::NoSelection) {
        return err;
    }
    return err.with_context("resolving " + locator.display() + " (" +
                            strategy_name(attempted) + ")");
}

} // namespace wharf
