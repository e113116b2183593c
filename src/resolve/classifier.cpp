#include <wharf/classifier.hpp>
#include <wharf/log.hpp>

#include <future>

namespace wharf {

RevisionClassifier::RevisionClassifier(GitCli& git) : git_(git) {}

Result<bool> RevisionClassifier::head_matches_upstream(const Repository& repo,
                                                       const RemoteLocator& locator) {
    const std::string& revision = *locator.revision;
    const Head& head = repo.head();
    if (head.detached()) {
        return Result<bool>::ok(true);
    }
    if (*head.branch == revision || head.commit == revision) {
        return Result<bool>::ok(true);
    }

    auto upstream = git_.upstream_branch(repo.root(), *head.branch);
    if (upstream.is_err()) return std::move(upstream).error();
    if (upstream.value() != revision) {
        return Result<bool>::ok(false);
    }

    // The upstream only counts when it tracks the locator's remote, named
    // either as a configured remote or by URL. "." (a local branch) never does.
    auto remote = git_.upstream_remote(repo.root(), *head.branch);
    if (remote.is_err()) return std::move(remote).error();
    const std::string& name = remote.value();
    if (name.empty() || name == ".") {
        return Result<bool>::ok(false);
    }
    for (const auto& entry : repo.remotes()) {
        if (entry.name == name) {
            return Result<bool>::ok(entry.canonical == locator.canonical);
        }
    }
    auto canonical = canonical_remote(name);
    return Result<bool>::ok(canonical && *canonical == locator.canonical);
}

Result<std::string> RevisionClassifier::fetch_target(const Repository& repo,
                                                     const RemoteLocator& locator) {
    const std::string& revision = *locator.revision;

    // Refs can move; never trust a cached answer
    if (!is_absolute_commit_id(revision)) {
        log::info("fetching %s from %s into %s",
                  revision.c_str(), locator.clone_url.c_str(), repo.root().c_str());
        WHARF_TRY(git_.fetch(repo.root(), locator.clone_url, revision));
        return git_.resolve_commit(repo.root(), "FETCH_HEAD");
    }

    auto present = git_.has_commit(repo.root(), revision);
    if (present.is_err()) return std::move(present).error();
    if (present.value()) {
        return Result<std::string>::ok(revision);
    }

    // Fetch through the configured remote when there is one, so its
    // remote-tracking refs are updated as well
    const RemoteEntry* remote = repo.remote_for(locator.canonical);
    std::string source = remote ? remote->name : locator.clone_url;
    log::info("fetching %s from %s into %s",
              revision.c_str(), source.c_str(), repo.root().c_str());
    WHARF_TRY(git_.fetch(repo.root(), source));

    present = git_.has_commit(repo.root(), revision);
    if (present.is_err()) return std::move(present).error();
    if (!present.value()) {
        return WharfError{WharfError::RemoteRefNotFound,
            repo.root() + " does not have " + revision + " after fetching " + source};
    }
    return Result<std::string>::ok(revision);
}

Classification RevisionClassifier::classify(const Repository& repo,
                                            const RemoteLocator& locator) {
    Classification c;
    c.root = repo.root();
    const std::string& revision = *locator.revision;

    auto matches = head_matches_upstream(repo, locator);
    if (matches.is_err()) {
        c.error = std::move(matches).error();
        return c;
    }
    if (!matches.value()) {
        log::info("%s HEAD (%s) does not match %s", repo.root().c_str(),
                  repo.head().branch->c_str(), revision.c_str());
        return c;
    }
    c.eligible = true;

    auto target = fetch_target(repo, locator);
    if (target.is_err()) {
        log::info("%s does not have %s: %s", repo.root().c_str(), revision.c_str(),
                  target.error().message.c_str());
        c.error = std::move(target).error();
        return c;
    }
    c.target = target.value();

    if (repo.head().commit.empty()) {
        // Unborn branch: nothing to lose
        c.forwardable = true;
        return c;
    }
    if (repo.head().commit == *c.target) {
        c.forwardable = true;
        return c;
    }

    auto ancestor = git_.is_ancestor(repo.root(), repo.head().commit, *c.target);
    if (ancestor.is_err()) {
        c.error = std::move(ancestor).error();
        return c;
    }
    c.forwardable = ancestor.value();
    if (!c.forwardable) {
        log::info("%s@%s can't be fast-forwarded to %s", repo.root().c_str(),
                  repo.head().commit.c_str(), c.target->c_str());
    }
    return c;
}

std::vector<Classification> RevisionClassifier::classify_all(
    const std::vector<Repository>& repos, const RemoteLocator& locator)
{
    std::vector<std::future<Classification>> running;
    running.reserve(repos.size());
    for (const auto& repo : repos) {
        running.push_back(std::async(std::launch::async, [this, &repo, &locator]() {
            return classify(repo, locator);
        }));
    }

    std::vector<Classification> results;
    results.reserve(running.size());
    size_t forwardable = 0;
    for (auto& r : running) {
        results.push_back(r.get());
        if (results.back().forwardable) ++forwardable;
    }
    log::info("found %zu of %zu repositories at %s for %s", forwardable, results.size(),
              locator.revision->c_str(), locator.canonical.c_str());
    return results;
}

} // namespace wharf
