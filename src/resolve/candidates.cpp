#include <wharf/candidates.hpp>
#include <wharf/path_template.hpp>
#include <wharf/log.hpp>

#include <filesystem>
#include <future>
#include <set>

namespace wharf {

namespace fs = std::filesystem;

CandidateCollector::CandidateCollector(GitCli& git, std::string clone_template,
                                       const RepositoryRegistry& registry,
                                       std::vector<const RemoteLookup*> lookups)
    : git_(git), clone_template_(std::move(clone_template)),
      registry_(registry), lookups_(std::move(lookups)) {}

Result<std::string> CandidateCollector::well_known_path(const std::string& canonical) const {
    return expand_clone_path(clone_template_, canonical);
}

std::vector<std::string> CandidateCollector::candidate_paths(const std::string& canonical) const {
    std::vector<std::string> paths;
    std::set<std::string> seen;

    auto add = [&](const std::string& path) {
        if (path.empty()) return;
        std::error_code ec;
        auto key = fs::weakly_canonical(fs::path(path), ec);
        std::string k = ec ? fs::path(path).lexically_normal().string() : key.string();
        if (seen.insert(k).second) paths.push_back(path);
    };

    for (const auto& repo : registry_.snapshot()) {
        if (repo.has_remote(canonical)) add(repo.root());
    }

    auto well_known = well_known_path(canonical);
    if (well_known.is_ok()) {
        add(well_known.value());
    } else {
        log::warn("no well-known clone path for %s: %s",
                  canonical.c_str(), well_known.error().message.c_str());
    }

    for (const auto* lookup : lookups_) {
        if (!lookup) continue;
        if (auto path = lookup->resolve_remote(canonical)) add(*path);
    }
    return paths;
}

std::vector<Repository> CandidateCollector::find_candidates(const std::string& canonical) {
    auto paths = candidate_paths(canonical);

    std::vector<std::future<Result<Repository>>> opening;
    opening.reserve(paths.size());
    for (const auto& path : paths) {
        opening.push_back(std::async(std::launch::async, [this, path]() {
            return Repository::open(git_, path);
        }));
    }

    std::vector<Repository> repos;
    std::set<std::string> roots;
    for (size_t i = 0; i < opening.size(); ++i) {
        auto repo = opening[i].get();
        if (repo.is_err()) {
            log::debug("dropping candidate %s: %s",
                       paths[i].c_str(), repo.error().message.c_str());
            continue;
        }
        if (!roots.insert(repo.value().root()).second) continue;
        repos.push_back(std::move(repo).value());
    }

    log::info("found %zu candidate(s) for %s", repos.size(), canonical.c_str());
    return repos;
}

} // namespace wharf
