#pragma once

#include <wharf/git.hpp>
#include <wharf/remote_index.hpp>
#include <wharf/repository.hpp>
#include <wharf/result.hpp>

#include <string>
#include <vector>

namespace wharf {

// Gathers the local working copies that may hold a remote
class CandidateCollector {
public:
    CandidateCollector(GitCli& git, std::string clone_template,
                       const RepositoryRegistry& registry,
                       std::vector<const RemoteLookup*> lookups = {});

    // Where a fresh clone of `canonical` goes
    Result<std::string> well_known_path(const std::string& canonical) const;

    // Open repositories with the remote, then the well-known clone path,
    // then index answers; deduplicated by resolved path, in that order
    std::vector<std::string> candidate_paths(const std::string& canonical) const;

    // Open every candidate path (in parallel, order kept). Paths that are
    // not repository roots are dropped.
    std::vector<Repository> find_candidates(const std::string& canonical);

private:
    GitCli& git_;
    std::string clone_template_;
    const RepositoryRegistry& registry_;
    std::vector<const RemoteLookup*> lookups_;
};

} // namespace wharf
