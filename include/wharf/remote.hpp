#pragma once

#include <wharf/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace wharf {

// Canonicalize a git remote URL so that spellings of the same remote compare
// equal: "git@github.com:Acme/widgets.git", "https://github.com/acme/widgets/"
// and "git+ssh://git@github.com/acme/widgets" all become
// "github.com/acme/widgets". Returns nullopt for unparseable input.
std::optional<std::string> canonical_remote(const std::string& remote);

// Exactly 40 hex characters; anything else is a ref name to fetch
bool is_absolute_commit_id(const std::string& revision);

// Canonical forms of every URL in `git remote --verbose` output, deduplicated
// in first-seen order. Lines whose URL has no canonical form are skipped.
std::vector<std::string> extract_canonical_remotes(const std::string& remote_verbose);

// "Give me a local checkout of this remote at this revision"
struct RemoteLocator {
    std::string clone_url;
    std::string canonical;
    std::optional<std::string> revision;   // unset = any state is acceptable

    bool has_revision() const { return revision.has_value(); }

    // "<remote>@<revision or HEAD>" for messages
    std::string display() const;

    static Result<RemoteLocator> make(const std::string& clone_url,
                                      std::optional<std::string> revision = {});

    // Parse a resource string like "git+ssh://git@github.com/foo/bar.git?master".
    // The query is the revision; a "git+" scheme prefix is dropped from the
    // clone URL because git itself does not understand it.
    static Result<RemoteLocator> parse(const std::string& resource);
};

} // namespace wharf
