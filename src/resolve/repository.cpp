#include <wharf/repository.hpp>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace wharf {

namespace fs = std::filesystem;

static std::string normalized(const std::string& path) {
    std::error_code ec;
    auto p = fs::weakly_canonical(fs::path(path), ec);
    if (ec) p = fs::path(path).lexically_normal();
    std::string s = p.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

Repository::Repository(std::string root, Head head, std::vector<RemoteEntry> remotes)
    : root_(std::move(root)), head_(std::move(head)), remotes_(std::move(remotes)) {}

Result<Repository> Repository::open(GitCli& git, const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return WharfError{WharfError::NotARepository,
            "directory does not exist: " + path};
    }

    auto top = git.toplevel(path);
    if (top.is_err()) return std::move(top).error();

    std::string root = normalized(path);
    if (normalized(top.value()) != root) {
        return WharfError{WharfError::NotARepository,
            path + " is not a repository root (root is " + top.value() + ")"};
    }

    auto head = git.head(root);
    if (head.is_err()) return std::move(head).error();

    auto remotes = git.remotes(root);
    if (remotes.is_err()) return std::move(remotes).error();

    return Result<Repository>::ok(Repository(
        std::move(root), std::move(head).value(), std::move(remotes).value()));
}

bool Repository::has_remote(const std::string& canonical) const {
    return remote_for(canonical) != nullptr;
}

const RemoteEntry* Repository::remote_for(const std::string& canonical) const {
    if (canonical.empty()) return nullptr;
    for (const auto& r : remotes_) {
        if (r.canonical == canonical) return &r;
    }
    return nullptr;
}

Status Repository::refresh(GitCli& git) {
    auto head = git.head(root_);
    if (head.is_err()) return std::move(head).error();

    auto remotes = git.remotes(root_);
    if (remotes.is_err()) return std::move(remotes).error();

    head_ = std::move(head).value();
    remotes_ = std::move(remotes).value();
    return ok_status();
}

// ---------------------------------------------------------------------------
// RepositoryRegistry
// ---------------------------------------------------------------------------

void RepositoryRegistry::add(Repository repo) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : repos_) {
        if (existing.root() == repo.root()) {
            existing = std::move(repo);
            return;
        }
    }
    repos_.push_back(std::move(repo));
}

bool RepositoryRegistry::remove(const std::string& root) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(repos_.begin(), repos_.end(),
                           [&](const Repository& r) { return r.root() == root; });
    if (it == repos_.end()) return false;
    repos_.erase(it);
    return true;
}

bool RepositoryRegistry::contains(const std::string& root) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(repos_.begin(), repos_.end(),
                       [&](const Repository& r) { return r.root() == root; });
}

std::vector<Repository> RepositoryRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return repos_;
}

size_t RepositoryRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return repos_.size();
}

} // namespace wharf
