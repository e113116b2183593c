#include <wharf/remote_index.hpp>
#include <wharf/remote.hpp>
#include <wharf/log.hpp>
#include <toml++/toml.hpp>

#include <deque>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace wharf {

namespace fs = std::filesystem;

// Remote probes in flight at once during a crawl
static constexpr size_t kMaxConcurrentProbes = 8;

// ---------------------------------------------------------------------------
// Index file
// ---------------------------------------------------------------------------

Result<IndexMap> load_index_file(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return Result<IndexMap>::ok(IndexMap{});
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return WharfError{WharfError::IO, "cannot open remote index: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    toml::table doc;
    try {
        doc = toml::parse(ss.str(), path);
    } catch (const toml::parse_error& e) {
        return WharfError{WharfError::Parse,
            std::string("remote index TOML parse error: ") + e.what(),
            "delete " + path + " and run `wharf scan` to rebuild it"};
    }

    IndexMap entries;
    if (auto remotes = doc["remotes"].as_array()) {
        for (const auto& item : *remotes) {
            auto tbl = item.as_table();
            if (!tbl) continue;
            auto remote = (*tbl)["remote"].value<std::string>();
            auto repo_path = (*tbl)["path"].value<std::string>();
            if (!remote || !repo_path) {
                log::warn("%s: skipping [[remotes]] entry without remote/path", path.c_str());
                continue;
            }
            entries[*remote] = *repo_path;
        }
    }
    return Result<IndexMap>::ok(std::move(entries));
}

Status save_index_file(const std::string& path, const IndexMap& entries) {
    if (path.empty()) return ok_status();

    toml::array remotes;
    for (const auto& [remote, repo_path] : entries) {
        remotes.push_back(toml::table{
            {"remote", remote},
            {"path", repo_path},
        });
    }
    toml::table doc;
    doc.insert_or_assign("remotes", std::move(remotes));

    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return WharfError{WharfError::IO,
                "cannot create " + target.parent_path().string() + ": " + ec.message()};
        }
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return WharfError{WharfError::IO, "cannot write remote index: " + tmp};
        }
        out << "# Generated by wharf. Rebuilt by `wharf scan`.\n";
        out << doc << "\n";
        if (!out.good()) {
            return WharfError{WharfError::IO, "failed writing remote index: " + tmp};
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return WharfError{WharfError::IO, "cannot replace remote index " + path};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// RemoteIndex
// ---------------------------------------------------------------------------

RemoteIndex::RemoteIndex(GitCli& git, std::string store_path, CrawlerFactory factory)
    : git_(git), store_path_(std::move(store_path)), factory_(std::move(factory)) {}

RemoteIndex::~RemoteIndex() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        if (crawler_) crawler_->cancel();
        crawler_.reset();
    }
    for (auto& worker : workers_) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

Status RemoteIndex::load() {
    auto loaded = load_index_file(store_path_);
    if (loaded.is_err()) return std::move(loaded).error();

    std::lock_guard<std::mutex> lock(mutex_);
    map_ = std::move(loaded).value();
    log::debug("loaded %zu remote index entries from %s", map_.size(), store_path_.c_str());
    return ok_status();
}

std::future<Status> RemoteIndex::rebuild(const std::string& requested_root) {
    // Resolve a relative root against the caller's working directory now
    std::error_code ec;
    fs::path abs = fs::absolute(requested_root, ec);
    std::string root = ec ? requested_root : abs.lexically_normal().string();

    std::shared_ptr<Crawler> crawler;
    if (factory_) crawler = factory_();

    std::promise<Status> promise;
    auto future = promise.get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    reap_workers();
    uint64_t gen = ++generation_;
    if (crawler_) {
        log::debug("superseding remote index rebuild (generation %llu)",
                   static_cast<unsigned long long>(gen - 1));
        crawler_->cancel();
    }
    crawler_ = crawler;

    std::set<std::string> unconfirmed;
    for (const auto& entry : map_) unconfirmed.insert(entry.first);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread(
        [this, gen, crawler, root, done, unconfirmed = std::move(unconfirmed),
         promise = std::move(promise)]() mutable {
            auto status = run_rebuild(gen, crawler, root, std::move(unconfirmed));
            // Set before the result is published
            done->store(true);
            promise.set_value(std::move(status));
        });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
    return future;
}

void RemoteIndex::reap_workers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (!it->done->load()) {
            ++it;
            continue;
        }
        if (it->thread.joinable()) it->thread.join();
        it = workers_.erase(it);
    }
}

size_t RemoteIndex::worker_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

Status RemoteIndex::run_rebuild(uint64_t gen, std::shared_ptr<Crawler> crawler,
                                const std::string& root,
                                std::set<std::string> unconfirmed) {
    IndexMap discovered;
    std::mutex discovered_mutex;

    if (!crawler) {
        log::debug("no directory crawler available; %s yields no repositories", root.c_str());
        return commit(gen, discovered, unconfirmed);
    }

    std::deque<std::future<void>> probes;
    auto probe = [&](const std::string& repo_root) {
        auto out = git_.remote_verbose(repo_root);
        if (out.is_err()) {
            log::debug("skipping %s: %s", repo_root.c_str(), out.error().message.c_str());
            return;
        }
        auto remotes = extract_canonical_remotes(out.value());
        std::lock_guard<std::mutex> lock(discovered_mutex);
        for (const auto& remote : remotes) {
            discovered[remote] = repo_root;
            unconfirmed.erase(remote);
        }
    };

    auto status = crawler->search(root, [&](const std::string& repo_root) {
        if (probes.size() >= kMaxConcurrentProbes) {
            probes.front().wait();
            probes.pop_front();
        }
        probes.push_back(std::async(std::launch::async, probe, repo_root));
    });
    for (auto& p : probes) p.wait();

    if (status.is_err()) {
        if (status.error().code != WharfError::Canceled) {
            log::warn("remote index crawl of %s failed: %s",
                      root.c_str(), status.error().message.c_str());
        }
        return std::move(status).error();
    }
    return commit(gen, discovered, unconfirmed);
}

Status RemoteIndex::commit(uint64_t gen, const IndexMap& discovered,
                           const std::set<std::string>& unconfirmed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (gen != generation_) {
        return WharfError{WharfError::Canceled,
            "remote index rebuild superseded by a newer one"};
    }

    IndexMap next = map_;
    for (const auto& [remote, path] : discovered) {
        next[remote] = path;
    }
    for (const auto& remote : unconfirmed) {
        next.erase(remote);
    }

    WHARF_TRY(save_index_file(store_path_, next));

    log::info("remote index: %zu discovered, %zu evicted, %zu total",
              discovered.size(), unconfirmed.size(), next.size());
    map_ = std::move(next);
    crawler_.reset();
    return ok_status();
}

std::optional<std::string> RemoteIndex::resolve_remote(const std::string& canonical) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(canonical);
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::pair<std::string, std::string>> RemoteIndex::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::pair<std::string, std::string>>(map_.begin(), map_.end());
}

uint64_t RemoteIndex::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace wharf
