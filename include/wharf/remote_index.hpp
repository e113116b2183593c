#pragma once

#include <wharf/crawler.hpp>
#include <wharf/git.hpp>
#include <wharf/result.hpp>

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace wharf {

// A source of canonical remote -> local path answers
class RemoteLookup {
public:
    virtual ~RemoteLookup() = default;
    virtual std::optional<std::string> resolve_remote(const std::string& canonical) const = 0;
};

using IndexMap = std::map<std::string, std::string>;

// Persisted index file: [[remotes]] tables with `remote` and `path`.
// A missing file reads as an empty index.
Result<IndexMap> load_index_file(const std::string& path);

// Write to a sibling temporary file, then rename over `path`
Status save_index_file(const std::string& path, const IndexMap& entries);

// Canonical remote -> local path map built by crawling directories.
//
// Each rebuild() takes a new generation and cancels the crawl of the
// previous one. A rebuild commits only if its generation is still the
// newest when it finishes: the discovered entries are merged in, and
// entries known before the rebuild but not seen during it are evicted.
// A superseded or failed rebuild leaves the index untouched.
class RemoteIndex : public RemoteLookup {
public:
    // An empty store_path keeps the index in memory only
    RemoteIndex(GitCli& git, std::string store_path, CrawlerFactory factory);
    ~RemoteIndex() override;

    RemoteIndex(const RemoteIndex&) = delete;
    RemoteIndex& operator=(const RemoteIndex&) = delete;

    // Replace the in-memory map with the persisted one
    Status load();

    // Crawl `root` in the background. The future yields OK once the result
    // is committed, Canceled if a newer rebuild superseded this one, or
    // the crawl error.
    std::future<Status> rebuild(const std::string& root);

    // Pure lookup; the path is not re-validated
    std::optional<std::string> resolve_remote(const std::string& canonical) const override;

    // Persisted pairs sorted by remote
    std::vector<std::pair<std::string, std::string>> entries() const;

    uint64_t generation() const;
    const std::string& store_path() const { return store_path_; }

    // Rebuild threads not yet joined. Finished ones are joined by the
    // next rebuild().
    size_t worker_count() const;

private:
    GitCli& git_;
    std::string store_path_;
    CrawlerFactory factory_;

    mutable std::mutex mutex_;
    IndexMap map_;
    uint64_t generation_ = 0;
    std::shared_ptr<Crawler> crawler_;   // crawler of the newest generation
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::vector<Worker> workers_;

    // Join workers that have finished. Requires mutex_.
    void reap_workers();

    Status run_rebuild(uint64_t gen, std::shared_ptr<Crawler> crawler,
                       const std::string& root, std::set<std::string> unconfirmed);

    // Compare-and-commit: applies only while `gen` is the newest generation
    Status commit(uint64_t gen, const IndexMap& discovered,
                  const std::set<std::string>& unconfirmed);
};

} // namespace wharf
