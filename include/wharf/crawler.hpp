#pragma once

#include <wharf/process.hpp>
#include <wharf/result.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace wharf {

// Walks a directory tree looking for git working copies
class Crawler {
public:
    using CandidateFn = std::function<void(const std::string& repo_root)>;

    virtual ~Crawler() = default;

    // Blocks until the walk finishes, calling on_candidate for each
    // working-copy root found. Returns Canceled after cancel().
    virtual Status search(const std::string& root, const CandidateFn& on_candidate) = 0;

    // Stop the walk. May be called from any thread, before or during search().
    virtual void cancel() = 0;
};

// Produces a fresh crawler per walk. An empty factory, or one returning
// nullptr, means no crawler exists on this platform.
using CrawlerFactory = std::function<std::unique_ptr<Crawler>()>;

// Crawler driving find(1):
//   find <root> -mindepth 1 -maxdepth N -type d -name .git -print -prune
//        -o ( -name <prune>... ) -prune
class FindCrawler : public Crawler {
public:
    explicit FindCrawler(int max_depth = 10,
                         std::vector<std::string> prune = {".*", "node_modules"});

    // find(1) is not available on Windows
    static bool available();

    static std::vector<std::string> command(const std::string& root, int max_depth,
                                            const std::vector<std::string>& prune);

    Status search(const std::string& root, const CandidateFn& on_candidate) override;
    void cancel() override;

private:
    int max_depth_;
    std::vector<std::string> prune_;
    ChildProcess child_;
};

// FindCrawler factory when find(1) is available, otherwise an empty factory
CrawlerFactory default_crawler_factory(int max_depth, std::vector<std::string> prune);

} // namespace wharf
