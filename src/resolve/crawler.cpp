#include <wharf/crawler.hpp>
#include <wharf/line_buffer.hpp>
#include <wharf/log.hpp>

#include <filesystem>

namespace wharf {

namespace fs = std::filesystem;

FindCrawler::FindCrawler(int max_depth, std::vector<std::string> prune)
    : max_depth_(max_depth), prune_(std::move(prune)) {}

bool FindCrawler::available() {
#ifdef _WIN32
    return false;
#else
    return true;
#endif
}

std::vector<std::string> FindCrawler::command(const std::string& root, int max_depth,
                                              const std::vector<std::string>& prune) {
    // -mindepth 1 keeps the root itself out of the prune tests
    std::vector<std::string> args = {
        "find", root,
        "-mindepth", "1",
        "-maxdepth", std::to_string(max_depth),
        "-type", "d", "-name", ".git", "-print", "-prune",
    };
    if (!prune.empty()) {
        args.push_back("-o");
        args.push_back("(");
        for (size_t i = 0; i < prune.size(); ++i) {
            if (i > 0) args.push_back("-o");
            args.push_back("-name");
            args.push_back(prune[i]);
        }
        args.push_back(")");
        args.push_back("-prune");
    }
    return args;
}

// Absolute, so reported paths do not depend on the working directory
static std::string absolute_root(const std::string& root) {
    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    if (ec) return root;
    fs::path resolved = fs::weakly_canonical(abs, ec);
    if (ec) return abs.lexically_normal().string();
    return resolved.string();
}

Status FindCrawler::search(const std::string& requested_root, const CandidateFn& on_candidate) {
    std::string root = absolute_root(requested_root);
    log::debug("crawling %s (max depth %d)", root.c_str(), max_depth_);
    WHARF_TRY(child_.start(command(root, max_depth_, prune_), root));

    LineBuffer lines;
    size_t found = 0;
    auto emit = [&](const std::string& line) {
        if (line.empty() || child_.killed()) return;
        ++found;
        on_candidate(fs::path(line).parent_path().string());
    };

    auto exit_code = child_.pump([&](const char* data, size_t size) {
        for (const auto& line : lines.append(data, size)) {
            emit(line);
        }
    });
    if (exit_code.is_err()) return std::move(exit_code).error();

    if (auto rest = lines.flush()) {
        emit(*rest);
    }

    if (child_.killed()) {
        return WharfError{WharfError::Canceled, "crawl of " + root + " canceled"};
    }
    if (exit_code.value() != 0) {
        return WharfError{WharfError::IO,
            "find failed with exit code " + std::to_string(exit_code.value()) +
            " while crawling " + root};
    }

    log::debug("crawl of %s found %zu repositories", root.c_str(), found);
    return ok_status();
}

void FindCrawler::cancel() {
    child_.kill();
}

CrawlerFactory default_crawler_factory(int max_depth, std::vector<std::string> prune) {
    if (!FindCrawler::available()) return {};
    return [max_depth, prune]() -> std::unique_ptr<Crawler> {
        return std::make_unique<FindCrawler>(max_depth, prune);
    };
}

} // namespace wharf
