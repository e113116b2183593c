#include <wharf/prompter.hpp>
#include <wharf/log.hpp>

#include <algorithm>
#include <filesystem>

namespace wharf {

namespace fs = std::filesystem;

static std::string same_path_key(const std::string& path) {
    std::error_code ec;
    auto p = fs::weakly_canonical(fs::path(path), ec);
    std::string s = ec ? fs::path(path).lexically_normal().string() : p.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

Result<Repository> pick_repository(Prompter& prompter,
                                   const std::vector<Repository>& candidates,
                                   const std::vector<std::string>& workspace_roots,
                                   const PickOptions& options) {
    if (candidates.empty()) {
        return WharfError{WharfError::InvalidArg, "no repositories to choose from"};
    }

    std::vector<Repository> choices = candidates;

    if (options.auto_select_workspace_roots) {
        std::vector<std::string> roots;
        for (const auto& r : workspace_roots) roots.push_back(same_path_key(r));

        std::vector<Repository> in_workspace;
        for (const auto& repo : choices) {
            if (std::find(roots.begin(), roots.end(), same_path_key(repo.root())) != roots.end()) {
                in_workspace.push_back(repo);
            }
        }
        if (!in_workspace.empty()) choices = std::move(in_workspace);

        if (choices.size() == 1) {
            log::info("automatically picked %s for prompt \"%s\"",
                      choices[0].root().c_str(), options.placeholder.c_str());
            return Result<Repository>::ok(choices[0]);
        }
    }

    std::vector<PickItem> items;
    items.reserve(choices.size());
    for (const auto& repo : choices) {
        items.push_back(PickItem{fs::path(repo.root()).filename().string(), repo.root()});
    }

    auto picked = prompter.present(items, options.placeholder);
    if (!picked) {
        return WharfError{WharfError::NoSelection, "no repository selected"};
    }
    if (*picked >= choices.size()) {
        return WharfError{WharfError::InvalidArg,
            "selection " + std::to_string(*picked) + " out of range"};
    }

    log::info("user picked %s for prompt \"%s\"",
              choices[*picked].root().c_str(), options.placeholder.c_str());
    return Result<Repository>::ok(choices[*picked]);
}

} // namespace wharf
