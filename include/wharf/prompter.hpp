#pragma once

#include <wharf/repository.hpp>
#include <wharf/result.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wharf {

struct PickItem {
    std::string label;
    std::string detail;
};

// Front end that asks the user to choose among items
class Prompter {
public:
    virtual ~Prompter() = default;

    // Index of the chosen item, or nullopt when the prompt was dismissed
    virtual std::optional<size_t> present(const std::vector<PickItem>& items,
                                          const std::string& placeholder) = 0;
};

struct PickOptions {
    std::string placeholder;
    // Narrow to candidates that are workspace roots; a single one left is
    // returned without prompting
    bool auto_select_workspace_roots = false;
};

// Choose one of `candidates` (non-empty). NoSelection when dismissed.
Result<Repository> pick_repository(Prompter& prompter,
                                   const std::vector<Repository>& candidates,
                                   const std::vector<std::string>& workspace_roots,
                                   const PickOptions& options);

} // namespace wharf
