#pragma once

#include <wharf/prompter.hpp>

#include <iosfwd>

namespace wharf {

// Numbered list on `out`, answer read as a line from `in`.
// An empty line or end of input dismisses the prompt.
class TerminalPrompter : public Prompter {
public:
    TerminalPrompter(std::istream& in, std::ostream& out);

    std::optional<size_t> present(const std::vector<PickItem>& items,
                                  const std::string& placeholder) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace wharf
