#include <wharf/terminal_prompter.hpp>

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace wharf {

TerminalPrompter::TerminalPrompter(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

std::optional<size_t> TerminalPrompter::present(const std::vector<PickItem>& items,
                                                const std::string& placeholder) {
    out_ << placeholder << "\n";
    for (size_t i = 0; i < items.size(); ++i) {
        out_ << "  " << (i + 1) << ") " << items[i].label;
        if (!items[i].detail.empty()) out_ << "  " << items[i].detail;
        out_ << "\n";
    }

    while (true) {
        out_ << "choice [1-" << items.size() << ", empty to cancel]: " << std::flush;

        std::string line;
        if (!std::getline(in_, line)) return std::nullopt;

        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos) return std::nullopt;
        size_t end = line.find_last_not_of(" \t\r");
        line = line.substr(start, end - start + 1);

        size_t pos = 0;
        unsigned long n = 0;
        try {
            n = std::stoul(line, &pos);
        } catch (const std::exception&) {
            pos = 0;
        }
        if (pos == line.size() && n >= 1 && n <= items.size()) {
            return static_cast<size_t>(n - 1);
        }
        out_ << "invalid choice '" << line << "'\n";
    }
}

} // namespace wharf
