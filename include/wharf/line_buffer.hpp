#pragma once

#include <optional>
#include <string>
#include <vector>

namespace wharf {

// Reassembles line-oriented output that arrives in arbitrary-sized chunks.
// Complete lines are returned as soon as their terminator is seen; the
// trailing partial line is held back until more data or flush().
class LineBuffer {
public:
    std::vector<std::string> append(const char* data, size_t size);
    std::vector<std::string> append(const std::string& chunk) {
        return append(chunk.data(), chunk.size());
    }

    // Remaining partial line at end of stream, if any
    std::optional<std::string> flush();

    bool empty() const { return pending_.empty(); }

private:
    std::string pending_;
};

} // namespace wharf
