#include <wharf/line_buffer.hpp>

namespace wharf {

static void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

std::vector<std::string> LineBuffer::append(const char* data, size_t size) {
    std::vector<std::string> lines;
    size_t begin = 0;

    for (size_t i = 0; i < size; ++i) {
        if (data[i] != '\n') continue;

        std::string line = std::move(pending_);
        pending_.clear();
        line.append(data + begin, i - begin);
        strip_cr(line);
        lines.push_back(std::move(line));
        begin = i + 1;
    }

    pending_.append(data + begin, size - begin);
    return lines;
}

std::optional<std::string> LineBuffer::flush() {
    if (pending_.empty()) return std::nullopt;
    std::string line = std::move(pending_);
    pending_.clear();
    strip_cr(line);
    return line;
}

} // namespace wharf
