#pragma once

#include <string>

namespace wharf {

struct WharfError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        NotFound,
        Git,
        Timeout,
        Canceled,
        NotARepository,
        RemoteRefNotFound,
        NoSelection,
        StashFailed,
        CloneFailed,
        NonFastForward
    };

    Code code = IO;
    std::string message;
    std::string hint;

    WharfError() = default;
    WharfError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    WharfError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Same error with `context: ` prepended to the message
    WharfError with_context(const std::string& context) const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace wharf
