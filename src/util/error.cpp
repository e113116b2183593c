#include <wharf/error.hpp>

namespace wharf {

const char* WharfError::code_name(Code c) {
    switch (c) {
        case IO:                return "IO";
        case Parse:             return "Parse";
        case Config:            return "Config";
        case InvalidArg:        return "InvalidArg";
        case NotFound:          return "NotFound";
        case Git:               return "Git";
        case Timeout:           return "Timeout";
        case Canceled:          return "Canceled";
        case NotARepository:    return "NotARepository";
        case RemoteRefNotFound: return "RemoteRefNotFound";
        case NoSelection:       return "NoSelection";
        case StashFailed:       return "StashFailed";
        case CloneFailed:       return "CloneFailed";
        case NonFastForward:    return "NonFastForward";
    }
    return "Unknown";
}

WharfError WharfError::with_context(const std::string& context) const {
    WharfError e = *this;
    e.message = context + ": " + message;
    return e;
}

std::string WharfError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace wharf
