#include <wharf/remote.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace wharf {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Percent-decoding; a malformed escape makes the whole URL unparseable
static std::optional<std::string> percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') {
            out.push_back(s[i]);
            continue;
        }
        if (i + 2 >= s.size()) return std::nullopt;
        int hi = hex_value(s[i + 1]);
        int lo = hex_value(s[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

static bool valid_scheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

// scp-like syntax: [user@]host:path, where path does not start with '/'
static bool rewrite_scp(std::string& url) {
    if (url.find("://") != std::string::npos) return false;

    auto colon = url.find(':');
    if (colon == std::string::npos || colon + 1 >= url.size()) return false;
    if (url[colon + 1] == '/') return false;

    std::string prefix = url.substr(0, colon);
    if (prefix.find('/') != std::string::npos) return false;

    std::string user;
    std::string host = prefix;
    auto at = prefix.find('@');
    if (at != std::string::npos) {
        user = prefix.substr(0, at + 1);
        host = prefix.substr(at + 1);
        if (user.size() == 1 || user.find_first_of(":/") != std::string::npos) {
            return false;
        }
    }
    if (host.empty() || host.find('@') != std::string::npos) return false;

    url = "ssh://" + user + host + "/" + url.substr(colon + 1);
    return true;
}

static bool ends_with_ci(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    return to_lower(s.substr(s.size() - suffix.size())) == suffix;
}

// ---------------------------------------------------------------------------
// canonical_remote
// ---------------------------------------------------------------------------

std::optional<std::string> canonical_remote(const std::string& remote) {
    auto decoded = percent_decode(remote);
    if (!decoded || decoded->empty()) return std::nullopt;

    std::string url = *decoded;
    if (std::any_of(url.begin(), url.end(),
                    [](unsigned char c) { return std::isspace(c); })) {
        return std::nullopt;
    }

    rewrite_scp(url);

    std::string authority;
    std::string path;

    auto scheme_end = url.find("://");
    if (scheme_end != std::string::npos) {
        if (!valid_scheme(url.substr(0, scheme_end))) return std::nullopt;
        std::string rest = url.substr(scheme_end + 3);
        auto slash = rest.find('/');
        authority = rest.substr(0, slash);
        path = slash == std::string::npos ? "" : rest.substr(slash);
    } else if (url[0] == '/') {
        path = url;
    } else {
        // Scheme-less "host/path"
        auto slash = url.find('/');
        authority = url.substr(0, slash);
        path = slash == std::string::npos ? "" : url.substr(slash);
    }

    auto query = path.find_first_of("?#");
    if (query != std::string::npos) path.erase(query);

    auto at = authority.find('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    while (!path.empty() && path.back() == '/') path.pop_back();
    for (const char* suffix : {".git", ".hg", ".svn"}) {
        if (ends_with_ci(path, suffix)) {
            path.erase(path.size() - std::string(suffix).size());
            break;
        }
    }
    while (!path.empty() && path.back() == '/') path.pop_back();

    std::string canonical = to_lower(authority) + to_lower(path);
    if (canonical.empty()) return std::nullopt;
    return canonical;
}

bool is_absolute_commit_id(const std::string& revision) {
    return revision.size() == 40 &&
        std::all_of(revision.begin(), revision.end(),
                    [](char c) { return hex_value(c) >= 0; });
}

std::vector<std::string> extract_canonical_remotes(const std::string& remote_verbose) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    std::istringstream stream(remote_verbose);
    std::string line;

    // "<name>\t<url> (fetch)"
    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string name, url;
        if (!(fields >> name >> url)) continue;

        auto canonical = canonical_remote(url);
        if (!canonical) continue;
        if (seen.insert(*canonical).second) {
            result.push_back(std::move(*canonical));
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// RemoteLocator
// ---------------------------------------------------------------------------

std::string RemoteLocator::display() const {
    return canonical + "@" + (revision ? *revision : std::string("HEAD"));
}

Result<RemoteLocator> RemoteLocator::make(const std::string& clone_url,
                                          std::optional<std::string> revision) {
    auto canonical = canonical_remote(clone_url);
    if (!canonical) {
        return WharfError{WharfError::InvalidArg,
            "Invalid git clone URL " + clone_url};
    }
    if (revision && revision->empty()) revision.reset();

    RemoteLocator loc;
    loc.clone_url = clone_url;
    loc.canonical = std::move(*canonical);
    loc.revision = std::move(revision);
    return Result<RemoteLocator>::ok(std::move(loc));
}

Result<RemoteLocator> RemoteLocator::parse(const std::string& resource) {
    std::string url = resource;
    std::optional<std::string> revision;

    auto q = url.find('?');
    if (q != std::string::npos) {
        revision = url.substr(q + 1);
        url.erase(q);
    }

    if (url.compare(0, 4, "git+") == 0) {
        url.erase(0, 4);
    }

    return make(url, std::move(revision));
}

} // namespace wharf
