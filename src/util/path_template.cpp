#include <wharf/path_template.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace wharf {

namespace fs = std::filesystem;

// Build a hint listing available variable names
static std::string available_vars_hint(const TemplateVars& vars) {
    if (vars.empty()) return "no variables defined";
    std::vector<std::string> keys;
    keys.reserve(vars.size());
    for (const auto& kv : vars) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());

    std::string hint = "available variables: ";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) hint += ", ";
        hint += keys[i];
    }
    return hint;
}

Result<std::string> expand_template(const std::string& tmpl, const TemplateVars& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;

    while (i < tmpl.size()) {
        // Escaped opening: $${
        if (tmpl.compare(i, 3, "$${") == 0) {
            out += "${";
            i += 3;
            continue;
        }

        if (tmpl.compare(i, 2, "${") == 0) {
            size_t start = i + 2;
            size_t end = tmpl.find('}', start);
            if (end == std::string::npos) {
                return WharfError(WharfError::Parse,
                    "unclosed '${' in template at position " + std::to_string(i));
            }

            std::string varname = tmpl.substr(start, end - start);
            if (varname.empty()) {
                return WharfError(WharfError::Parse,
                    "empty variable name in template at position " + std::to_string(i));
            }

            auto it = vars.find(varname);
            if (it == vars.end()) {
                return WharfError(WharfError::NotFound,
                    "undefined variable '" + varname + "' in template",
                    available_vars_hint(vars));
            }

            out += it->second;
            i = end + 1;
            continue;
        }

        out.push_back(tmpl[i]);
        i++;
    }

    return Result<std::string>::ok(std::move(out));
}

std::string expand_template_lenient(const std::string& tmpl, const TemplateVars& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;

    while (i < tmpl.size()) {
        if (tmpl.compare(i, 3, "$${") == 0) {
            out += "${";
            i += 3;
            continue;
        }

        if (tmpl.compare(i, 2, "${") == 0) {
            size_t end = tmpl.find('}', i + 2);
            if (end == std::string::npos) {
                out += "${";
                i += 2;
                continue;
            }

            auto it = vars.find(tmpl.substr(i + 2, end - i - 2));
            if (it == vars.end()) {
                out += tmpl.substr(i, end + 1 - i);
            } else {
                out += it->second;
            }
            i = end + 1;
            continue;
        }

        out.push_back(tmpl[i]);
        i++;
    }

    return out;
}

TemplateVars default_path_vars() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";

    TemplateVars vars;
    vars["homePath"] = home;
    vars["separator"] = std::string(1, fs::path::preferred_separator);
    return vars;
}

Result<std::string> expand_clone_path(const std::string& tmpl,
                                      const std::string& canonical_remote) {
    if (canonical_remote.empty()) {
        return WharfError{WharfError::InvalidArg,
            "cannot build a clone path for an empty remote"};
    }

    TemplateVars vars = default_path_vars();
    vars["folderRelativePath"] = canonical_remote;

    auto expanded = expand_template(tmpl, vars);
    if (expanded.is_err()) {
        return expanded.error().with_context("folders.path");
    }

    return Result<std::string>::ok(
        fs::path(expanded.value()).lexically_normal().string());
}

} // namespace wharf
