#include <wharf/config.hpp>
#include <wharf/path_template.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace wharf {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return WharfError{WharfError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [folders] section
    if (auto folders = doc["folders"].as_table()) {
        if (auto v = (*folders)["path"].value<std::string>()) {
            cfg.folders.path = *v;
            cfg.folders_path_set = true;
        }
    }

    // [scan] section
    if (auto scan = doc["scan"].as_table()) {
        if (auto v = (*scan)["directory"].value<std::string>()) {
            cfg.scan.directory = *v;
            cfg.scan_directory_set = true;
        }
        if (auto v = (*scan)["max-depth"].value<int64_t>()) {
            if (*v < 1) {
                return WharfError{WharfError::Config,
                    "scan.max-depth must be at least 1, got " + std::to_string(*v)};
            }
            cfg.scan.max_depth = static_cast<int>(*v);
            cfg.scan_max_depth_set = true;
        }
        if (auto prune = (*scan)["prune"].as_array()) {
            cfg.scan.prune.clear();
            for (const auto& item : *prune) {
                auto s = item.value<std::string>();
                if (!s) {
                    return WharfError{WharfError::Config,
                        "scan.prune must be an array of strings"};
                }
                cfg.scan.prune.push_back(*s);
            }
            cfg.scan_prune_set = true;
        }
    }

    // [index] section
    if (auto index = doc["index"].as_table()) {
        if (auto v = (*index)["file"].value<std::string>()) {
            cfg.index.file = *v;
            cfg.index_file_set = true;
        }
    }

    // [git] section
    if (auto git = doc["git"].as_table()) {
        if (auto v = (*git)["timeout"].value<int64_t>()) {
            if (*v <= 0) {
                return WharfError{WharfError::Config,
                    "git.timeout must be positive, got " + std::to_string(*v)};
            }
            cfg.git_timeout = static_cast<int>(*v);
            cfg.git_timeout_set = true;
        }
    }

    // [resolve] section
    if (auto resolve = doc["resolve"].as_table()) {
        if (auto v = (*resolve)["auto-select-workspace-roots"].value<bool>()) {
            cfg.auto_select_workspace_roots = *v;
            cfg.auto_select_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return WharfError{WharfError::Config,
                    "unknown log level '" + *v + "'",
                    "use one of trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return WharfError{WharfError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) return cfg.error().with_context(path);
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.folders_path_set) {
        folders.path = other.folders.path;
        folders_path_set = true;
    }
    if (other.scan_directory_set) {
        scan.directory = other.scan.directory;
        scan_directory_set = true;
    }
    if (other.scan_max_depth_set) {
        scan.max_depth = other.scan.max_depth;
        scan_max_depth_set = true;
    }
    if (other.scan_prune_set) {
        scan.prune = other.scan.prune;
        scan_prune_set = true;
    }
    if (other.index_file_set) {
        index.file = other.index.file;
        index_file_set = true;
    }
    if (other.git_timeout_set) {
        git_timeout = other.git_timeout;
        git_timeout_set = true;
    }
    if (other.auto_select_set) {
        auto_select_workspace_roots = other.auto_select_workspace_roots;
        auto_select_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

Result<std::string> Config::expanded_scan_directory() const {
    if (scan.directory.empty()) return Result<std::string>::ok("");
    auto r = expand_template(scan.directory, default_path_vars());
    if (r.is_err()) return r.error().with_context("scan.directory");
    return r;
}

Result<std::string> Config::expanded_index_file() const {
    auto r = expand_template(index.file, default_path_vars());
    if (r.is_err()) return r.error().with_context("index.file");
    return r;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.wharf/config.toml";
}

} // namespace wharf
