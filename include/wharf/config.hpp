#pragma once

#include <wharf/log.hpp>
#include <wharf/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace wharf {

// Where clones created by wharf go
struct FoldersConfig {
    std::string path = "${homePath}${separator}src${separator}${folderRelativePath}";
};

// Background discovery of existing clones
struct ScanConfig {
    std::string directory;   // empty = no background discovery
    int max_depth = 10;
    std::vector<std::string> prune = {".*", "node_modules"};
};

struct IndexConfig {
    std::string file = "${homePath}/.wharf/remotes.toml";
};

// Layered configuration: global > local
// Later layers override only the keys they set
struct Config {
    FoldersConfig folders;
    ScanConfig scan;
    IndexConfig index;
    int git_timeout = 300;
    bool auto_select_workspace_roots = true;
    log::Level log_level = log::Info;

    // Track which fields were explicitly set (for merge)
    bool folders_path_set = false;
    bool scan_directory_set = false;
    bool scan_max_depth_set = false;
    bool scan_prune_set = false;
    bool index_file_set = false;
    bool git_timeout_set = false;
    bool auto_select_set = false;
    bool log_level_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // scan.directory with ${homePath}/${separator} expanded; "" when unset
    Result<std::string> expanded_scan_directory() const;

    // index.file with ${homePath}/${separator} expanded
    Result<std::string> expanded_index_file() const;
};

// Discover the global config file path: ~/.wharf/config.toml
std::string global_config_path();

} // namespace wharf
