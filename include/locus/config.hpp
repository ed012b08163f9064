#pragma once

#include <locus/result.hpp>
#include <locus/log.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace locus {

// Default minimum spacing between two filesystem existence probes
constexpr std::chrono::milliseconds kDefaultProbeInterval{100};

// Layered configuration: global > local
// Lower layers override higher layers (local wins over global)
struct Config {
    // Path prefixes never reported as local paths (network mounts etc.)
    std::vector<std::string> ignored_prefixes;
    std::chrono::milliseconds probe_interval = kDefaultProbeInterval;
    std::optional<log::Level> log_level;

    // Track which fields were explicitly set (for merge)
    bool ignored_prefixes_set = false;
    bool probe_interval_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Apply LOCUS_PATHS_TO_IGNORE on top of the file settings
    void apply_env();

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// Split a comma-separated prefix setting. Entries are trimmed and empty
// entries dropped, so "" yields an empty list.
std::vector<std::string> split_prefix_list(const std::string& csv);

// Discover the global config file path: ~/.locus/config.toml
std::string global_config_path();

// Global config (if present), then `local_path` (if non-empty), then env.
// A missing global file is not an error; a missing local file is.
Result<Config> load_effective_config(const std::string& local_path);

} // namespace locus
