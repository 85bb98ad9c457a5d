#pragma once

#include <kiln/result.hpp>
#include <kiln/compiler.hpp>
#include <kiln/dep_cache.hpp>
#include <kiln/stub.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

struct ManifestConfig {
    std::string file = "Cargo.toml";
    std::string lock = "Cargo.lock";
};

struct ToolchainConfig {
    std::vector<std::string> command;           // empty: cargo build --release
    std::map<std::string, std::string> env;
    std::string output;                         // empty: the command's default
    std::string profile = "release";
    int timeout = 0;                            // seconds, 0 waits forever
};

struct StubConfig {
    std::string profile = "rust";
    std::vector<StubFile> files;                // [[stub.files]] override
};

constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;
// Largest age limit whose value in seconds fits an int64_t
constexpr int64_t MAX_AGE_DAYS = INT64_MAX / SECONDS_PER_DAY;

struct CacheConfig {
    std::string root;                           // empty: ~/.kiln/cache
    std::string salt;
    std::vector<std::string> volatile_files;
    int64_t max_entries = 0;
    int64_t max_bytes = 0;
    int64_t max_age_days = 0;
};

struct ReconcileConfig {
    std::string strategy = "timestamp";
    std::vector<std::string> paths;
    std::vector<std::string> invalidate;
};

struct SourceConfig {
    std::vector<std::string> exclude = {"target", ".git", ".kiln"};
};

struct LogConfig {
    std::string level = "info";
    std::string color = "auto";                 // auto, always, never
};

// Layered configuration: global (~/.kiln/config.toml) -> project (kiln.toml)
// -> command line. Later layers override only the fields they set.
struct Config {
    ManifestConfig manifest;
    ToolchainConfig toolchain;
    StubConfig stub;
    CacheConfig cache;
    ReconcileConfig reconcile;
    SourceConfig source;
    LogConfig log;

    // Track which fields were explicitly set (for merge)
    bool manifest_file_set = false;
    bool manifest_lock_set = false;
    bool toolchain_command_set = false;
    bool toolchain_output_set = false;
    bool toolchain_profile_set = false;
    bool toolchain_timeout_set = false;
    bool stub_profile_set = false;
    bool stub_files_set = false;
    bool cache_root_set = false;
    bool cache_salt_set = false;
    bool cache_volatile_set = false;
    bool cache_max_entries_set = false;
    bool cache_max_bytes_set = false;
    bool cache_max_age_set = false;
    bool reconcile_strategy_set = false;
    bool reconcile_paths_set = false;
    bool reconcile_invalidate_set = false;
    bool source_exclude_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file (global or project-level)
    static Result<Config> load(const std::string& path);

    // Parse from TOML string. `origin` names the file in errors.
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& origin = "");

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> command line
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& cli);

    CommandSpec command_spec() const;
    EvictionPolicy eviction_policy() const;
    std::string cache_root() const;
};

// Discover the global config file path: ~/.kiln/config.toml
std::string global_config_path();

} // namespace kiln
