#include <kiln/config.hpp>
#include <kiln/log.hpp>
#include <kiln/reconcile.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace kiln {

static KilnError config_error(const std::string& msg, const std::string& origin,
                              const toml::node* node = nullptr) {
    int line = node ? static_cast<int>(node->source().begin.line) : 0;
    return KilnError{KilnError::Config, msg, "", origin, line};
}

template<typename T>
static Status read_value(const toml::table& tbl, const char* section, const char* key,
                         const char* expected, const std::string& origin,
                         T& out, bool& set) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<T>();
    if (!v) {
        return config_error(std::string(section) + "." + key + " must be " + expected,
                            origin, node);
    }
    out = *v;
    set = true;
    return ok_status();
}

static Status read_string_list(const toml::table& tbl, const char* section, const char* key,
                               const std::string& origin,
                               std::vector<std::string>& out, bool& set) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    const auto* arr = node->as_array();
    if (!arr) {
        return config_error(std::string(section) + "." + key + " must be an array of strings",
                            origin, node);
    }
    std::vector<std::string> items;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return config_error(std::string(section) + "." + key + " must contain only strings",
                                origin, &elem);
        }
        items.push_back(*s);
    }
    out = std::move(items);
    set = true;
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return KilnError{KilnError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [manifest] section
    if (auto tbl = doc["manifest"].as_table()) {
        KILN_TRY(read_value(*tbl, "manifest", "file", "a string", origin,
                            cfg.manifest.file, cfg.manifest_file_set));
        KILN_TRY(read_value(*tbl, "manifest", "lock", "a string", origin,
                            cfg.manifest.lock, cfg.manifest_lock_set));
    }

    // [toolchain] section
    if (auto tbl = doc["toolchain"].as_table()) {
        KILN_TRY(read_string_list(*tbl, "toolchain", "command", origin,
                                  cfg.toolchain.command, cfg.toolchain_command_set));
        KILN_TRY(read_value(*tbl, "toolchain", "output", "a string", origin,
                            cfg.toolchain.output, cfg.toolchain_output_set));
        KILN_TRY(read_value(*tbl, "toolchain", "profile", "a string", origin,
                            cfg.toolchain.profile, cfg.toolchain_profile_set));
        KILN_TRY(read_value(*tbl, "toolchain", "timeout", "an integer", origin,
                            cfg.toolchain.timeout, cfg.toolchain_timeout_set));
        if (cfg.toolchain.timeout < 0) {
            return config_error("toolchain.timeout must not be negative", origin,
                                tbl->get("timeout"));
        }
        if (auto env = (*tbl)["env"].as_table()) {
            for (const auto& [key, val] : *env) {
                auto s = val.value<std::string>();
                if (!s) {
                    return config_error("toolchain.env." + std::string(key.str()) +
                                        " must be a string", origin, &val);
                }
                cfg.toolchain.env[std::string(key.str())] = *s;
            }
        }
    }

    // [stub] section
    if (auto tbl = doc["stub"].as_table()) {
        KILN_TRY(read_value(*tbl, "stub", "profile", "a string", origin,
                            cfg.stub.profile, cfg.stub_profile_set));
        StubProfile profile;
        if (!parse_stub_profile(cfg.stub.profile, profile)) {
            return config_error("unknown stub profile '" + cfg.stub.profile +
                                "' (expected rust, c, cpp or go)", origin, tbl->get("profile"));
        }
        if (const toml::node* node = tbl->get("files")) {
            const auto* arr = node->as_array();
            if (!arr) {
                return config_error("stub.files must be an array of tables", origin, node);
            }
            for (const auto& elem : *arr) {
                const auto* ft = elem.as_table();
                auto path = ft ? (*ft)["path"].value<std::string>() : std::nullopt;
                if (!path) {
                    return config_error("each [[stub.files]] entry needs a path", origin, &elem);
                }
                StubFile f;
                f.path = *path;
                f.content = (*ft)["content"].value_or(std::string());
                cfg.stub.files.push_back(std::move(f));
            }
            cfg.stub_files_set = true;
        }
    }

    // [cache] section
    if (auto tbl = doc["cache"].as_table()) {
        KILN_TRY(read_value(*tbl, "cache", "root", "a string", origin,
                            cfg.cache.root, cfg.cache_root_set));
        KILN_TRY(read_value(*tbl, "cache", "salt", "a string", origin,
                            cfg.cache.salt, cfg.cache_salt_set));
        KILN_TRY(read_string_list(*tbl, "cache", "volatile", origin,
                                  cfg.cache.volatile_files, cfg.cache_volatile_set));
        KILN_TRY(read_value(*tbl, "cache", "max-entries", "an integer", origin,
                            cfg.cache.max_entries, cfg.cache_max_entries_set));
        KILN_TRY(read_value(*tbl, "cache", "max-bytes", "an integer", origin,
                            cfg.cache.max_bytes, cfg.cache_max_bytes_set));
        KILN_TRY(read_value(*tbl, "cache", "max-age-days", "an integer", origin,
                            cfg.cache.max_age_days, cfg.cache_max_age_set));
        if (cfg.cache.max_entries < 0 || cfg.cache.max_bytes < 0 || cfg.cache.max_age_days < 0) {
            return config_error("cache limits must not be negative", origin);
        }
        if (cfg.cache.max_age_days > MAX_AGE_DAYS) {
            return config_error("cache.max-age-days must be at most " +
                                std::to_string(MAX_AGE_DAYS), origin, tbl->get("max-age-days"));
        }
    }

    // [reconcile] section
    if (auto tbl = doc["reconcile"].as_table()) {
        KILN_TRY(read_value(*tbl, "reconcile", "strategy", "a string", origin,
                            cfg.reconcile.strategy, cfg.reconcile_strategy_set));
        ReconcileStrategy strategy;
        if (!parse_reconcile_strategy(cfg.reconcile.strategy, strategy)) {
            return config_error("unknown reconcile strategy '" + cfg.reconcile.strategy +
                                "' (expected timestamp or invalidate)", origin,
                                tbl->get("strategy"));
        }
        KILN_TRY(read_string_list(*tbl, "reconcile", "paths", origin,
                                  cfg.reconcile.paths, cfg.reconcile_paths_set));
        KILN_TRY(read_string_list(*tbl, "reconcile", "invalidate", origin,
                                  cfg.reconcile.invalidate, cfg.reconcile_invalidate_set));
    }

    // [source] section
    if (auto tbl = doc["source"].as_table()) {
        KILN_TRY(read_string_list(*tbl, "source", "exclude", origin,
                                  cfg.source.exclude, cfg.source_exclude_set));
    }

    // [log] section
    if (auto tbl = doc["log"].as_table()) {
        KILN_TRY(read_value(*tbl, "log", "level", "a string", origin,
                            cfg.log.level, cfg.log_level_set));
        log::Level level;
        if (!log::parse_level(cfg.log.level, level)) {
            return config_error("unknown log level '" + cfg.log.level + "'", origin,
                                tbl->get("level"));
        }
        KILN_TRY(read_value(*tbl, "log", "color", "a string", origin,
                            cfg.log.color, cfg.log_color_set));
        if (cfg.log.color != "auto" && cfg.log.color != "always" && cfg.log.color != "never") {
            return config_error("log.color must be auto, always or never", origin,
                                tbl->get("color"));
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return KilnError{KilnError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.manifest_file_set) {
        manifest.file = other.manifest.file;
        manifest_file_set = true;
    }
    if (other.manifest_lock_set) {
        manifest.lock = other.manifest.lock;
        manifest_lock_set = true;
    }

    if (other.toolchain_command_set) {
        toolchain.command = other.toolchain.command;
        toolchain_command_set = true;
    }
    if (other.toolchain_output_set) {
        toolchain.output = other.toolchain.output;
        toolchain_output_set = true;
    }
    if (other.toolchain_profile_set) {
        toolchain.profile = other.toolchain.profile;
        toolchain_profile_set = true;
    }
    if (other.toolchain_timeout_set) {
        toolchain.timeout = other.toolchain.timeout;
        toolchain_timeout_set = true;
    }
    // Environment: other overrides this per variable
    for (const auto& [k, v] : other.toolchain.env) {
        toolchain.env[k] = v;
    }

    if (other.stub_profile_set) {
        stub.profile = other.stub.profile;
        stub_profile_set = true;
    }
    if (other.stub_files_set) {
        stub.files = other.stub.files;
        stub_files_set = true;
    }

    if (other.cache_root_set) {
        cache.root = other.cache.root;
        cache_root_set = true;
    }
    if (other.cache_salt_set) {
        cache.salt = other.cache.salt;
        cache_salt_set = true;
    }
    if (other.cache_volatile_set) {
        cache.volatile_files = other.cache.volatile_files;
        cache_volatile_set = true;
    }
    if (other.cache_max_entries_set) {
        cache.max_entries = other.cache.max_entries;
        cache_max_entries_set = true;
    }
    if (other.cache_max_bytes_set) {
        cache.max_bytes = other.cache.max_bytes;
        cache_max_bytes_set = true;
    }
    if (other.cache_max_age_set) {
        cache.max_age_days = other.cache.max_age_days;
        cache_max_age_set = true;
    }

    if (other.reconcile_strategy_set) {
        reconcile.strategy = other.reconcile.strategy;
        reconcile_strategy_set = true;
    }
    if (other.reconcile_paths_set) {
        reconcile.paths = other.reconcile.paths;
        reconcile_paths_set = true;
    }
    if (other.reconcile_invalidate_set) {
        reconcile.invalidate = other.reconcile.invalidate;
        reconcile_invalidate_set = true;
    }

    if (other.source_exclude_set) {
        source.exclude = other.source.exclude;
        source_exclude_set = true;
    }

    if (other.log_level_set) {
        log.level = other.log.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log.color = other.log.color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& cli) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (cli.has_value()) result.merge(cli.value());
    return result;
}

CommandSpec Config::command_spec() const {
    CommandSpec spec = CommandSpec::cargo_release();
    if (!toolchain.command.empty()) spec.argv = toolchain.command;
    if (!toolchain.output.empty()) spec.output = toolchain.output;
    spec.env = toolchain.env;
    spec.timeout_seconds = toolchain.timeout;
    return spec;
}

EvictionPolicy Config::eviction_policy() const {
    EvictionPolicy policy;
    policy.max_entries = cache.max_entries;
    policy.max_bytes = cache.max_bytes;
    policy.max_age_seconds = cache.max_age_days > MAX_AGE_DAYS
        ? INT64_MAX
        : cache.max_age_days * SECONDS_PER_DAY;
    return policy;
}

std::string Config::cache_root() const {
    return cache.root.empty() ? DependencyCache::default_root() : cache.root;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.kiln/config.toml";
}

} // namespace kiln
