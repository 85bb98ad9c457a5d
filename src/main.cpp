// kiln: builds a project in two phases so that compiled dependencies are
// reused for as long as the resolved dependency lock stays the same.
//
//     kiln build [-C dir] [-o out] [--work dir] [--cache dir] [-v|-q]
//     kiln fingerprint [-C dir] [--explain]
//     kiln stub [-C dir] [--write dir]
//     kiln cache list|stats|clear [--cache dir]
//     kiln cache evict [--max-entries N] [--max-bytes N] [--max-age-days N]
//     kiln cache remove <fingerprint>
//
// Exit status: 0 success, 1 build or usage error, 2 malformed manifest.

#include <kiln/compiler.hpp>
#include <kiln/config.hpp>
#include <kiln/dep_cache.hpp>
#include <kiln/fingerprint.hpp>
#include <kiln/log.hpp>
#include <kiln/manifest.hpp>
#include <kiln/orchestrator.hpp>
#include <kiln/result.hpp>
#include <kiln/stub.hpp>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace kiln;

static const char* USAGE =
    "usage: kiln <command> [options]\n"
    "\n"
    "commands:\n"
    "  build                 build the project, reusing cached dependencies\n"
    "  fingerprint           print the dependency fingerprint\n"
    "  stub                  print (or write) the placeholder sources\n"
    "  cache list            list cached dependency builds\n"
    "  cache stats           summarize the cache\n"
    "  cache clear           remove every cache entry\n"
    "  cache evict           remove least recently used entries\n"
    "  cache remove <fp>     remove one entry\n"
    "\n"
    "options:\n"
    "  -C <dir>              project directory (default .)\n"
    "  -s, --source <dir>    real source tree (default: project directory)\n"
    "  -o, --output <path>   where to put the built binary\n"
    "  --work <dir>          scratch directory (default <project>/.kiln/work)\n"
    "  --cache <dir>         cache root (default ~/.kiln/cache)\n"
    "  --explain             fingerprint: print the hashed text\n"
    "  --write <dir>         stub: write the files under <dir>\n"
    "  --max-entries <n>     evict: keep at most n entries\n"
    "  --max-bytes <n>       evict: keep at most n bytes\n"
    "  --max-age-days <n>    evict: drop entries unused for n days\n"
    "  -v, --verbose         more output (repeat for trace)\n"
    "  -q, --quiet           errors only\n";

struct Options {
    std::string command;
    std::vector<std::string> operands;
    std::string project_dir = ".";
    std::string source_dir;
    std::string output;
    std::string work_dir;
    std::string cache_dir;
    std::string write_dir;
    bool explain = false;
    bool help = false;
    int verbosity = 0;
    std::optional<int64_t> max_entries;
    std::optional<int64_t> max_bytes;
    std::optional<int64_t> max_age_days;
};

static Result<int64_t> parse_count(const std::string& flag, const std::string& text,
                                   int64_t max = INT64_MAX) {
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || v < 0) {
        return KilnError{KilnError::InvalidArg,
            flag + " expects a non-negative integer, got '" + text + "'"};
    }
    if (errno == ERANGE || v > max) {
        return KilnError{KilnError::InvalidArg,
            flag + " must be at most " + std::to_string(max) + ", got '" + text + "'"};
    }
    return Result<int64_t>::ok(static_cast<int64_t>(v));
}

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return KilnError{KilnError::InvalidArg, flag + " needs a value", USAGE};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbosity += 1;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.verbosity = -1;
        } else if (arg == "--explain") {
            opts.explain = true;
        } else if (arg == "-C") {
            KILN_TRY_ASSIGN(v, value(arg));
            opts.project_dir = v;
        } else if (arg == "-s" || arg == "--source") {
            KILN_TRY_ASSIGN(v, value(arg));
            opts.source_dir = v;
        } else if (arg == "-o" || arg == "--output") {
            KILN_TRY_ASSIGN(v, value(arg));
            opts.output = v;
        } else if (arg == "--work") {
            KILN_TRY_ASSIGN(v, value(arg));
            opts.work_dir = v;
        } else if (arg == "--cache") {
            KILN_TRY_ASSIGN(v, value(arg));
            opts.cache_dir = v;
        } else if (arg == "--write") {
            KILN_TRY_ASSIGN(v, value(arg));
            opts.write_dir = v;
        } else if (arg == "--max-entries") {
            KILN_TRY_ASSIGN(v, value(arg));
            KILN_TRY_ASSIGN(n, parse_count(arg, v));
            opts.max_entries = n;
        } else if (arg == "--max-bytes") {
            KILN_TRY_ASSIGN(v, value(arg));
            KILN_TRY_ASSIGN(n, parse_count(arg, v));
            opts.max_bytes = n;
        } else if (arg == "--max-age-days") {
            KILN_TRY_ASSIGN(v, value(arg));
            KILN_TRY_ASSIGN(n, parse_count(arg, v, MAX_AGE_DAYS));
            opts.max_age_days = n;
        } else if (!arg.empty() && arg[0] == '-') {
            return KilnError{KilnError::InvalidArg, "unknown option " + arg, USAGE};
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.operands.push_back(arg);
        }
    }
    return Result<Options>::ok(std::move(opts));
}

// global -> project kiln.toml -> command line
static Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        KILN_TRY_ASSIGN(cfg, Config::load(global_path));
        global = std::move(cfg);
    }

    std::optional<Config> project;
    fs::path project_path = fs::path(opts.project_dir) / "kiln.toml";
    if (fs::exists(project_path, ec)) {
        KILN_TRY_ASSIGN(cfg, Config::load(project_path.string()));
        project = std::move(cfg);
    }

    Config cli;
    if (!opts.cache_dir.empty()) {
        cli.cache.root = opts.cache_dir;
        cli.cache_root_set = true;
    }
    if (opts.verbosity != 0) {
        cli.log.level = opts.verbosity < 0 ? "error" : (opts.verbosity == 1 ? "debug" : "trace");
        cli.log_level_set = true;
    }
    return Result<Config>::ok(Config::effective(global, project, cli));
}

static void apply_log_config(const Config& cfg) {
    log::Level level;
    if (log::parse_level(cfg.log.level, level)) log::set_level(level);
    if (cfg.log.color == "always") log::set_color_enabled(true);
    else if (cfg.log.color == "never") log::set_color_enabled(false);
}

static Result<Manifest> load_manifest(const Options& opts, const Config& cfg) {
    return Manifest::load(opts.project_dir, cfg.manifest.file, cfg.manifest.lock);
}

static CommandCompiler make_compiler(const Config& cfg, const Manifest& manifest) {
    TemplateVars vars{
        {"package", manifest.package.name},
        {"profile", cfg.toolchain.profile},
    };
    return CommandCompiler(cfg.command_spec(), std::move(vars));
}

static Result<DependencyCache> open_cache(const Config& cfg) {
    DependencyCache cache;
    KILN_TRY(cache.open(cfg.cache_root()));
    cache.set_volatile_patterns(cfg.cache.volatile_files);
    return Result<DependencyCache>::ok(std::move(cache));
}

static std::string format_bytes(int64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), u == 0 ? "%.0f %s" : "%.1f %s", v, units[u]);
    return buf;
}

static std::string format_time(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static Status cmd_build(const Options& opts, const Config& cfg) {
    KILN_TRY_ASSIGN(manifest, load_manifest(opts, cfg));
    KILN_TRY_ASSIGN(cache, open_cache(cfg));
    CommandCompiler compiler = make_compiler(cfg, manifest);

    BuildOrchestrator orchestrator(cfg, cache, compiler);
    orchestrator.on_transition([](BuildState, BuildState to) {
        log::trace("entered %s", build_state_name(to));
    });

    BuildRequest request;
    request.project_dir = opts.project_dir;
    request.source_dir = opts.source_dir;
    request.output_path = opts.output;
    request.work_dir = opts.work_dir;

    auto built = orchestrator.build(request);
    if (built.is_err()) {
        const auto& err = built.error();
        if (err.code == KilnError::ApplicationCompile) {
            log::info("cached dependencies for %s remain valid",
                      orchestrator.last_report().fingerprint.short_hex().c_str());
        }
        return err;
    }

    const BuildReport& report = built.value();
    std::printf("fingerprint  %s\n", report.fingerprint.hex.c_str());
    std::printf("dependencies %s\n", report.cache_hit ? "cached" : "built");
    std::printf("output       %s\n", report.output_path.c_str());
    std::printf("sha256       %s\n", report.output_digest.c_str());
    for (const auto& t : report.timings) {
        log::debug("%-18s %.2fs", t.phase.c_str(), t.seconds);
    }
    return ok_status();
}

static Status cmd_fingerprint(const Options& opts, const Config& cfg) {
    KILN_TRY_ASSIGN(manifest, load_manifest(opts, cfg));
    CommandCompiler compiler = make_compiler(cfg, manifest);
    Fingerprinter fingerprinter(BuildOrchestrator::fingerprint_salt(cfg, compiler));

    if (opts.explain) {
        KILN_TRY_ASSIGN(text, fingerprinter.canonical_text(manifest));
        std::fputs(text.c_str(), stdout);
    }
    KILN_TRY_ASSIGN(fp, fingerprinter.fingerprint(manifest));
    std::printf("%s\n", fp.hex.c_str());
    return ok_status();
}

static Status cmd_stub(const Options& opts, const Config& cfg) {
    KILN_TRY_ASSIGN(manifest, load_manifest(opts, cfg));

    StubProfile profile;
    if (!parse_stub_profile(cfg.stub.profile, profile)) {
        return KilnError{KilnError::Config, "unknown stub profile '" + cfg.stub.profile + "'"};
    }
    StubSynthesizer synth(profile);
    if (!cfg.stub.files.empty()) synth.set_override(cfg.stub.files);
    KILN_TRY_ASSIGN(stub, synth.synthesize(manifest));

    if (!opts.write_dir.empty()) {
        KILN_TRY_ASSIGN(written, synth.write(stub, opts.write_dir));
        for (const auto& p : written) std::printf("%s\n", p.c_str());
        return ok_status();
    }
    for (const auto& f : stub.files) {
        std::printf("==> %s <==\n%s", f.path.c_str(), f.content.c_str());
        if (!f.content.empty() && f.content.back() != '\n') std::printf("\n");
    }
    return ok_status();
}

static Status cmd_cache(const Options& opts, const Config& cfg) {
    if (opts.operands.empty()) {
        return KilnError{KilnError::InvalidArg, "cache needs a subcommand", USAGE};
    }
    const std::string& sub = opts.operands[0];
    KILN_TRY_ASSIGN(cache, open_cache(cfg));

    if (sub == "list") {
        KILN_TRY_ASSIGN(entries, cache.list());
        // Most recently used first
        for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
            std::printf("%s  %10s  %6lld files  %4lld hits  %s\n",
                        it->fingerprint.substr(0, 12).c_str(),
                        format_bytes(it->size_bytes).c_str(),
                        static_cast<long long>(it->file_count),
                        static_cast<long long>(it->hit_count),
                        format_time(it->last_used_at).c_str());
        }
        return ok_status();
    }
    if (sub == "stats") {
        KILN_TRY_ASSIGN(s, cache.stats());
        std::printf("root     %s\n", cache.root().c_str());
        std::printf("entries  %lld\n", static_cast<long long>(s.entries));
        std::printf("size     %s\n", format_bytes(s.total_bytes).c_str());
        std::printf("files    %lld\n", static_cast<long long>(s.total_files));
        std::printf("hits     %lld\n", static_cast<long long>(s.total_hits));
        std::printf("staging  %lld\n", static_cast<long long>(s.staging_dirs));
        return ok_status();
    }
    if (sub == "clear") {
        return cache.clear();
    }
    if (sub == "evict") {
        EvictionPolicy policy = cfg.eviction_policy();
        if (opts.max_entries) policy.max_entries = *opts.max_entries;
        if (opts.max_bytes) policy.max_bytes = *opts.max_bytes;
        if (opts.max_age_days) policy.max_age_seconds = *opts.max_age_days * SECONDS_PER_DAY;
        if (policy.max_entries == 0 && policy.max_bytes == 0 && policy.max_age_seconds == 0) {
            return KilnError{KilnError::InvalidArg, "no eviction limit given",
                "pass --max-entries, --max-bytes or --max-age-days, or set them in [cache]"};
        }
        KILN_TRY_ASSIGN(removed, cache.evict(policy));
        for (const auto& fp : removed) std::printf("%s\n", fp.c_str());
        return ok_status();
    }
    if (sub == "remove") {
        if (opts.operands.size() != 2) {
            return KilnError{KilnError::InvalidArg, "cache remove needs one fingerprint"};
        }
        return cache.remove(Fingerprint{opts.operands[1]});
    }
    return KilnError{KilnError::InvalidArg, "unknown cache subcommand '" + sub + "'", USAGE};
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

static int exit_code_for(const KilnError& err) {
    return err.code == KilnError::MalformedManifest ? 2 : 1;
}

int main(int argc, char** argv) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) {
        std::fprintf(stderr, "%s\n", parsed.error().format().c_str());
        return 1;
    }
    const Options& opts = parsed.value();
    if (opts.help || opts.command.empty() || opts.command == "help") {
        std::fputs(USAGE, opts.command.empty() && !opts.help ? stderr : stdout);
        return opts.command.empty() && !opts.help ? 1 : 0;
    }

    auto cfg = load_config(opts);
    if (cfg.is_err()) {
        std::fprintf(stderr, "%s\n", cfg.error().format().c_str());
        return 1;
    }
    apply_log_config(cfg.value());

    Status status = ok_status();
    if (opts.command == "build") {
        status = cmd_build(opts, cfg.value());
    } else if (opts.command == "fingerprint") {
        status = cmd_fingerprint(opts, cfg.value());
    } else if (opts.command == "stub") {
        status = cmd_stub(opts, cfg.value());
    } else if (opts.command == "cache") {
        status = cmd_cache(opts, cfg.value());
    } else {
        status = KilnError{KilnError::InvalidArg, "unknown command '" + opts.command + "'", USAGE};
    }

    if (status.is_err()) {
        std::fprintf(stderr, "%s\n", status.error().format().c_str());
        return exit_code_for(status.error());
    }
    return 0;
}
