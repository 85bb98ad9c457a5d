#pragma once

#include <kiln/result.hpp>
#include <kiln/compiler.hpp>
#include <kiln/config.hpp>
#include <kiln/dep_cache.hpp>
#include <kiln/fingerprint.hpp>
#include <kiln/glob.hpp>
#include <kiln/manifest.hpp>
#include <kiln/stub.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kiln {

enum class BuildState {
    Init,
    StubCompiled,
    SourceOverlaid,
    FinalCompiled,
    Done,
    Failed,
};

const char* build_state_name(BuildState state);

struct BuildRequest {
    std::filesystem::path project_dir;      // holds the manifest and lock
    std::filesystem::path source_dir;       // real source tree; empty: project_dir
    std::filesystem::path output_path;      // empty: <work>/bin/<package>
    std::filesystem::path work_dir;         // empty: <project>/.kiln/work
};

struct PhaseTiming {
    std::string phase;
    double seconds = 0.0;
};

struct BuildReport {
    BuildState state = BuildState::Init;
    Fingerprint fingerprint;
    bool cache_hit = false;
    std::filesystem::path output_path;
    std::string output_digest;
    std::vector<PhaseTiming> timings;
    std::vector<std::string> evicted;
    std::optional<KilnError> error;
};

using TransitionObserver = std::function<void(BuildState from, BuildState to)>;

// Drives one build through INIT -> STUB_COMPILED -> SOURCE_OVERLAID ->
// FINAL_COMPILED -> DONE, or FAILED from any state.
//
// Work directory layout:
//   <work>/src     source root handed to the compiler
//   <work>/target  compiler cache directory
//   <work>/bin     default output location
//
// Builds sharing a work directory must not run concurrently; builds with
// separate work directories may share the cache.
class BuildOrchestrator {
public:
    BuildOrchestrator(Config config, DependencyCache& cache, Compiler& compiler);

    void on_transition(TransitionObserver observer);

    // Errors carry the failing phase and, once known, the fingerprint
    Result<BuildReport> build(const BuildRequest& request);

    BuildState state() const { return state_; }

    // Report of the most recent build, complete or not
    const BuildReport& last_report() const { return report_; }

    // Fingerprint salt combining the configured salt with the toolchain
    static std::string fingerprint_salt(const Config& config, const Compiler& compiler);

private:
    struct Layout {
        std::filesystem::path project;
        std::filesystem::path source;
        std::filesystem::path work;
        std::filesystem::path src;
        std::filesystem::path target;
        std::filesystem::path output;
    };

    Result<StubSynthesizer> make_synthesizer() const;
    GlobSet copy_excludes(const Layout& layout, const std::filesystem::path& origin) const;
    Status prepare_work_tree(const Layout& layout, const Manifest& manifest) const;
    Status compile_dependencies(const Layout& layout, const Manifest& manifest,
                                const StubSynthesizer& synth, const StubSource& stub);
    Status overlay_source(const Layout& layout, const StubSynthesizer& synth,
                          const StubSource& stub) const;
    Status reconcile(const Layout& layout, const Manifest& manifest,
                     const StubSource& stub) const;
    Result<CompileOutput> compile_application(const Layout& layout);
    Status publish(const Layout& layout, const CompileOutput& compiled);

    void transition(BuildState next);
    KilnError fail(KilnError err, const char* phase);

    Config config_;
    DependencyCache& cache_;
    Compiler& compiler_;
    std::vector<TransitionObserver> observers_;

    BuildState state_ = BuildState::Init;
    BuildReport report_;
    std::filesystem::file_time_type stale_mark_{};
};

} // namespace kiln
