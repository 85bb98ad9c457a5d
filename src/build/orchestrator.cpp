#include <kiln/orchestrator.hpp>
#include <kiln/fsutil.hpp>
#include <kiln/glob.hpp>
#include <kiln/log.hpp>
#include <kiln/reconcile.hpp>
#include <kiln/sha256.hpp>
#include <kiln/template.hpp>

#include <chrono>

namespace fs = std::filesystem;

namespace kiln {

static const char* PHASE_DEPENDENCIES = "dependency-build";
static const char* PHASE_OVERLAY = "overlay";
static const char* PHASE_APPLICATION = "application-build";
static const char* PHASE_PUBLISH = "publish";

const char* build_state_name(BuildState state) {
    switch (state) {
        case BuildState::Init:           return "INIT";
        case BuildState::StubCompiled:   return "STUB_COMPILED";
        case BuildState::SourceOverlaid: return "SOURCE_OVERLAID";
        case BuildState::FinalCompiled:  return "FINAL_COMPILED";
        case BuildState::Done:           return "DONE";
        case BuildState::Failed:         return "FAILED";
    }
    return "UNKNOWN";
}

namespace {

class PhaseTimer {
public:
    PhaseTimer(std::vector<PhaseTiming>& out, const char* phase)
        : out_(out), phase_(phase), start_(std::chrono::steady_clock::now()) {}
    ~PhaseTimer() {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
        out_.push_back({phase_, elapsed.count()});
    }
    PhaseTimer(const PhaseTimer&) = delete;
    PhaseTimer& operator=(const PhaseTimer&) = delete;

private:
    std::vector<PhaseTiming>& out_;
    const char* phase_;
    std::chrono::steady_clock::time_point start_;
};

// Absolute and normalized, without a trailing separator
fs::path absolute_dir(const fs::path& p) {
    fs::path out = fs::absolute(p).lexically_normal();
    if (!out.has_filename() && out.has_relative_path()) out = out.parent_path();
    return out;
}

bool is_within(const fs::path& path, const fs::path& dir) {
    fs::path rel = path.lexically_relative(dir);
    return !rel.empty() && *rel.begin() != "..";
}

// Glob pattern matching `path` literally
std::string glob_literal(const std::string& path) {
    std::string out;
    for (char c : path) {
        if (c == '*' || c == '?' || c == '[') {
            out += '[';
            out += c;
            out += ']';
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace

BuildOrchestrator::BuildOrchestrator(Config config, DependencyCache& cache, Compiler& compiler)
    : config_(std::move(config)), cache_(cache), compiler_(compiler) {}

void BuildOrchestrator::on_transition(TransitionObserver observer) {
    observers_.push_back(std::move(observer));
}

std::string BuildOrchestrator::fingerprint_salt(const Config& config, const Compiler& compiler) {
    std::string salt = compiler.identity();
    if (!config.cache.salt.empty()) salt += "salt " + config.cache.salt + "\n";
    return salt;
}

void BuildOrchestrator::transition(BuildState next) {
    BuildState prev = state_;
    state_ = next;
    report_.state = next;
    log::debug("state %s -> %s", build_state_name(prev), build_state_name(next));
    for (const auto& observer : observers_) {
        observer(prev, next);
    }
}

KilnError BuildOrchestrator::fail(KilnError err, const char* phase) {
    if (err.phase.empty()) err.with_phase(phase);
    if (err.fingerprint.empty() && Fingerprint::is_valid(report_.fingerprint.hex)) {
        err.with_fingerprint(report_.fingerprint.hex);
    }
    report_.error = err;
    transition(BuildState::Failed);
    return err;
}

Result<StubSynthesizer> BuildOrchestrator::make_synthesizer() const {
    StubProfile profile;
    if (!parse_stub_profile(config_.stub.profile, profile)) {
        return KilnError{KilnError::Config, "unknown stub profile '" + config_.stub.profile + "'"};
    }
    StubSynthesizer synth(profile);
    if (!config_.stub.files.empty()) synth.set_override(config_.stub.files);
    return Result<StubSynthesizer>::ok(std::move(synth));
}

// A work directory inside the tree being copied must not be copied into itself
GlobSet BuildOrchestrator::copy_excludes(const Layout& layout, const fs::path& origin) const {
    std::vector<std::string> patterns = config_.source.exclude;
    if (is_within(layout.work, origin)) {
        patterns.push_back(glob_literal(layout.work.lexically_relative(origin).generic_string()));
    }
    return GlobSet(std::move(patterns));
}

// ---------------------------------------------------------------------------
// Phase 1: dependencies
// ---------------------------------------------------------------------------

Status BuildOrchestrator::prepare_work_tree(const Layout& layout,
                                            const Manifest& manifest) const {
    KILN_TRY(remove_tree(layout.src));
    std::error_code ec;
    fs::create_directories(layout.src, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot create " + layout.src.string() + ": " + ec.message()};
    }

    KILN_TRY(copy_file_atomic(manifest.manifest_path, layout.src / config_.manifest.file));
    KILN_TRY(copy_file_atomic(manifest.lock_path, layout.src / config_.manifest.lock));

    // Path dependencies are compiled with the rest of the dependency graph
    for (const auto* dep : manifest.path_dependencies()) {
        fs::path dest = (layout.src / *dep->path).lexically_normal();
        fs::path rel = dest.lexically_relative(layout.work);
        if (rel.empty() || *rel.begin() == "..") {
            return KilnError{KilnError::InvalidArg,
                "path dependency '" + dep->name + "' (" + *dep->path +
                ") lies too far outside the project to be staged",
                "", manifest.manifest_path, 0};
        }
        fs::path origin = (layout.source / *dep->path).lexically_normal();
        KILN_TRY_ASSIGN(copied, copy_tree(origin, dest, copy_excludes(layout, origin)));
        log::debug("staged path dependency %s (%lld files)", dep->name.c_str(),
                   static_cast<long long>(copied.files));
    }
    return ok_status();
}

Status BuildOrchestrator::compile_dependencies(const Layout& layout, const Manifest& manifest,
                                               const StubSynthesizer& synth,
                                               const StubSource& stub) {
    const Fingerprint& fp = report_.fingerprint;

    auto hit = cache_.lookup(fp);
    if (hit.is_ok()) {
        auto restored = cache_.restore(hit.value(), layout.target);
        if (restored.is_ok()) {
            report_.cache_hit = true;
            log::info("dependency cache hit %s, skipping dependency build",
                      fp.short_hex().c_str());
            KILN_TRY_ASSIGN(mark, StalenessReconciler::stale_mark(layout.src, stub,
                                                                  layout.target));
            stale_mark_ = mark;
            return ok_status();
        }
        // Evicted between lookup and restore
        if (!restored.is_err(KilnError::NotFound)) return restored.error();
        log::debug("%s", restored.error().message.c_str());
    } else if (!hit.is_err(KilnError::NotFound)) {
        return hit.error();
    }

    log::info("dependency cache miss %s, building dependencies of %s",
              fp.short_hex().c_str(), manifest.package.name.c_str());

    // Only dependency output may end up in the entry
    KILN_TRY(remove_tree(layout.target));
    std::error_code ec;
    fs::create_directories(layout.target, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot create " + layout.target.string() + ": " + ec.message()};
    }

    KILN_TRY(synth.write(stub, layout.src));

    auto compiled = compiler_.compile(layout.src, layout.target);
    if (compiled.is_err(KilnError::CompileFailed)) {
        KilnError err = compiled.error();
        err.code = KilnError::DependencyCompile;
        err.message = "dependency build failed: " + err.message;
        return err;
    }
    if (compiled.is_err()) return compiled.error();

    KILN_TRY_ASSIGN(mark, StalenessReconciler::stale_mark(layout.src, stub, layout.target));
    stale_mark_ = mark;

    KILN_TRY_ASSIGN(outcome, cache_.store(fp, layout.target));
    if (outcome == StoreOutcome::AlreadyPresent) {
        log::info("another build cached %s first", fp.short_hex().c_str());
    }

    EvictionPolicy policy = config_.eviction_policy();
    if (policy.max_entries > 0 || policy.max_bytes > 0 || policy.max_age_seconds > 0) {
        policy.keep.insert(fp.hex);
        auto evicted = cache_.evict(policy);
        if (evicted.is_err()) {
            log::warn("cache eviction failed: %s", evicted.error().message.c_str());
        } else {
            report_.evicted = std::move(evicted).value();
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Phase 2: overlay
// ---------------------------------------------------------------------------

Status BuildOrchestrator::overlay_source(const Layout& layout, const StubSynthesizer& synth,
                                         const StubSource& stub) const {
    KILN_TRY(synth.remove(stub, layout.src));
    KILN_TRY_ASSIGN(copied, copy_tree(layout.source, layout.src,
                                      copy_excludes(layout, layout.source)));
    log::info("overlaid %lld source files", static_cast<long long>(copied.files));
    return ok_status();
}

// ---------------------------------------------------------------------------
// Phase 3: application
// ---------------------------------------------------------------------------

Status BuildOrchestrator::reconcile(const Layout& layout, const Manifest& manifest,
                                    const StubSource& stub) const {
    ReconcileStrategy strategy;
    if (!parse_reconcile_strategy(config_.reconcile.strategy, strategy)) {
        return KilnError{KilnError::Config,
            "unknown reconcile strategy '" + config_.reconcile.strategy + "'"};
    }

    TemplateVars vars{
        {"package", manifest.package.name},
        {"profile", config_.toolchain.profile},
    };
    KILN_TRY_ASSIGN(invalidate, expand_templates(config_.reconcile.invalidate, vars));

    StalenessReconciler reconciler(strategy);
    reconciler.set_extra_paths(config_.reconcile.paths);
    reconciler.set_invalidate_patterns(std::move(invalidate));

    ReconcileRequest request;
    request.source_root = layout.src;
    request.cache_dir = layout.target;
    request.stub = stub;
    request.stale_mark = stale_mark_;

    KILN_TRY_ASSIGN(report, reconciler.reconcile(request));
    log::debug("reconciled with %s strategy", reconcile_strategy_name(report.strategy));
    return ok_status();
}

Result<CompileOutput> BuildOrchestrator::compile_application(const Layout& layout) {
    auto compiled = compiler_.compile(layout.src, layout.target);
    if (compiled.is_err(KilnError::CompileFailed)) {
        KilnError err = compiled.error();
        err.code = KilnError::ApplicationCompile;
        err.message = "application build failed: " + err.message;
        return err;
    }
    return compiled;
}

// ---------------------------------------------------------------------------
// Phase 4: publish
// ---------------------------------------------------------------------------

Status BuildOrchestrator::publish(const Layout& layout, const CompileOutput& compiled) {
    KILN_TRY(copy_file_atomic(compiled.binary, layout.output));
    KILN_TRY_ASSIGN(digest, SHA256::hash_file(layout.output));
    report_.output_path = layout.output;
    report_.output_digest = digest;
    log::info("built %s (sha256 %s)", layout.output.c_str(), digest.substr(0, 12).c_str());
    return ok_status();
}

// ---------------------------------------------------------------------------
// Driver
// ---------------------------------------------------------------------------

Result<BuildReport> BuildOrchestrator::build(const BuildRequest& request) {
    report_ = BuildReport();
    stale_mark_ = fs::file_time_type{};
    state_ = BuildState::Init;

    Layout layout;
    layout.project = absolute_dir(request.project_dir);
    layout.source = request.source_dir.empty()
        ? layout.project
        : absolute_dir(request.source_dir);
    layout.work = request.work_dir.empty()
        ? layout.project / ".kiln" / "work"
        : absolute_dir(request.work_dir);
    layout.src = layout.work / "src";
    layout.target = layout.work / "target";

    if (layout.work == layout.source || is_within(layout.source, layout.work)) {
        return fail(KilnError{KilnError::InvalidArg,
            "work directory " + layout.work.string() + " contains the source tree " +
            layout.source.string(),
            "the work directory is wiped on every build; pick one outside the sources"},
            PHASE_DEPENDENCIES);
    }

    Manifest manifest;
    StubSource stub;
    auto synth = make_synthesizer();
    if (synth.is_err()) return fail(synth.error(), PHASE_DEPENDENCIES);

    // INIT -> STUB_COMPILED
    {
        log::ScopedPhase scope(PHASE_DEPENDENCIES);
        PhaseTimer timer(report_.timings, PHASE_DEPENDENCIES);

        auto loaded = Manifest::load(layout.project.string(), config_.manifest.file,
                                     config_.manifest.lock);
        if (loaded.is_err()) return fail(loaded.error(), PHASE_DEPENDENCIES);
        manifest = std::move(loaded).value();

        auto fp = Fingerprinter(fingerprint_salt(config_, compiler_)).fingerprint(manifest);
        if (fp.is_err()) return fail(fp.error(), PHASE_DEPENDENCIES);
        report_.fingerprint = fp.value();
        log::debug("fingerprint %s", fp.value().hex.c_str());

        auto synthesized = synth.value().synthesize(manifest);
        if (synthesized.is_err()) return fail(synthesized.error(), PHASE_DEPENDENCIES);
        stub = std::move(synthesized).value();

        auto prepared = prepare_work_tree(layout, manifest);
        if (prepared.is_err()) return fail(prepared.error(), PHASE_DEPENDENCIES);

        auto deps = compile_dependencies(layout, manifest, synth.value(), stub);
        if (deps.is_err()) return fail(deps.error(), PHASE_DEPENDENCIES);
    }
    layout.output = request.output_path.empty()
        ? layout.work / "bin" / manifest.package.name
        : fs::absolute(request.output_path).lexically_normal();
    transition(BuildState::StubCompiled);

    // STUB_COMPILED -> SOURCE_OVERLAID
    {
        log::ScopedPhase scope(PHASE_OVERLAY);
        PhaseTimer timer(report_.timings, PHASE_OVERLAY);
        auto overlaid = overlay_source(layout, synth.value(), stub);
        if (overlaid.is_err()) return fail(overlaid.error(), PHASE_OVERLAY);
    }
    transition(BuildState::SourceOverlaid);

    // SOURCE_OVERLAID -> FINAL_COMPILED
    CompileOutput compiled;
    {
        log::ScopedPhase scope(PHASE_APPLICATION);
        PhaseTimer timer(report_.timings, PHASE_APPLICATION);
        auto reconciled = reconcile(layout, manifest, stub);
        if (reconciled.is_err()) return fail(reconciled.error(), PHASE_APPLICATION);

        auto app = compile_application(layout);
        if (app.is_err()) return fail(app.error(), PHASE_APPLICATION);
        compiled = std::move(app).value();
    }
    transition(BuildState::FinalCompiled);

    // FINAL_COMPILED -> DONE
    {
        log::ScopedPhase scope(PHASE_PUBLISH);
        PhaseTimer timer(report_.timings, PHASE_PUBLISH);
        auto published = publish(layout, compiled);
        if (published.is_err()) return fail(published.error(), PHASE_PUBLISH);
    }
    transition(BuildState::Done);

    return Result<BuildReport>::ok(report_);
}

} // namespace kiln
