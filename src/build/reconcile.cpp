#include <kiln/reconcile.hpp>
#include <kiln/fsutil.hpp>
#include <kiln/glob.hpp>
#include <kiln/log.hpp>
#include <kiln/sha256.hpp>

#include <algorithm>
#include <chrono>
#include <set>

namespace fs = std::filesystem;

namespace kiln {

const char* reconcile_strategy_name(ReconcileStrategy s) {
    switch (s) {
        case ReconcileStrategy::Timestamp:  return "timestamp";
        case ReconcileStrategy::Invalidate: return "invalidate";
    }
    return "unknown";
}

bool parse_reconcile_strategy(const std::string& name, ReconcileStrategy& out) {
    if (name == "timestamp")  { out = ReconcileStrategy::Timestamp; return true; }
    if (name == "invalidate") { out = ReconcileStrategy::Invalidate; return true; }
    return false;
}

static KilnError reconcile_error(std::string message, std::string hint = "") {
    return KilnError{KilnError::ReconciliationFailed, std::move(message), std::move(hint)};
}

StalenessReconciler::StalenessReconciler(ReconcileStrategy strategy)
    : strategy_(strategy) {}

void StalenessReconciler::set_extra_paths(std::vector<std::string> patterns) {
    extra_paths_ = std::move(patterns);
}

void StalenessReconciler::set_invalidate_patterns(std::vector<std::string> patterns) {
    invalidate_patterns_ = std::move(patterns);
}

Result<fs::file_time_type> StalenessReconciler::stale_mark(const fs::path& source_root,
                                                           const StubSource& stub,
                                                           const fs::path& cache_dir) {
    fs::file_time_type mark = fs::file_time_type::min();
    for (const auto& f : stub.files) {
        std::error_code ec;
        auto t = fs::last_write_time(source_root / f.path, ec);
        if (!ec) mark = std::max(mark, t);
    }

    std::error_code ec;
    if (fs::exists(cache_dir, ec)) {
        KILN_TRY_ASSIGN(newest, newest_mtime(cache_dir));
        mark = std::max(mark, newest);
    }
    return Result<fs::file_time_type>::ok(mark);
}

Result<ReconcileReport> StalenessReconciler::reconcile(const ReconcileRequest& request) const {
    std::error_code ec;
    if (!fs::is_directory(request.source_root, ec)) {
        return reconcile_error("source root " + request.source_root.string() + " does not exist");
    }
    switch (strategy_) {
        case ReconcileStrategy::Timestamp:  return restamp(request);
        case ReconcileStrategy::Invalidate: return invalidate(request);
    }
    return reconcile_error("unknown reconcile strategy");
}

// ---- timestamp ----

Result<ReconcileReport> StalenessReconciler::restamp(const ReconcileRequest& request) const {
    std::set<std::string> targets;
    for (const auto& f : request.stub.files) {
        std::error_code ec;
        if (fs::is_regular_file(request.source_root / f.path, ec)) {
            targets.insert(f.path);
        } else {
            log::debug("entry file %s is not part of the real source", f.path.c_str());
        }
    }
    if (!extra_paths_.empty()) {
        auto extra = glob_expand(GlobSet(extra_paths_), request.source_root);
        if (extra.is_err()) {
            return reconcile_error("cannot expand reconcile paths: " + extra.error().message);
        }
        targets.insert(extra.value().begin(), extra.value().end());
    }
    if (targets.empty()) {
        return reconcile_error(
            "no application entry files found under " + request.source_root.string(),
            "the real source must provide the stub's entry files, or list them in "
            "[reconcile] paths");
    }

    // Strictly newer than anything the stub build could have recorded, and
    // never in the past
    auto now = fs::file_time_type::clock::now();
    auto stamp = std::max(now, request.stale_mark + std::chrono::seconds(1));

    ReconcileReport report;
    report.strategy = ReconcileStrategy::Timestamp;
    report.stamped_time = stamp;

    for (const auto& rel : targets) {
        fs::path path = request.source_root / rel;
        std::error_code ec;
        fs::last_write_time(path, stamp, ec);
        if (ec) {
            return reconcile_error("cannot update modification time of " + path.string() +
                                   ": " + ec.message());
        }
        auto actual = fs::last_write_time(path, ec);
        if (ec) {
            return reconcile_error("cannot read back modification time of " + path.string() +
                                   ": " + ec.message());
        }
        if (actual <= request.stale_mark) {
            return reconcile_error(
                "modification time of " + path.string() + " did not move past the stale mark",
                "the filesystem timestamp resolution is too coarse; use "
                "strategy = \"invalidate\"");
        }
        log::trace("restamped %s", rel.c_str());
        report.touched.push_back(rel);
    }

    log::debug("restamped %zu application file%s", report.touched.size(),
               report.touched.size() == 1 ? "" : "s");
    return Result<ReconcileReport>::ok(std::move(report));
}

// ---- invalidate ----

Result<ReconcileReport> StalenessReconciler::invalidate(const ReconcileRequest& request) const {
    if (invalidate_patterns_.empty()) {
        return reconcile_error("the invalidate strategy has no patterns",
                               "set [reconcile] invalidate to the compiler's records of "
                               "the application unit");
    }

    ReconcileReport report;
    report.strategy = ReconcileStrategy::Invalidate;

    // Real entry content equal to the stub leaves nothing stale
    bool differs = false;
    for (const auto& f : request.stub.files) {
        auto real = SHA256::hash_file(request.source_root / f.path);
        if (real.is_err() || real.value() != SHA256::hash_hex(f.content)) {
            differs = true;
            break;
        }
    }
    std::error_code ec;
    if (!differs || !fs::is_directory(request.cache_dir, ec)) {
        log::debug("no compiler records to invalidate");
        return Result<ReconcileReport>::ok(std::move(report));
    }

    GlobSet patterns(invalidate_patterns_);
    auto matched = glob_expand(patterns, request.cache_dir, true);
    if (matched.is_err()) {
        return reconcile_error("cannot scan " + request.cache_dir.string() + ": " +
                               matched.error().message);
    }

    for (const auto& rel : matched.value()) {
        fs::path path = request.cache_dir / rel;
        fs::remove_all(path, ec);
        if (ec) {
            return reconcile_error("cannot remove " + path.string() + ": " + ec.message());
        }
        log::trace("invalidated %s", rel.c_str());
        report.invalidated.push_back(rel);
    }

    auto left = glob_expand(patterns, request.cache_dir, true);
    if (left.is_err()) {
        return reconcile_error("cannot verify invalidation: " + left.error().message);
    }
    if (!left.value().empty()) {
        return reconcile_error(left.value().front() + " survived invalidation");
    }

    log::debug("invalidated %zu compiler record%s", report.invalidated.size(),
               report.invalidated.size() == 1 ? "" : "s");
    return Result<ReconcileReport>::ok(std::move(report));
}

} // namespace kiln
