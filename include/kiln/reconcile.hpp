#pragma once

#include <kiln/result.hpp>
#include <kiln/stub.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace kiln {

enum class ReconcileStrategy {
    Timestamp,      // re-stamp application entry files past the stale mark
    Invalidate,     // delete the compiler's records of the application unit
};

const char* reconcile_strategy_name(ReconcileStrategy s);
bool parse_reconcile_strategy(const std::string& name, ReconcileStrategy& out);

struct ReconcileRequest {
    std::filesystem::path source_root;      // overlaid real source
    std::filesystem::path cache_dir;        // compiler cache directory
    StubSource stub;                        // what the dependency build compiled
    std::filesystem::file_time_type stale_mark{};
};

struct ReconcileReport {
    ReconcileStrategy strategy = ReconcileStrategy::Timestamp;
    std::vector<std::string> touched;       // source-relative, re-stamped
    std::vector<std::string> invalidated;   // cache-relative, removed
    std::filesystem::file_time_type stamped_time{};
};

// Makes the compiler treat the application unit as out of date after the
// real source replaces the stub, whatever timestamps the source carries.
class StalenessReconciler {
public:
    explicit StalenessReconciler(ReconcileStrategy strategy = ReconcileStrategy::Timestamp);

    // Source-relative globs re-stamped along with the stub locations
    void set_extra_paths(std::vector<std::string> patterns);

    // Cache-relative globs naming the application unit's compiler records
    void set_invalidate_patterns(std::vector<std::string> patterns);

    ReconcileStrategy strategy() const { return strategy_; }

    // Newest modification time among the written stub files and everything
    // under the compiler cache directory. Call before the stub is removed.
    static Result<std::filesystem::file_time_type> stale_mark(
        const std::filesystem::path& source_root,
        const StubSource& stub,
        const std::filesystem::path& cache_dir);

    // Fails with ReconciliationFailed; the build must not continue then
    Result<ReconcileReport> reconcile(const ReconcileRequest& request) const;

private:
    Result<ReconcileReport> restamp(const ReconcileRequest& request) const;
    Result<ReconcileReport> invalidate(const ReconcileRequest& request) const;

    ReconcileStrategy strategy_;
    std::vector<std::string> extra_paths_;
    std::vector<std::string> invalidate_patterns_;
};

} // namespace kiln
