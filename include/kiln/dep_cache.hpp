#pragma once

#include <kiln/result.hpp>
#include <kiln/fingerprint.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace kiln {

struct CacheEntry {
    std::string fingerprint;
    std::filesystem::path artifact_dir;
    std::string content_digest;
    int64_t size_bytes = 0;
    int64_t file_count = 0;
    int64_t created_at = 0;      // unix seconds
    int64_t last_used_at = 0;    // unix seconds
    int64_t hit_count = 0;
};

enum class StoreOutcome {
    Stored,          // this call committed the entry
    AlreadyPresent,  // an equivalent entry was already committed
};

// Least-recently-used replacement. Zero limits are disabled.
struct EvictionPolicy {
    int64_t max_entries = 0;
    int64_t max_bytes = 0;
    int64_t max_age_seconds = 0;     // since last use
    std::set<std::string> keep;      // fingerprints never evicted
    bool everything = false;         // ignore limits, evict all but `keep`
};

struct DepCacheStats {
    int64_t entries = 0;
    int64_t total_bytes = 0;
    int64_t total_files = 0;
    int64_t total_hits = 0;
    int64_t staging_dirs = 0;
};

// Content-addressed store of compiled dependency artifact trees.
//
// Layout:
//   <root>/index.db                 metadata index (SQLite, WAL)
//   <root>/entries/<fp>/ENTRY       commit record
//   <root>/entries/<fp>/artifacts/  compiler cache directory snapshot
//   <root>/staging/                 stores and evictions in flight
//   <root>/locks/<fp>.lock          per-fingerprint lock file
//
// An entry becomes visible only through one rename of a fully written
// staging directory. Stores of one fingerprint are serialized by an
// exclusive lock on its lock file; other fingerprints are never blocked.
// Several DependencyCache objects, in one process or many, may share a root.
class DependencyCache {
public:
    DependencyCache();
    ~DependencyCache();
    DependencyCache(DependencyCache&&) noexcept;
    DependencyCache& operator=(DependencyCache&&) noexcept;

    Status open(const std::string& root);
    void close();
    bool is_open() const;
    const std::filesystem::path& root() const;

    // ~/.kiln/cache
    static std::string default_root();

    // Artifact paths (relative to the artifact dir) left out of content
    // digests, for toolchains that write nondeterministic files
    void set_volatile_patterns(std::vector<std::string> patterns);

    // Miss is reported as NotFound
    Result<CacheEntry> lookup(const Fingerprint& fp);

    // Commit a copy of `artifact_dir` under `fp`. Storing content equal to a
    // committed entry is a no-op; different content fails with
    // FingerprintCollision.
    Result<StoreOutcome> store(const Fingerprint& fp,
                               const std::filesystem::path& artifact_dir);

    // Replace `dest` with a copy of the entry's artifacts. Holds a shared
    // lock on the fingerprint so eviction cannot remove it mid-copy.
    Status restore(const CacheEntry& entry, const std::filesystem::path& dest);

    // Returns the removed fingerprints, least recently used first
    Result<std::vector<std::string>> evict(const EvictionPolicy& policy);

    // Remove one entry, waiting for readers of it to finish
    Status remove(const Fingerprint& fp);

    Result<std::vector<CacheEntry>> list();
    Result<DepCacheStats> stats();
    Status clear();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kiln
