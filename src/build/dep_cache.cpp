#include <kiln/dep_cache.hpp>
#include <kiln/fsutil.hpp>
#include <kiln/glob.hpp>
#include <kiln/log.hpp>
#include <sqlite3.h>
#include <tomlplusplus/toml.hpp>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace kiln {

static const std::string SCHEMA_VERSION = "1";
static const char* RECORD_NAME = "ENTRY";
static const char* ARTIFACTS_NAME = "artifacts";

// Staging directories untouched this long belong to dead processes
static constexpr auto STALE_STAGING_AGE = std::chrono::hours(24);

static int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ---------------------------------------------------------------------------
// Advisory locks and staging cleanup
// ---------------------------------------------------------------------------

namespace {

class FileLock {
public:
    enum Mode { Shared, Exclusive };

    // Without `wait`, a lock held elsewhere fails with CacheStoreConflict
    static Result<FileLock> acquire(const fs::path& path, Mode mode, bool wait) {
        int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            return KilnError{KilnError::IO,
                "cannot open lock file " + path.string() + ": " + std::strerror(errno)};
        }
        int op = (mode == Exclusive ? LOCK_EX : LOCK_SH) | (wait ? 0 : LOCK_NB);
        while (::flock(fd, op) != 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::close(fd);
            if (saved == EWOULDBLOCK) {
                return KilnError{KilnError::CacheStoreConflict,
                    "cache entry " + path.stem().string().substr(0, 12) + " is in use"};
            }
            return KilnError{KilnError::IO,
                "cannot lock " + path.string() + ": " + std::strerror(saved)};
        }
        return Result<FileLock>::ok(FileLock(fd));
    }

    FileLock(FileLock&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock& operator=(FileLock&&) = delete;

    ~FileLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

private:
    explicit FileLock(int fd) : fd_(fd) {}
    int fd_ = -1;
};

// Removes a staging directory on scope exit unless released
class StagingGuard {
public:
    explicit StagingGuard(fs::path path) : path_(std::move(path)) {}
    ~StagingGuard() {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            log::warn("cannot remove staging directory %s: %s",
                      path_.c_str(), ec.message().c_str());
        }
    }
    StagingGuard(const StagingGuard&) = delete;
    StagingGuard& operator=(const StagingGuard&) = delete;

    void release() { path_.clear(); }

private:
    fs::path path_;
};

} // namespace

// ---------------------------------------------------------------------------
// Commit record (<entry>/ENTRY)
// ---------------------------------------------------------------------------

static std::string format_record(const CacheEntry& e) {
    toml::table rec{
        {"fingerprint", e.fingerprint},
        {"digest", e.content_digest},
        {"files", e.file_count},
        {"bytes", e.size_bytes},
        {"created_at", e.created_at},
    };
    std::ostringstream ss;
    ss << rec << "\n";
    return ss.str();
}

static Result<CacheEntry> read_record(const fs::path& entry_dir) {
    fs::path path = entry_dir / RECORD_NAME;
    KILN_TRY_ASSIGN(text, read_file(path));

    toml::table doc;
    try {
        doc = toml::parse(text, path.string());
    } catch (const toml::parse_error& e) {
        return KilnError{KilnError::Parse,
            std::string("corrupt cache record: ") + std::string(e.description()),
            "remove the entry with `kiln cache clear`",
            path.string(), static_cast<int>(e.source().begin.line)};
    }

    auto fp = doc["fingerprint"].value<std::string>();
    auto digest = doc["digest"].value<std::string>();
    if (!fp || !digest || *fp != entry_dir.filename().string()) {
        return KilnError{KilnError::Parse,
            "cache record does not match its entry directory", "",
            path.string(), 0};
    }

    CacheEntry e;
    e.fingerprint = *fp;
    e.content_digest = *digest;
    e.file_count = doc["files"].value_or(int64_t{0});
    e.size_bytes = doc["bytes"].value_or(int64_t{0});
    e.created_at = doc["created_at"].value_or(int64_t{0});
    e.last_used_at = e.created_at;
    e.artifact_dir = entry_dir / ARTIFACTS_NAME;
    return Result<CacheEntry>::ok(std::move(e));
}

static Status check_fingerprint(const std::string& hex) {
    if (!Fingerprint::is_valid(hex)) {
        return KilnError{KilnError::InvalidArg, "invalid fingerprint '" + hex + "'"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

struct DependencyCache::Impl {
    sqlite3* db = nullptr;
    std::mutex mu;
    fs::path root;
    GlobSet volatile_set;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_select = nullptr;
    sqlite3_stmt* stmt_upsert = nullptr;
    sqlite3_stmt* stmt_touch = nullptr;
    sqlite3_stmt* stmt_erase = nullptr;
    sqlite3_stmt* stmt_select_all = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_select);
        fin(stmt_upsert);
        fin(stmt_touch);
        fin(stmt_erase);
        fin(stmt_select_all);
    }

    Status require_open() const {
        if (!db) return KilnError{KilnError::IO, "dependency cache is not open"};
        return ok_status();
    }

    fs::path entry_dir(const std::string& fp) const { return root / "entries" / fp; }
    fs::path staging_dir() const { return root / "staging"; }
    fs::path lock_path(const std::string& fp) const {
        return root / "locks" / (fp + ".lock");
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return KilnError(KilnError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return KilnError(KilnError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status init_schema() {
        KILN_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS entry ("
            "  fingerprint TEXT PRIMARY KEY,"
            "  content_digest TEXT NOT NULL,"
            "  size_bytes INTEGER NOT NULL DEFAULT 0,"
            "  file_count INTEGER NOT NULL DEFAULT 0,"
            "  created_at INTEGER NOT NULL,"
            "  last_used_at INTEGER NOT NULL,"
            "  use_seq INTEGER NOT NULL DEFAULT 0,"
            "  hit_count INTEGER NOT NULL DEFAULT 0"
            ");"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return KilnError(KilnError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }

        std::string found;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            found = ver ? ver : "";
        }
        sqlite3_finalize(stmt);
        if (found == SCHEMA_VERSION) return ok_status();

        // Unknown or missing version: the rows are rebuilt from the commit
        // records on disk as entries are looked up or evicted
        if (!found.empty()) {
            log::debug("cache index schema %s replaced by %s",
                       found.c_str(), SCHEMA_VERSION.c_str());
            KILN_TRY(exec("DELETE FROM entry;"));
        }
        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }

    static std::string column_string(sqlite3_stmt* s, int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(s, col));
        return text ? text : "";
    }

    CacheEntry read_row(sqlite3_stmt* s) const {
        CacheEntry e;
        e.fingerprint = column_string(s, 0);
        e.content_digest = column_string(s, 1);
        e.size_bytes = sqlite3_column_int64(s, 2);
        e.file_count = sqlite3_column_int64(s, 3);
        e.created_at = sqlite3_column_int64(s, 4);
        e.last_used_at = sqlite3_column_int64(s, 5);
        e.hit_count = sqlite3_column_int64(s, 6);
        e.artifact_dir = entry_dir(e.fingerprint) / ARTIFACTS_NAME;
        return e;
    }

    Result<CacheEntry> select(const std::string& fp) {
        std::lock_guard<std::mutex> guard(mu);
        KILN_TRY(prepare(
            "SELECT fingerprint, content_digest, size_bytes, file_count, "
            "created_at, last_used_at, hit_count FROM entry WHERE fingerprint = ?1",
            stmt_select));
        sqlite3_reset(stmt_select);
        sqlite3_bind_text(stmt_select, 1, fp.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt_select);
        if (rc == SQLITE_ROW) {
            return Result<CacheEntry>::ok(read_row(stmt_select));
        }
        if (rc == SQLITE_DONE) {
            return KilnError{KilnError::NotFound, "no index row for " + fp.substr(0, 12)};
        }
        return KilnError{KilnError::IO,
            std::string("cache index lookup failed: ") + sqlite3_errmsg(db)};
    }

    // Newly indexed rows count as the most recently used
    Status upsert(const CacheEntry& e) {
        std::lock_guard<std::mutex> guard(mu);
        KILN_TRY(prepare(
            "INSERT OR REPLACE INTO entry (fingerprint, content_digest, size_bytes, "
            "file_count, created_at, last_used_at, use_seq, hit_count) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, "
            "(SELECT COALESCE(MAX(use_seq), 0) + 1 FROM entry), 0)",
            stmt_upsert));
        sqlite3_reset(stmt_upsert);
        sqlite3_bind_text(stmt_upsert, 1, e.fingerprint.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_upsert, 2, e.content_digest.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_upsert, 3, e.size_bytes);
        sqlite3_bind_int64(stmt_upsert, 4, e.file_count);
        sqlite3_bind_int64(stmt_upsert, 5, e.created_at);
        sqlite3_bind_int64(stmt_upsert, 6, e.last_used_at);

        if (sqlite3_step(stmt_upsert) != SQLITE_DONE) {
            return KilnError{KilnError::IO,
                std::string("cannot index cache entry: ") + sqlite3_errmsg(db)};
        }
        return ok_status();
    }

    Status touch(const std::string& fp, int64_t now) {
        std::lock_guard<std::mutex> guard(mu);
        KILN_TRY(prepare(
            "UPDATE entry SET last_used_at = ?2, hit_count = hit_count + 1, "
            "use_seq = (SELECT COALESCE(MAX(use_seq), 0) + 1 FROM entry) "
            "WHERE fingerprint = ?1",
            stmt_touch));
        sqlite3_reset(stmt_touch);
        sqlite3_bind_text(stmt_touch, 1, fp.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_touch, 2, now);

        if (sqlite3_step(stmt_touch) != SQLITE_DONE) {
            return KilnError{KilnError::IO,
                std::string("cannot record cache hit: ") + sqlite3_errmsg(db)};
        }
        return ok_status();
    }

    Status erase(const std::string& fp) {
        std::lock_guard<std::mutex> guard(mu);
        KILN_TRY(prepare("DELETE FROM entry WHERE fingerprint = ?1", stmt_erase));
        sqlite3_reset(stmt_erase);
        sqlite3_bind_text(stmt_erase, 1, fp.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt_erase) != SQLITE_DONE) {
            return KilnError{KilnError::IO,
                std::string("cannot remove cache index row: ") + sqlite3_errmsg(db)};
        }
        return ok_status();
    }

    // Least recently used first
    Result<std::vector<CacheEntry>> select_all() {
        std::lock_guard<std::mutex> guard(mu);
        KILN_TRY(prepare(
            "SELECT fingerprint, content_digest, size_bytes, file_count, "
            "created_at, last_used_at, hit_count FROM entry "
            "ORDER BY use_seq ASC, fingerprint ASC",
            stmt_select_all));
        sqlite3_reset(stmt_select_all);

        std::vector<CacheEntry> out;
        int rc;
        while ((rc = sqlite3_step(stmt_select_all)) == SQLITE_ROW) {
            out.push_back(read_row(stmt_select_all));
        }
        if (rc != SQLITE_DONE) {
            return KilnError{KilnError::IO,
                std::string("cannot list cache index: ") + sqlite3_errmsg(db)};
        }
        return Result<std::vector<CacheEntry>>::ok(std::move(out));
    }

    bool committed(const std::string& fp) const {
        std::error_code ec;
        return fs::exists(entry_dir(fp) / RECORD_NAME, ec);
    }

    // Index a committed directory found without a row
    Result<CacheEntry> adopt(const std::string& fp) {
        KILN_TRY_ASSIGN(record, read_record(entry_dir(fp)));
        record.last_used_at = now_seconds();
        KILN_TRY(upsert(record));
        log::debug("adopted unindexed cache entry %s", fp.substr(0, 12).c_str());
        return Result<CacheEntry>::ok(std::move(record));
    }

    // Caller holds the entry's exclusive lock. The entry leaves entries/ in
    // one rename, so readers see it whole or not at all.
    Status discard(const std::string& fp) {
        fs::path dir = entry_dir(fp);
        std::error_code ec;
        if (fs::exists(dir, ec)) {
            fs::path doomed = staging_dir() / ("evict." + fp + "." + unique_token());
            fs::rename(dir, doomed, ec);
            if (ec) {
                return KilnError{KilnError::IO,
                    "cannot retire cache entry " + fp.substr(0, 12) + ": " + ec.message()};
            }
            KILN_TRY(erase(fp));
            return remove_tree(doomed);
        }
        return erase(fp);
    }

    // Reconcile the index with the entries directory and drop abandoned
    // staging directories
    Status sweep() {
        KILN_TRY_ASSIGN(rows, select_all());
        std::set<std::string> indexed;
        for (const auto& row : rows) {
            if (committed(row.fingerprint)) {
                indexed.insert(row.fingerprint);
            } else {
                log::debug("dropping index row for missing entry %s",
                           row.fingerprint.substr(0, 12).c_str());
                KILN_TRY(erase(row.fingerprint));
            }
        }

        std::error_code ec;
        for (auto it = fs::directory_iterator(root / "entries", ec);
             !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::string name = it->path().filename().string();
            if (!Fingerprint::is_valid(name) || indexed.count(name) || !committed(name)) {
                continue;
            }
            auto adopted = adopt(name);
            if (adopted.is_err()) {
                log::warn("ignoring unreadable cache entry %s: %s",
                          name.substr(0, 12).c_str(), adopted.error().message.c_str());
            }
        }
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot scan " + (root / "entries").string() + ": " + ec.message()};
        }

        auto cutoff = fs::file_time_type::clock::now() - STALE_STAGING_AGE;
        for (auto it = fs::directory_iterator(staging_dir(), ec);
             !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code time_ec;
            auto mtime = it->last_write_time(time_ec);
            if (time_ec || mtime > cutoff) continue;
            log::debug("removing abandoned staging directory %s",
                       it->path().filename().c_str());
            KILN_TRY(remove_tree(it->path()));
        }
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot scan " + staging_dir().string() + ": " + ec.message()};
        }
        return ok_status();
    }
};

// ---------------------------------------------------------------------------
// DependencyCache public interface
// ---------------------------------------------------------------------------

DependencyCache::DependencyCache() : impl_(std::make_unique<Impl>()) {}
DependencyCache::~DependencyCache() = default;
DependencyCache::DependencyCache(DependencyCache&&) noexcept = default;
DependencyCache& DependencyCache::operator=(DependencyCache&&) noexcept = default;

std::string DependencyCache::default_root() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.kiln/cache";
}

Status DependencyCache::open(const std::string& root) {
    close();

    fs::path base(root);
    for (const char* sub : {"entries", "staging", "locks"}) {
        std::error_code ec;
        fs::create_directories(base / sub, ec);
        if (ec) {
            return KilnError(KilnError::IO,
                "cannot create cache directory " + (base / sub).string() + ": " + ec.message());
        }
    }
    impl_->root = base;

    std::string db_path = (base / "index.db").string();
    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return KilnError(KilnError::IO, "cannot open cache index: " + err_msg);
    }

    auto setup = [&]() -> Status {
        // Other builds may hold the write lock while committing
        sqlite3_busy_timeout(impl_->db, 10000);
        KILN_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        KILN_TRY(impl_->init_schema());
        return ok_status();
    };

    auto setup_result = setup();
    if (setup_result.is_err()) {
        int code = sqlite3_errcode(impl_->db);
        close();
        if (code != SQLITE_CORRUPT && code != SQLITE_NOTADB) {
            return setup_result.error();
        }

        // The index holds metadata only; committed entries are re-adopted
        log::warn("cache index %s is corrupt, recreating it", db_path.c_str());
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return KilnError(KilnError::IO, "cannot recreate cache index " + db_path);
        }
        auto retried = setup();
        if (retried.is_err()) {
            close();
            return retried.error();
        }
    }

    log::debug("dependency cache at %s", base.c_str());
    return ok_status();
}

void DependencyCache::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool DependencyCache::is_open() const {
    return impl_->db != nullptr;
}

const fs::path& DependencyCache::root() const {
    return impl_->root;
}

void DependencyCache::set_volatile_patterns(std::vector<std::string> patterns) {
    impl_->volatile_set = GlobSet(std::move(patterns));
}

Result<CacheEntry> DependencyCache::lookup(const Fingerprint& fp) {
    KILN_TRY(impl_->require_open());
    KILN_TRY(check_fingerprint(fp.hex));

    if (!impl_->committed(fp.hex)) {
        auto erased = impl_->erase(fp.hex);
        if (erased.is_err()) {
            log::warn("%s", erased.error().message.c_str());
        }
        return KilnError{KilnError::NotFound,
            "no cached dependency artifacts for " + fp.short_hex()};
    }

    auto row = impl_->select(fp.hex);
    if (row.is_err(KilnError::NotFound)) {
        // Committed by a build that exited before indexing it
        row = impl_->adopt(fp.hex);
    }
    if (row.is_err()) return row.error();

    CacheEntry entry = std::move(row).value();
    int64_t now = now_seconds();
    auto touched = impl_->touch(fp.hex, now);
    if (touched.is_err()) {
        log::warn("%s", touched.error().message.c_str());
    } else {
        entry.last_used_at = now;
        entry.hit_count += 1;
    }
    return Result<CacheEntry>::ok(std::move(entry));
}

Result<StoreOutcome> DependencyCache::store(const Fingerprint& fp,
                                            const fs::path& artifact_dir) {
    KILN_TRY(impl_->require_open());
    KILN_TRY(check_fingerprint(fp.hex));

    std::error_code ec;
    if (!fs::is_directory(artifact_dir, ec)) {
        return KilnError{KilnError::NotFound,
            "artifact directory " + artifact_dir.string() + " does not exist"};
    }

    KILN_TRY_ASSIGN(lock, FileLock::acquire(impl_->lock_path(fp.hex),
                                            FileLock::Exclusive, true));

    fs::path dest = impl_->entry_dir(fp.hex);
    if (impl_->committed(fp.hex)) {
        KILN_TRY_ASSIGN(existing, read_record(dest));
        KILN_TRY_ASSIGN(digest, hash_tree(artifact_dir, impl_->volatile_set));
        if (digest.hex != existing.content_digest) {
            return KilnError{KilnError::FingerprintCollision,
                "fingerprint " + fp.short_hex() + " already holds different artifacts "
                "(stored " + existing.content_digest.substr(0, 12) +
                ", offered " + digest.hex.substr(0, 12) + ")",
                "if the compiler writes nondeterministic files, list them under "
                "[cache] volatile"}.with_fingerprint(fp.hex);
        }
        if (impl_->select(fp.hex).is_err(KilnError::NotFound)) {
            KILN_TRY(impl_->adopt(fp.hex));
        }
        log::debug("dependency artifacts %s already cached", fp.short_hex().c_str());
        return Result<StoreOutcome>::ok(StoreOutcome::AlreadyPresent);
    }

    // A directory without a commit record cannot come from a completed
    // rename; clear it so the rename below can succeed
    if (fs::exists(dest, ec)) {
        log::warn("removing incomplete cache entry %s", fp.short_hex().c_str());
        KILN_TRY(remove_tree(dest));
    }

    fs::path stage = impl_->staging_dir() / ("store." + fp.hex + "." + unique_token());
    StagingGuard guard(stage);

    KILN_TRY_ASSIGN(copied, copy_tree(artifact_dir, stage / ARTIFACTS_NAME));
    KILN_TRY_ASSIGN(digest, hash_tree(stage / ARTIFACTS_NAME, impl_->volatile_set));

    CacheEntry entry;
    entry.fingerprint = fp.hex;
    entry.content_digest = digest.hex;
    entry.size_bytes = copied.bytes;
    entry.file_count = copied.files;
    entry.created_at = now_seconds();
    entry.last_used_at = entry.created_at;
    KILN_TRY(write_file_atomic(stage / RECORD_NAME, format_record(entry)));

    fs::rename(stage, dest, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot commit cache entry " + fp.short_hex() + ": " + ec.message()};
    }
    guard.release();
    entry.artifact_dir = dest / ARTIFACTS_NAME;

    auto indexed = impl_->upsert(entry);
    if (indexed.is_err()) {
        log::warn("%s (the entry is adopted on next lookup)",
                  indexed.error().message.c_str());
    }

    log::info("cached dependency artifacts %s (%lld files, %lld bytes)",
              fp.short_hex().c_str(),
              static_cast<long long>(entry.file_count),
              static_cast<long long>(entry.size_bytes));
    return Result<StoreOutcome>::ok(StoreOutcome::Stored);
}

Status DependencyCache::restore(const CacheEntry& entry, const fs::path& dest) {
    KILN_TRY(impl_->require_open());
    KILN_TRY(check_fingerprint(entry.fingerprint));

    KILN_TRY_ASSIGN(lock, FileLock::acquire(impl_->lock_path(entry.fingerprint),
                                            FileLock::Shared, true));

    fs::path src = impl_->entry_dir(entry.fingerprint) / ARTIFACTS_NAME;
    std::error_code ec;
    if (!fs::is_directory(src, ec)) {
        return KilnError{KilnError::NotFound,
            "cache entry " + entry.fingerprint.substr(0, 12) + " was evicted"};
    }

    KILN_TRY(remove_tree(dest));
    KILN_TRY_ASSIGN(copied, copy_tree(src, dest));
    log::debug("restored %lld cached files into %s",
               static_cast<long long>(copied.files), dest.c_str());
    return ok_status();
}

Result<std::vector<std::string>> DependencyCache::evict(const EvictionPolicy& policy) {
    KILN_TRY(impl_->require_open());
    KILN_TRY(impl_->sweep());
    KILN_TRY_ASSIGN(entries, impl_->select_all());

    int64_t now = now_seconds();
    int64_t count = static_cast<int64_t>(entries.size());
    int64_t bytes = 0;
    for (const auto& e : entries) bytes += e.size_bytes;

    std::vector<std::string> removed;
    for (const auto& e : entries) {
        if (policy.keep.count(e.fingerprint)) continue;

        bool expired = policy.max_age_seconds > 0 &&
                       now - e.last_used_at > policy.max_age_seconds;
        bool over_count = policy.max_entries > 0 && count > policy.max_entries;
        bool over_size = policy.max_bytes > 0 && bytes > policy.max_bytes;
        if (!policy.everything && !expired && !over_count && !over_size) continue;

        auto lock = FileLock::acquire(impl_->lock_path(e.fingerprint),
                                      FileLock::Exclusive, false);
        if (lock.is_err(KilnError::CacheStoreConflict)) {
            log::debug("skipping busy cache entry %s", e.fingerprint.substr(0, 12).c_str());
            continue;
        }
        if (lock.is_err()) return lock.error();

        KILN_TRY(impl_->discard(e.fingerprint));
        count -= 1;
        bytes -= e.size_bytes;
        removed.push_back(e.fingerprint);
        log::debug("evicted cache entry %s", e.fingerprint.substr(0, 12).c_str());
    }

    if (!removed.empty()) {
        log::info("evicted %zu cache entr%s", removed.size(),
                  removed.size() == 1 ? "y" : "ies");
    }
    return Result<std::vector<std::string>>::ok(std::move(removed));
}

Status DependencyCache::remove(const Fingerprint& fp) {
    KILN_TRY(impl_->require_open());
    KILN_TRY(check_fingerprint(fp.hex));

    KILN_TRY_ASSIGN(lock, FileLock::acquire(impl_->lock_path(fp.hex),
                                            FileLock::Exclusive, true));
    bool had_dir = impl_->committed(fp.hex);
    bool had_row = impl_->select(fp.hex).is_ok();
    if (!had_dir && !had_row) {
        return KilnError{KilnError::NotFound, "no cache entry " + fp.short_hex()};
    }
    return impl_->discard(fp.hex);
}

Result<std::vector<CacheEntry>> DependencyCache::list() {
    KILN_TRY(impl_->require_open());
    return impl_->select_all();
}

Result<DepCacheStats> DependencyCache::stats() {
    KILN_TRY(impl_->require_open());
    KILN_TRY_ASSIGN(entries, impl_->select_all());

    DepCacheStats s;
    s.entries = static_cast<int64_t>(entries.size());
    for (const auto& e : entries) {
        s.total_bytes += e.size_bytes;
        s.total_files += e.file_count;
        s.total_hits += e.hit_count;
    }

    std::error_code ec;
    for (auto it = fs::directory_iterator(impl_->staging_dir(), ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        s.staging_dirs += 1;
    }
    return Result<DepCacheStats>::ok(s);
}

Status DependencyCache::clear() {
    EvictionPolicy all;
    all.everything = true;
    KILN_TRY_ASSIGN(removed, evict(all));
    KILN_TRY_ASSIGN(left, impl_->select_all());
    if (!left.empty()) {
        return KilnError{KilnError::CacheStoreConflict,
            std::to_string(left.size()) + " cache entries are in use and were kept",
            "retry once running builds finish"};
    }
    log::debug("cleared %zu cache entries", removed.size());
    return ok_status();
}

} // namespace kiln
