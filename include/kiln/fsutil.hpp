#pragma once

#include <kiln/result.hpp>
#include <kiln/glob.hpp>
#include <cstdint>
#include <filesystem>
#include <string>

namespace kiln {

Result<std::string> read_file(const std::filesystem::path& path);

// Write through a temporary sibling and rename it into place, so readers
// see either the old content or the new content
Status write_file_atomic(const std::filesystem::path& path, const std::string& content);

// Copy `src` to `dest` through a temporary sibling and rename
Status copy_file_atomic(const std::filesystem::path& src, const std::filesystem::path& dest);

struct CopyStats {
    int64_t files = 0;
    int64_t bytes = 0;
};

// Recursively copy a directory. Regular files keep their permissions and
// modification times; symlinks are copied as links. Paths matched by
// `exclude` (relative to src) are skipped, directories included.
Result<CopyStats> copy_tree(const std::filesystem::path& src,
                            const std::filesystem::path& dest,
                            const GlobSet& exclude = GlobSet());

struct TreeDigest {
    std::string hex;
    int64_t files = 0;
    int64_t bytes = 0;
};

// Order-independent digest over relative paths, link targets and file
// contents. Paths matched by `exclude` are left out.
Result<TreeDigest> hash_tree(const std::filesystem::path& root,
                             const GlobSet& exclude = GlobSet());

// Newest modification time of `root` and everything below it
Result<std::filesystem::file_time_type> newest_mtime(const std::filesystem::path& root);

// remove_all reporting failures
Status remove_tree(const std::filesystem::path& path);

// Short random token for temporary names ("<pid>-<16 hex>")
std::string unique_token();

} // namespace kiln
