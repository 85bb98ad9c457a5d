#pragma once

#include <kiln/result.hpp>
#include <string>
#include <vector>

namespace kiln {

// One [[package]] entry of a resolved lock
struct LockedPackage {
    std::string name;
    std::string version;
    std::string source;          // "registry+<url>", "git+<url>#<sha>", empty for local
    std::string checksum;        // empty for git and local packages
    std::vector<std::string> dependencies;  // raw references, see DependencyRef

    bool is_local() const { return source.empty(); }
    // "name version"
    std::string id() const;
};

// Reference to a locked package inside a `dependencies` list:
// "name", "name version" or "name version (source)"
struct DependencyRef {
    std::string name;
    std::string version;
    std::string source;

    static Result<DependencyRef> parse(const std::string& raw);
};

struct LockFile {
    int format_version = 0;      // top-level `version`, 0 when absent
    std::vector<LockedPackage> packages;
    std::string path;            // origin, for diagnostics

    static Result<LockFile> parse(const std::string& toml_str,
                                  const std::string& origin = "");
    static Result<LockFile> load(const std::string& path);

    // All entries named `name`
    std::vector<const LockedPackage*> find_all(const std::string& name) const;

    // Resolve a reference to exactly one entry. Fails with NotFound when
    // nothing matches and InvalidArg when the reference is ambiguous.
    Result<const LockedPackage*> resolve(const DependencyRef& ref) const;
};

} // namespace kiln
