#pragma once

#include <kiln/result.hpp>
#include <kiln/lockfile.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

enum class DependencyKind { Normal, Build, Dev };

const char* dependency_kind_name(DependencyKind kind);

// One entry of a [*dependencies] table
struct DeclaredDependency {
    std::string name;            // key as written in the manifest
    std::string package;         // real package name (differs when renamed)
    std::string req;             // version requirement, empty if none given
    DependencyKind kind = DependencyKind::Normal;
    std::string target;          // cfg expression for [target.<cfg>.*], else empty
    std::optional<std::string> path;
    std::optional<std::string> git;
    bool optional = false;
};

// [[bin]] entry, or the implicit default binary
struct BinTarget {
    std::string name;
    std::string path;            // relative to the package root
};

// [package] section
struct PackageInfo {
    std::string name;
    std::string version;
    std::string build_script;    // `build` key, empty if none
};

// A dependency manifest: declared dependencies plus the resolved lock
struct Manifest {
    PackageInfo package;
    std::vector<DeclaredDependency> dependencies;
    std::vector<BinTarget> bins;
    std::optional<std::string> lib_path;
    LockFile lock;

    std::string manifest_path;
    std::string lock_path;

    // Parse the manifest and lock documents. Only syntax and shape are
    // checked here; see validate().
    static Result<Manifest> parse(const std::string& manifest_toml,
                                  const std::string& lock_toml,
                                  const std::string& manifest_origin = "",
                                  const std::string& lock_origin = "");

    static Result<Manifest> load(const std::string& project_dir,
                                 const std::string& manifest_file = "Cargo.toml",
                                 const std::string& lock_file = "Cargo.lock");

    // Internal consistency between declarations and lock. Fails with
    // MalformedManifest naming the first inconsistency found.
    Status validate() const;

    // The lock entry for this package itself
    const LockedPackage* root_package() const;

    // Declared dependencies with a `path` source
    std::vector<const DeclaredDependency*> path_dependencies() const;
};

} // namespace kiln
