#include <kiln/manifest.hpp>
#include <kiln/version.hpp>
#include <tomlplusplus/toml.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <tuple>

namespace fs = std::filesystem;

namespace kiln {

const char* dependency_kind_name(DependencyKind kind) {
    switch (kind) {
        case DependencyKind::Normal: return "dependencies";
        case DependencyKind::Build:  return "build-dependencies";
        case DependencyKind::Dev:    return "dev-dependencies";
    }
    return "dependencies";
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static KilnError malformed(const std::string& msg, const std::string& origin,
                           const toml::source_region& where) {
    return KilnError{KilnError::MalformedManifest, msg, "", origin,
                     static_cast<int>(where.begin.line)};
}

static Result<DeclaredDependency> parse_dependency(const std::string& key,
                                                   const toml::node& node,
                                                   DependencyKind kind,
                                                   const std::string& target,
                                                   const std::string& origin) {
    DeclaredDependency dep;
    dep.name = key;
    dep.package = key;
    dep.kind = kind;
    dep.target = target;

    // serde = "1.0"
    if (auto req = node.value<std::string>()) {
        dep.req = *req;
        return Result<DeclaredDependency>::ok(std::move(dep));
    }

    const auto* tbl = node.as_table();
    if (!tbl) {
        return malformed("dependency '" + key + "' must be a string or a table",
                         origin, node.source());
    }

    if (auto v = (*tbl)["version"].value<std::string>()) dep.req = *v;
    if (auto v = (*tbl)["package"].value<std::string>()) dep.package = *v;
    if (auto v = (*tbl)["path"].value<std::string>()) dep.path = *v;
    if (auto v = (*tbl)["git"].value<std::string>()) dep.git = *v;
    if (auto v = (*tbl)["optional"].value<bool>()) dep.optional = *v;

    if ((*tbl)["workspace"].value<bool>().value_or(false)) {
        return malformed("dependency '" + key + "' inherits from a workspace",
                         origin, node.source());
    }
    if (dep.req.empty() && !dep.path && !dep.git) {
        return malformed("dependency '" + key + "' has no version, path or git source",
                         origin, node.source());
    }

    return Result<DeclaredDependency>::ok(std::move(dep));
}

static Status parse_dependency_table(const toml::table& owner,
                                     const std::string& target,
                                     const std::string& origin,
                                     std::vector<DeclaredDependency>& out) {
    static const std::pair<const char*, DependencyKind> sections[] = {
        {"dependencies", DependencyKind::Normal},
        {"build-dependencies", DependencyKind::Build},
        {"dev-dependencies", DependencyKind::Dev},
    };

    for (const auto& [section, kind] : sections) {
        const auto* tbl = owner[section].as_table();
        if (!tbl) continue;
        for (const auto& [key, val] : *tbl) {
            auto dep = parse_dependency(std::string(key.str()), val, kind, target, origin);
            if (dep.is_err()) return std::move(dep).error();
            out.push_back(std::move(dep).value());
        }
    }
    return ok_status();
}

static Result<std::vector<BinTarget>> parse_bins(const toml::table& doc,
                                                 const PackageInfo& pkg,
                                                 const std::string& origin) {
    std::vector<BinTarget> bins;

    if (const auto* arr = doc["bin"].as_array()) {
        for (const auto& elem : *arr) {
            const auto* tbl = elem.as_table();
            auto name = tbl ? (*tbl)["name"].value<std::string>() : std::nullopt;
            if (!name) {
                return malformed("[[bin]] entry requires a 'name'", origin, elem.source());
            }
            BinTarget bin;
            bin.name = *name;
            if (auto p = (*tbl)["path"].value<std::string>()) {
                bin.path = *p;
            } else if (bin.name == pkg.name) {
                bin.path = "src/main.rs";
            } else {
                bin.path = "src/bin/" + bin.name + ".rs";
            }
            bins.push_back(std::move(bin));
        }
    }

    // The implicit binary exists unless [[bin]] entries or autobins say otherwise
    bool autobins = doc["package"]["autobins"].value<bool>().value_or(true);
    if (bins.empty() && autobins) {
        bins.push_back(BinTarget{pkg.name, "src/main.rs"});
    }

    return Result<std::vector<BinTarget>>::ok(std::move(bins));
}

static Result<std::string> read_text(const std::string& path, const char* what) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return KilnError{KilnError::MalformedManifest,
            std::string("cannot open ") + what + ": " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

// ---------------------------------------------------------------------------
// Manifest::parse / load
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& manifest_toml,
                                 const std::string& lock_toml,
                                 const std::string& manifest_origin,
                                 const std::string& lock_origin) {
    toml::table doc;
    try {
        doc = toml::parse(manifest_toml, manifest_origin);
    } catch (const toml::parse_error& e) {
        return KilnError{KilnError::MalformedManifest,
            std::string("manifest is not valid TOML: ") + std::string(e.description()),
            "", manifest_origin, static_cast<int>(e.source().begin.line)};
    }

    Manifest m;
    m.manifest_path = manifest_origin;
    m.lock_path = lock_origin;

    const auto* pkg = doc["package"].as_table();
    if (!pkg) {
        return KilnError{KilnError::MalformedManifest,
            "manifest has no [package] section",
            "workspace roots without a package are not supported",
            manifest_origin, 0};
    }
    auto name = (*pkg)["name"].value<std::string>();
    if (!name || name->empty()) {
        return malformed("[package] requires a 'name'", manifest_origin, pkg->source());
    }
    m.package.name = *name;
    if (auto v = (*pkg)["version"].value<std::string>()) m.package.version = *v;
    if (auto v = (*pkg)["build"].value<std::string>()) m.package.build_script = *v;

    KILN_TRY(parse_dependency_table(doc, "", manifest_origin, m.dependencies));

    if (const auto* targets = doc["target"].as_table()) {
        for (const auto& [cfg, val] : *targets) {
            if (const auto* tbl = val.as_table()) {
                KILN_TRY(parse_dependency_table(*tbl, std::string(cfg.str()),
                                                manifest_origin, m.dependencies));
            }
        }
    }

    KILN_TRY_ASSIGN(bins, parse_bins(doc, m.package, manifest_origin));
    m.bins = std::move(bins);

    if (const auto* lib = doc["lib"].as_table()) {
        m.lib_path = (*lib)["path"].value<std::string>().value_or("src/lib.rs");
    }

    KILN_TRY_ASSIGN(lock, LockFile::parse(lock_toml, lock_origin));
    m.lock = std::move(lock);

    return Result<Manifest>::ok(std::move(m));
}

Result<Manifest> Manifest::load(const std::string& project_dir,
                                const std::string& manifest_file,
                                const std::string& lock_file) {
    std::string manifest_path = (fs::path(project_dir) / manifest_file).string();
    std::string lock_path = (fs::path(project_dir) / lock_file).string();

    KILN_TRY_ASSIGN(manifest_text, read_text(manifest_path, "manifest"));
    KILN_TRY_ASSIGN(lock_text, read_text(lock_path, "lock file"));
    return Manifest::parse(manifest_text, lock_text, manifest_path, lock_path);
}

// ---------------------------------------------------------------------------
// Consistency
// ---------------------------------------------------------------------------

const LockedPackage* Manifest::root_package() const {
    for (const auto& p : lock.packages) {
        if (p.name == package.name && p.is_local()) return &p;
    }
    return nullptr;
}

std::vector<const DeclaredDependency*> Manifest::path_dependencies() const {
    std::vector<const DeclaredDependency*> out;
    for (const auto& d : dependencies) {
        if (d.path) out.push_back(&d);
    }
    return out;
}

Status Manifest::validate() const {
    auto fail = [&](std::string msg, std::string hint = "") -> Status {
        return KilnError{KilnError::MalformedManifest, std::move(msg),
                         std::move(hint), lock_path, 0};
    };

    // Duplicates and unparsable versions
    std::set<std::tuple<std::string, std::string, std::string>> seen;
    for (const auto& p : lock.packages) {
        if (!seen.emplace(p.name, p.version, p.source).second) {
            return fail("lock lists '" + p.id() + "' more than once");
        }
        if (Version::parse(p.version).is_err()) {
            return fail("locked package '" + p.name + "' has invalid version '" +
                        p.version + "'");
        }
    }

    size_t root_count = 0;
    for (const auto& p : lock.packages) {
        if (p.name == package.name && p.is_local()) ++root_count;
    }
    if (root_count != 1) {
        return fail("lock has " + std::to_string(root_count) +
                    " entries for the package '" + package.name + "' itself",
                    "the lock does not belong to this manifest; regenerate it");
    }
    const LockedPackage* root = root_package();

    // Resolve every edge in the lock
    std::map<const LockedPackage*, std::vector<const LockedPackage*>> edges;
    for (const auto& p : lock.packages) {
        auto& out = edges[&p];
        for (const auto& raw : p.dependencies) {
            auto ref = DependencyRef::parse(raw);
            if (ref.is_err()) return std::move(ref).error();
            auto target = lock.resolve(ref.value());
            if (target.is_err()) {
                return fail("dependency '" + raw + "' of locked package '" +
                            p.id() + "' cannot be resolved: " +
                            target.error().message);
            }
            out.push_back(target.value());
        }
    }

    // Declared -> lock
    std::set<std::string> declared_names;
    for (const auto& d : dependencies) {
        declared_names.insert(d.package);
        auto candidates = lock.find_all(d.package);
        if (candidates.empty()) {
            return fail("declared dependency '" + d.name + "' is absent from the lock",
                        "run the dependency resolver to update the lock");
        }
        if (d.req.empty()) continue;

        auto req = VersionReq::parse(d.req);
        if (req.is_err()) {
            return KilnError{KilnError::MalformedManifest,
                "dependency '" + d.name + "' has invalid version requirement: " +
                req.error().message, "", manifest_path, 0};
        }
        bool satisfied = false;
        for (const auto* c : candidates) {
            auto v = Version::parse(c->version);
            if (v.is_ok() && req.value().matches(v.value())) {
                satisfied = true;
                break;
            }
        }
        if (!satisfied) {
            return fail("no locked version of '" + d.name + "' satisfies '" + d.req + "'",
                        "the lock is out of date with the manifest");
        }
    }

    // Lock -> declared: the root's edges must be declared dependencies
    for (const auto* dep : edges[root]) {
        if (!declared_names.count(dep->name)) {
            return fail("lock lists '" + dep->id() + "' as a direct dependency, "
                        "but the manifest does not declare it",
                        "the lock is out of date with the manifest");
        }
    }

    // Everything in the lock must be reachable from the root
    std::set<const LockedPackage*> reached{root};
    std::vector<const LockedPackage*> stack{root};
    while (!stack.empty()) {
        const auto* cur = stack.back();
        stack.pop_back();
        for (const auto* next : edges[cur]) {
            if (reached.insert(next).second) stack.push_back(next);
        }
    }
    for (const auto& p : lock.packages) {
        if (!reached.count(&p)) {
            return fail("locked package '" + p.id() +
                        "' is not required by any declared dependency",
                        "the lock is out of date with the manifest");
        }
    }

    return ok_status();
}

} // namespace kiln
