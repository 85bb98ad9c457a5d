#include <kiln/lockfile.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>

namespace kiln {

std::string LockedPackage::id() const {
    return name + " " + version;
}

Result<DependencyRef> DependencyRef::parse(const std::string& raw) {
    DependencyRef ref;
    std::string rest = raw;

    size_t paren = rest.find(" (");
    if (paren != std::string::npos) {
        if (rest.back() != ')') {
            return KilnError{KilnError::MalformedManifest,
                "unterminated source in dependency reference '" + raw + "'"};
        }
        ref.source = rest.substr(paren + 2, rest.size() - paren - 3);
        rest = rest.substr(0, paren);
    }

    size_t space = rest.find(' ');
    if (space != std::string::npos) {
        ref.version = rest.substr(space + 1);
        rest = rest.substr(0, space);
        if (ref.version.find(' ') != std::string::npos) {
            return KilnError{KilnError::MalformedManifest,
                "malformed dependency reference '" + raw + "'"};
        }
    }
    ref.name = rest;

    if (ref.name.empty()) {
        return KilnError{KilnError::MalformedManifest,
            "empty dependency reference in lock"};
    }
    return Result<DependencyRef>::ok(std::move(ref));
}

Result<LockFile> LockFile::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return KilnError{KilnError::MalformedManifest,
            std::string("lock file is not valid TOML: ") + std::string(e.description()),
            "regenerate the lock with the dependency resolver",
            origin, static_cast<int>(e.source().begin.line)};
    }

    LockFile lf;
    lf.path = origin;
    if (auto v = doc["version"].value<int64_t>()) {
        lf.format_version = static_cast<int>(*v);
    }

    auto packages = doc["package"].as_array();
    if (!packages) {
        return KilnError{KilnError::MalformedManifest,
            "lock file has no [[package]] entries", "", origin, 0};
    }

    for (const auto& elem : *packages) {
        const auto* tbl = elem.as_table();
        if (!tbl) {
            return KilnError{KilnError::MalformedManifest,
                "[[package]] entry is not a table", "", origin, 0};
        }

        LockedPackage pkg;
        auto name = (*tbl)["name"].value<std::string>();
        auto version = (*tbl)["version"].value<std::string>();
        if (!name || !version) {
            int line = static_cast<int>(tbl->source().begin.line);
            return KilnError{KilnError::MalformedManifest,
                "[[package]] entry is missing 'name' or 'version'", "", origin, line};
        }
        pkg.name = *name;
        pkg.version = *version;
        if (auto v = (*tbl)["source"].value<std::string>()) pkg.source = *v;
        if (auto v = (*tbl)["checksum"].value<std::string>()) pkg.checksum = *v;

        if (auto deps = (*tbl)["dependencies"].as_array()) {
            for (const auto& d : *deps) {
                auto s = d.value<std::string>();
                if (!s) {
                    return KilnError{KilnError::MalformedManifest,
                        "dependency list of '" + pkg.name + "' contains a non-string",
                        "", origin, static_cast<int>(d.source().begin.line)};
                }
                pkg.dependencies.push_back(*s);
            }
        }

        lf.packages.push_back(std::move(pkg));
    }

    return Result<LockFile>::ok(std::move(lf));
}

Result<LockFile> LockFile::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return KilnError{KilnError::MalformedManifest,
            "cannot open lock file: " + path,
            "generate the lock before building"};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return LockFile::parse(ss.str(), path);
}

std::vector<const LockedPackage*> LockFile::find_all(const std::string& name) const {
    std::vector<const LockedPackage*> out;
    for (const auto& p : packages) {
        if (p.name == name) out.push_back(&p);
    }
    return out;
}

Result<const LockedPackage*> LockFile::resolve(const DependencyRef& ref) const {
    std::vector<const LockedPackage*> matches;
    for (const auto& p : packages) {
        if (p.name != ref.name) continue;
        if (!ref.version.empty() && p.version != ref.version) continue;
        if (!ref.source.empty() && p.source != ref.source) continue;
        matches.push_back(&p);
    }

    std::string shown = ref.name;
    if (!ref.version.empty()) shown += " " + ref.version;

    if (matches.empty()) {
        return KilnError{KilnError::NotFound,
            "no locked package matches '" + shown + "'"};
    }
    if (matches.size() > 1) {
        return KilnError{KilnError::InvalidArg,
            "reference '" + shown + "' matches " +
            std::to_string(matches.size()) + " locked packages"};
    }
    return Result<const LockedPackage*>::ok(matches.front());
}

} // namespace kiln
