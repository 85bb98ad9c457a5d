#include <kiln/fingerprint.hpp>
#include <kiln/log.hpp>
#include <kiln/sha256.hpp>

#include <algorithm>
#include <tuple>

namespace kiln {

static constexpr const char* CANONICAL_HEADER = "kiln-fingerprint 1\n";

bool Fingerprint::is_valid(const std::string& s) {
    if (s.size() != 64) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

Fingerprinter::Fingerprinter(std::string salt) : salt_(std::move(salt)) {}

// Sorted "name version" ids of a package's resolved dependencies
static Result<std::vector<std::string>> resolved_edges(const LockFile& lock,
                                                       const LockedPackage& pkg) {
    std::vector<std::string> ids;
    ids.reserve(pkg.dependencies.size());
    for (const auto& raw : pkg.dependencies) {
        KILN_TRY_ASSIGN(ref, DependencyRef::parse(raw));
        auto target = lock.resolve(ref);
        if (target.is_err()) {
            return KilnError{KilnError::MalformedManifest,
                "cannot resolve '" + raw + "': " + target.error().message};
        }
        ids.push_back(target.value()->id());
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return Result<std::vector<std::string>>::ok(std::move(ids));
}

Result<std::string> Fingerprinter::canonical_text(const Manifest& manifest) const {
    KILN_TRY(manifest.validate());

    const LockedPackage* root = manifest.root_package();

    std::vector<const LockedPackage*> packages;
    for (const auto& p : manifest.lock.packages) {
        if (&p != root) packages.push_back(&p);
    }
    std::sort(packages.begin(), packages.end(),
        [](const LockedPackage* a, const LockedPackage* b) {
            return std::tie(a->name, a->version, a->source) <
                   std::tie(b->name, b->version, b->source);
        });

    std::string text = CANONICAL_HEADER;
    if (!salt_.empty()) {
        text += "salt " + salt_ + "\n";
    }

    // The root contributes its edges only: its own version is application identity
    text += "root\n";
    KILN_TRY_ASSIGN(root_edges, resolved_edges(manifest.lock, *root));
    for (const auto& id : root_edges) {
        text += "  dep " + id + "\n";
    }

    for (const auto* p : packages) {
        text += "package " + p->id() + " " + (p->is_local() ? "local" : p->source) + "\n";
        if (!p->checksum.empty()) {
            text += "  checksum " + p->checksum + "\n";
        }
        KILN_TRY_ASSIGN(edges, resolved_edges(manifest.lock, *p));
        for (const auto& id : edges) {
            text += "  dep " + id + "\n";
        }
    }

    return Result<std::string>::ok(std::move(text));
}

Result<Fingerprint> Fingerprinter::fingerprint(const Manifest& manifest) const {
    KILN_TRY_ASSIGN(text, canonical_text(manifest));

    Fingerprint fp{SHA256::hash_hex(text)};
    log::debug("fingerprint %s over %zu locked packages",
               fp.short_hex().c_str(), manifest.lock.packages.size());
    return Result<Fingerprint>::ok(std::move(fp));
}

} // namespace kiln
