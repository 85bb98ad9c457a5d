#pragma once

#include <kiln/result.hpp>
#include <kiln/manifest.hpp>
#include <string>

namespace kiln {

// SHA-256 over the canonical form of a resolved lock, 64 lowercase hex chars
struct Fingerprint {
    std::string hex;

    std::string short_hex() const { return hex.substr(0, 12); }

    static bool is_valid(const std::string& s);

    bool operator==(const Fingerprint& o) const { return hex == o.hex; }
    bool operator!=(const Fingerprint& o) const { return hex != o.hex; }
    bool operator<(const Fingerprint& o) const { return hex < o.hex; }
};

// Computes cache keys from the resolved dependency closure. Declaration
// order, TOML formatting, version constraints and the package's own version
// never affect the result; any change to a resolved package does.
class Fingerprinter {
public:
    // `salt` distinguishes toolchains or profiles sharing one cache
    explicit Fingerprinter(std::string salt = "");

    // Fails with MalformedManifest if the manifest and lock are inconsistent
    Result<Fingerprint> fingerprint(const Manifest& manifest) const;

    // The exact text that is hashed
    Result<std::string> canonical_text(const Manifest& manifest) const;

    const std::string& salt() const { return salt_; }

private:
    std::string salt_;
};

} // namespace kiln
