#pragma once

#include <kiln/result.hpp>
#include <kiln/manifest.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace kiln {

struct StubFile {
    std::string path;       // relative to the source root, '/' separated
    std::string content;

    bool operator==(const StubFile& o) const {
        return path == o.path && content == o.content;
    }
};

// Placeholder application code for a dependency-only compile
struct StubSource {
    std::vector<StubFile> files;    // sorted by path

    std::vector<std::string> paths() const;
    const StubFile* find(const std::string& path) const;

    // SHA-256 over paths and contents
    std::string digest() const;
};

enum class StubProfile { Rust, C, Cpp, Go };

const char* stub_profile_name(StubProfile profile);
bool parse_stub_profile(const std::string& name, StubProfile& out);

// Produces the smallest linkable entry points for the manifest's targets.
// Stubs reference no application symbols and are byte-identical for the
// same manifest.
class StubSynthesizer {
public:
    explicit StubSynthesizer(StubProfile profile = StubProfile::Rust);

    // Fixed files replacing the built-in profile ([[stub.files]])
    void set_override(std::vector<StubFile> files);

    StubProfile profile() const { return profile_; }

    Result<StubSource> synthesize(const Manifest& manifest) const;

    // Materialize the stub under `root`, creating directories. Returns the
    // written paths.
    Result<std::vector<std::filesystem::path>> write(const StubSource& stub,
                                                     const std::filesystem::path& root) const;

    // Delete the stub files from `root`; files already gone are ignored
    Status remove(const StubSource& stub, const std::filesystem::path& root) const;

private:
    StubProfile profile_;
    std::vector<StubFile> override_;
};

} // namespace kiln
