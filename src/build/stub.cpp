#include <kiln/stub.hpp>
#include <kiln/fsutil.hpp>
#include <kiln/log.hpp>
#include <kiln/sha256.hpp>

#include <algorithm>
#include <cctype>
#include <map>

namespace fs = std::filesystem;

namespace kiln {

std::vector<std::string> StubSource::paths() const {
    std::vector<std::string> out;
    out.reserve(files.size());
    for (const auto& f : files) out.push_back(f.path);
    return out;
}

const StubFile* StubSource::find(const std::string& path) const {
    for (const auto& f : files) {
        if (f.path == path) return &f;
    }
    return nullptr;
}

std::string StubSource::digest() const {
    SHA256 ctx;
    for (const auto& f : files) {
        ctx.update("file " + f.path + "\n");
        ctx.update("size " + std::to_string(f.content.size()) + "\n");
        ctx.update(f.content);
    }
    return SHA256::to_hex(ctx.finalize());
}

const char* stub_profile_name(StubProfile profile) {
    switch (profile) {
        case StubProfile::Rust: return "rust";
        case StubProfile::C:    return "c";
        case StubProfile::Cpp:  return "cpp";
        case StubProfile::Go:   return "go";
    }
    return "unknown";
}

bool parse_stub_profile(const std::string& name, StubProfile& out) {
    if (name == "rust") { out = StubProfile::Rust; return true; }
    if (name == "c")    { out = StubProfile::C; return true; }
    if (name == "cpp" || name == "c++") { out = StubProfile::Cpp; return true; }
    if (name == "go")   { out = StubProfile::Go; return true; }
    return false;
}

// ---- Profile contents ----

static std::string entry_point(StubProfile profile) {
    switch (profile) {
        case StubProfile::Rust: return "fn main() {}\n";
        case StubProfile::C:    return "int main(void) { return 0; }\n";
        case StubProfile::Cpp:  return "int main() { return 0; }\n";
        case StubProfile::Go:   return "package main\n\nfunc main() {}\n";
    }
    return "";
}

// Go package clause for a library stub: identifiers only
static std::string go_package_name(const std::string& package) {
    std::string out;
    for (char c : package) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            out += static_cast<char>(std::tolower(uc));
        } else {
            out += '_';
        }
    }
    if (out.empty() || std::isdigit(static_cast<unsigned char>(out[0]))) {
        out = "pkg" + out;
    }
    return out;
}

static std::string library_unit(StubProfile profile, const std::string& package) {
    switch (profile) {
        case StubProfile::Rust: return "";
        // ISO C forbids an empty translation unit
        case StubProfile::C:    return "typedef int kiln_stub_unit;\n";
        case StubProfile::Cpp:  return "";
        case StubProfile::Go:   return "package " + go_package_name(package) + "\n";
    }
    return "";
}

static Status check_stub_path(const std::string& path) {
    fs::path p(path);
    if (path.empty() || p.is_absolute()) {
        return KilnError{KilnError::InvalidArg,
            "stub path '" + path + "' must be relative to the source root"};
    }
    for (const auto& part : p) {
        if (part == "..") {
            return KilnError{KilnError::InvalidArg,
                "stub path '" + path + "' leaves the source root"};
        }
    }
    return ok_status();
}

// ---- StubSynthesizer ----

StubSynthesizer::StubSynthesizer(StubProfile profile) : profile_(profile) {}

void StubSynthesizer::set_override(std::vector<StubFile> files) {
    override_ = std::move(files);
}

Result<StubSource> StubSynthesizer::synthesize(const Manifest& manifest) const {
    std::map<std::string, std::string> files;

    auto add = [&](const std::string& raw, const std::string& content) -> Status {
        std::string path = fs::path(raw).lexically_normal().generic_string();
        KILN_TRY(check_stub_path(path));
        auto [it, inserted] = files.emplace(path, content);
        if (!inserted && it->second != content) {
            return KilnError{KilnError::MalformedManifest,
                "two targets share the entry file '" + path + "'",
                "give each [[bin]] and [lib] its own path",
                manifest.manifest_path, 0};
        }
        return ok_status();
    };

    if (!override_.empty()) {
        for (const auto& f : override_) {
            KILN_TRY(add(f.path, f.content));
        }
    } else {
        for (const auto& bin : manifest.bins) {
            KILN_TRY(add(bin.path, entry_point(profile_)));
        }
        if (manifest.lib_path) {
            KILN_TRY(add(*manifest.lib_path, library_unit(profile_, manifest.package.name)));
        }
        // The compiler runs the build script before anything else
        if (profile_ == StubProfile::Rust && !manifest.package.build_script.empty()) {
            KILN_TRY(add(manifest.package.build_script, entry_point(profile_)));
        }
    }

    if (files.empty()) {
        return KilnError{KilnError::MalformedManifest,
            "package '" + manifest.package.name + "' declares no binary or library target",
            "add a [[bin]] or [lib] section",
            manifest.manifest_path, 0};
    }

    StubSource stub;
    for (auto& [path, content] : files) {
        stub.files.push_back({path, content});
    }
    return Result<StubSource>::ok(std::move(stub));
}

Result<std::vector<fs::path>> StubSynthesizer::write(const StubSource& stub,
                                                     const fs::path& root) const {
    std::vector<fs::path> written;
    for (const auto& f : stub.files) {
        KILN_TRY(check_stub_path(f.path));
        fs::path target = root / f.path;
        KILN_TRY(write_file_atomic(target, f.content));
        log::trace("wrote stub %s", f.path.c_str());
        written.push_back(target);
    }
    return Result<std::vector<fs::path>>::ok(std::move(written));
}

Status StubSynthesizer::remove(const StubSource& stub, const fs::path& root) const {
    for (const auto& f : stub.files) {
        KILN_TRY(check_stub_path(f.path));
        std::error_code ec;
        fs::remove(root / f.path, ec);
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot remove stub " + (root / f.path).string() + ": " + ec.message()};
        }
    }
    return ok_status();
}

} // namespace kiln
