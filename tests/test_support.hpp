#pragma once

// Helpers shared by the kiln tests: scratch directories, Cargo project
// fixtures and a compiler double with incremental, mtime-driven rebuilds.

#include <kiln/compiler.hpp>
#include <kiln/manifest.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace kiln_test {

namespace fs = std::filesystem;

// Fresh, empty directory under /tmp unique to this process and call
inline fs::path temp_dir(const std::string& name) {
    static int counter = 0;
    fs::path dir = fs::temp_directory_path() /
        ("kiln_test_" + name + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline void write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Push a file's modification time `seconds` into the past
inline void age_file(const fs::path& path, int seconds) {
    auto t = fs::file_time_type::clock::now() - std::chrono::seconds(seconds);
    fs::last_write_time(path, t);
}

struct CrateSpec {
    std::string name;
    std::string version;
};

inline const char* REGISTRY = "registry+https://github.com/rust-lang/crates.io-index";

inline std::string cargo_toml(const std::string& package, const std::vector<CrateSpec>& deps,
                              const std::string& version = "0.1.0") {
    std::string out = "[package]\nname = \"" + package + "\"\nversion = \"" + version +
                      "\"\nedition = \"2018\"\n\n[dependencies]\n";
    for (const auto& d : deps) {
        out += d.name + " = \"" + d.version + "\"\n";
    }
    return out;
}

inline std::string cargo_lock(const std::string& package, const std::vector<CrateSpec>& deps,
                              const std::string& version = "0.1.0") {
    std::string out = "version = 3\n";
    out += "\n[[package]]\nname = \"" + package + "\"\nversion = \"" + version + "\"\n";
    if (!deps.empty()) {
        out += "dependencies = [\n";
        for (const auto& d : deps) out += " \"" + d.name + "\",\n";
        out += "]\n";
    }
    for (const auto& d : deps) {
        out += "\n[[package]]\nname = \"" + d.name + "\"\nversion = \"" + d.version +
               "\"\nsource = \"" + REGISTRY + "\"\nchecksum = \"" +
               std::string(64, d.name[0]) + "\"\n";
    }
    return out;
}

// Manifest, lock and src/main.rs
inline void write_cargo_project(const fs::path& dir, const std::string& package,
                                const std::vector<CrateSpec>& deps,
                                const std::string& main_rs) {
    write_file(dir / "Cargo.toml", cargo_toml(package, deps));
    write_file(dir / "Cargo.lock", cargo_lock(package, deps));
    write_file(dir / "src" / "main.rs", main_rs);
}

// Behaves like an incremental whole-project compiler: each locked
// dependency is compiled once into the cache directory, and the
// application unit is rebuilt only when a file under src/ is newer than the
// dep-info recorded by the previous build. Source containing
// "compile_error!" fails to compile, as does a dependency named
// "broken-dep".
class FakeCompiler : public kiln::Compiler {
public:
    int calls = 0;
    int dependency_builds = 0;
    int application_builds = 0;
    bool toolchain_missing = false;     // fail like an executable absent from PATH

    kiln::Result<kiln::CompileOutput> compile(const fs::path& source_root,
                                              const fs::path& cache_dir) override {
        ++calls;
        if (toolchain_missing) {
            return kiln::KilnError{kiln::KilnError::Process, "cannot execute 'cargo'",
                                   "check that the toolchain command exists and is on PATH"};
        }
        auto manifest = kiln::Manifest::load(source_root.string());
        if (manifest.is_err()) {
            return kiln::KilnError{kiln::KilnError::Process, "could not read manifest"}
                .with_diagnostic(manifest.error().message);
        }
        const auto& m = manifest.value();

        fs::path release = cache_dir / "release";
        fs::create_directories(release / "deps");

        std::string links;
        for (const auto& p : m.lock.packages) {
            if (p.is_local()) continue;
            if (p.name == "broken-dep") {
                return kiln::KilnError{kiln::KilnError::CompileFailed, "could not compile broken-dep"}
                    .with_diagnostic("error[E0425]: cannot find value `x` in broken-dep\n");
            }
            fs::path rlib = release / "deps" / ("lib" + p.name + "-" + p.version + ".rlib");
            if (!fs::exists(rlib)) {
                write_file(rlib, "rlib " + p.id() + "\n");
                ++dependency_builds;
            }
            links += "link " + p.id() + "\n";
        }

        const std::string& pkg = m.package.name;
        fs::path depinfo = release / (pkg + ".d");
        fs::path binary = release / pkg;

        bool stale = !fs::exists(depinfo) || !fs::exists(binary);
        if (!stale) {
            auto recorded = fs::last_write_time(depinfo);
            for (const auto& e : fs::recursive_directory_iterator(source_root / "src")) {
                if (e.is_regular_file() && e.last_write_time() > recorded) {
                    stale = true;
                    break;
                }
            }
        }

        if (stale) {
            std::string main_rs = read_file(source_root / "src" / "main.rs");
            if (main_rs.find("compile_error!") != std::string::npos) {
                return kiln::KilnError{kiln::KilnError::CompileFailed,
                    "could not compile `" + pkg + "`"}
                    .with_diagnostic("error: compile_error! invoked in src/main.rs\n");
            }
            write_file(binary, "binary " + pkg + "\n" + links + "main:\n" + main_rs);
            write_file(depinfo, binary.string() + ": src/main.rs\n");
            ++application_builds;
        }

        kiln::CompileOutput out;
        out.binary = binary;
        out.log = "Finished release target(s)\n";
        return kiln::Result<kiln::CompileOutput>::ok(std::move(out));
    }

    std::string identity() const override { return "fake-compiler 1\n"; }
};

} // namespace kiln_test
