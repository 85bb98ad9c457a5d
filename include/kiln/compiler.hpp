#pragma once

#include <kiln/result.hpp>
#include <kiln/template.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace kiln {

struct CompileOutput {
    std::filesystem::path binary;
    std::string log;            // compiler output, verbatim
};

// A whole-project compiler that keeps incremental state in a cache
// directory. A compiler that ran and rejected the sources reports
// CompileFailed with its output as the diagnostic; any other code means the
// toolchain itself could not be used.
class Compiler {
public:
    virtual ~Compiler() = default;

    virtual Result<CompileOutput> compile(const std::filesystem::path& source_root,
                                          const std::filesystem::path& cache_dir) = 0;

    // Distinguishes toolchain setups whose artifacts are not interchangeable
    virtual std::string identity() const = 0;
};

// Command line and environment templates for CommandCompiler. Templates see
// {{ source }}, {{ cache }}, {{ package }} and {{ profile }}.
struct CommandSpec {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
    std::string output;             // binary path; relative to the source root
    int timeout_seconds = 0;

    // cargo build --release with the target directory in the cache dir
    static CommandSpec cargo_release();
};

class CommandCompiler : public Compiler {
public:
    // `vars` supplies package and profile; source and cache are set per call
    CommandCompiler(CommandSpec spec, TemplateVars vars);

    Result<CompileOutput> compile(const std::filesystem::path& source_root,
                                  const std::filesystem::path& cache_dir) override;

    std::string identity() const override;

    const CommandSpec& spec() const { return spec_; }

private:
    CommandSpec spec_;
    TemplateVars vars_;
};

} // namespace kiln
