#include <kiln/compiler.hpp>
#include <kiln/log.hpp>
#include <kiln/process.hpp>

#include <sstream>

namespace fs = std::filesystem;

namespace kiln {

CommandSpec CommandSpec::cargo_release() {
    CommandSpec spec;
    spec.argv = {"cargo", "build", "--release", "--target-dir", "{{ cache }}"};
    spec.output = "{{ cache }}/{{ profile }}/{{ package }}";
    return spec;
}

CommandCompiler::CommandCompiler(CommandSpec spec, TemplateVars vars)
    : spec_(std::move(spec)), vars_(std::move(vars)) {}

Result<CompileOutput> CommandCompiler::compile(const fs::path& source_root,
                                               const fs::path& cache_dir) {
    TemplateVars vars = vars_;
    vars["source"] = source_root.string();
    vars["cache"] = cache_dir.string();

    auto argv = expand_templates(spec_.argv, vars);
    if (argv.is_err()) {
        return argv.error();
    }
    if (argv.value().empty()) {
        return KilnError{KilnError::Config, "toolchain command is empty",
                         "set [toolchain] command in kiln.toml"};
    }

    CommandOptions options;
    options.working_dir = source_root.string();
    options.timeout_seconds = spec_.timeout_seconds;
    for (const auto& [name, value] : spec_.env) {
        KILN_TRY_ASSIGN(expanded, expand_template(value, vars));
        options.env[name] = expanded;
    }

    KILN_TRY_ASSIGN(result, run_command(argv.value(), options));
    CompileOutput out;
    out.log = result.combined_output();

    if (!result.success()) {
        return KilnError{KilnError::CompileFailed,
            argv.value()[0] + " exited with status " + std::to_string(result.exit_code)}
            .with_diagnostic(out.log);
    }

    KILN_TRY_ASSIGN(output, expand_template(spec_.output, vars));
    fs::path binary(output);
    if (binary.is_relative()) binary = source_root / binary;

    std::error_code ec;
    if (!fs::is_regular_file(binary, ec)) {
        return KilnError{KilnError::Process,
            argv.value()[0] + " succeeded but produced no binary at " + binary.string(),
            "check [toolchain] output"}.with_diagnostic(out.log);
    }
    out.binary = binary;
    log::debug("compiled %s", binary.c_str());
    return Result<CompileOutput>::ok(std::move(out));
}

std::string CommandCompiler::identity() const {
    std::ostringstream ss;
    ss << "command";
    for (const auto& a : spec_.argv) ss << ' ' << a;
    ss << '\n';
    for (const auto& [name, value] : spec_.env) {
        ss << "env " << name << '=' << value << '\n';
    }
    auto profile = vars_.find("profile");
    if (profile != vars_.end()) ss << "profile " << profile->second << '\n';
    return ss.str();
}

} // namespace kiln
