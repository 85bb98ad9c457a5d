#pragma once

#include <string>

namespace kiln {

struct KilnError {
    enum Code {
        IO,
        Parse,
        Config,
        Version,
        NotFound,
        InvalidArg,
        Process,
        CompileFailed,
        MalformedManifest,
        DependencyCompile,
        ApplicationCompile,
        ReconciliationFailed,
        CacheStoreConflict,
        FingerprintCollision
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    // Build context, filled in by the orchestrator as the error propagates
    std::string phase;
    std::string fingerprint;
    std::string diagnostic;     // compiler output, verbatim

    KilnError() = default;
    KilnError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    KilnError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    KilnError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    KilnError& with_phase(std::string p) { phase = std::move(p); return *this; }
    KilnError& with_fingerprint(std::string fp) { fingerprint = std::move(fp); return *this; }
    KilnError& with_diagnostic(std::string d) { diagnostic = std::move(d); return *this; }

    // Fatal errors must never be retried automatically
    bool is_fatal() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace kiln
