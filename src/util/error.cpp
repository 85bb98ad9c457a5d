#include <kiln/error.hpp>

namespace kiln {

const char* KilnError::code_name(Code c) {
    switch (c) {
        case IO:                   return "IO";
        case Parse:                return "Parse";
        case Config:               return "Config";
        case Version:              return "Version";
        case NotFound:             return "NotFound";
        case InvalidArg:           return "InvalidArg";
        case Process:              return "Process";
        case CompileFailed:        return "CompileFailed";
        case MalformedManifest:    return "MalformedManifest";
        case DependencyCompile:    return "DependencyCompileError";
        case ApplicationCompile:   return "ApplicationCompileError";
        case ReconciliationFailed: return "ReconciliationFailed";
        case CacheStoreConflict:   return "CacheStoreConflict";
        case FingerprintCollision: return "FingerprintCollision";
    }
    return "Unknown";
}

bool KilnError::is_fatal() const {
    return code == MalformedManifest ||
           code == ReconciliationFailed ||
           code == FingerprintCollision;
}

std::string KilnError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!phase.empty()) {
        result += "\n  phase: ";
        result += phase;
    }
    if (!fingerprint.empty()) {
        result += "\n  fingerprint: ";
        result += fingerprint;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    if (!diagnostic.empty()) {
        result += "\n  compiler output:\n";
        // Indent each diagnostic line so it reads as part of this error
        size_t start = 0;
        while (start < diagnostic.size()) {
            size_t nl = diagnostic.find('\n', start);
            size_t end = nl == std::string::npos ? diagnostic.size() : nl;
            result += "    ";
            result.append(diagnostic, start, end - start);
            result += "\n";
            if (nl == std::string::npos) break;
            start = nl + 1;
        }
        result.pop_back();
    }

    return result;
}

} // namespace kiln
