#pragma once

#include <kiln/result.hpp>
#include <string>
#include <vector>

namespace kiln {

// Resolved package version: major.minor.micro[-pre][+build]
struct Version {
    int major = 0;
    int minor = 0;
    int micro = 0;
    std::string pre;     // pre-release label, empty for a release
    std::string build;   // build metadata, ignored by comparisons

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const { return !pre.empty(); }

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Version inside a requirement: "1", "1.2", "1.2.3", "1.2.3-rc.1", "1.*"
struct PartialVersion {
    int major = 0;
    int minor = -1;      // -1 when unset or wildcard
    int micro = -1;
    std::string pre;

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;
};

enum class ConstraintOp {
    Caret,       // ^1.2.3, also the bare form "1.2.3"
    Tilde,       // ~1.2.3
    Exact,       // =1.2.3
    GreaterEq,   // >=1.2.3
    Greater,     // >1.2.3
    LessEq,      // <=1.2.3
    Less,        // <1.2.3
    Wildcard,    // *, 1.*, 1.2.*
};

struct VersionConstraint {
    ConstraintOp op = ConstraintOp::Caret;
    PartialVersion version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Comma-separated conjunction, Cargo dialect: ">=1.0, <2.0"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);
    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace kiln
