#include <kiln/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace kiln {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static bool parse_number(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    out = std::stoi(s);
    return true;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(s);
    while (std::getline(stream, part, sep)) parts.push_back(part);
    if (!s.empty() && s.back() == sep) parts.emplace_back();
    return parts;
}

// Pre-release ordering per semver: dot-separated identifiers, numeric
// identifiers compare numerically and sort before alphanumeric ones.
static int compare_pre(const std::string& a, const std::string& b) {
    auto ia = split(a, '.');
    auto ib = split(b, '.');
    for (size_t i = 0; i < ia.size() && i < ib.size(); ++i) {
        int na = 0, nb = 0;
        bool a_num = parse_number(ia[i], na);
        bool b_num = parse_number(ib[i], nb);
        if (a_num && b_num) {
            if (na != nb) return na < nb ? -1 : 1;
        } else if (a_num != b_num) {
            return a_num ? -1 : 1;
        } else if (ia[i] != ib[i]) {
            return ia[i] < ib[i] ? -1 : 1;
        }
    }
    if (ia.size() == ib.size()) return 0;
    return ia.size() < ib.size() ? -1 : 1;
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& input) {
    std::string s = trim(input);
    if (s.empty()) {
        return KilnError{KilnError::Version, "empty version string"};
    }

    Version v;
    size_t plus = s.find('+');
    if (plus != std::string::npos) {
        v.build = s.substr(plus + 1);
        s = s.substr(0, plus);
    }
    size_t dash = s.find('-');
    if (dash != std::string::npos) {
        v.pre = s.substr(dash + 1);
        s = s.substr(0, dash);
        if (v.pre.empty()) {
            return KilnError{KilnError::Version,
                "empty pre-release label in '" + input + "'"};
        }
    }

    auto parts = split(s, '.');
    if (parts.size() != 3 ||
        !parse_number(parts[0], v.major) ||
        !parse_number(parts[1], v.minor) ||
        !parse_number(parts[2], v.micro)) {
        return KilnError{KilnError::Version,
            "invalid version '" + input + "'",
            "expected format: major.minor.micro[-pre][+build]"};
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(micro);
    if (!pre.empty()) s += "-" + pre;
    if (!build.empty()) s += "+" + build;
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor &&
           micro == o.micro && pre == o.pre;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (micro != o.micro) return micro < o.micro;
    // A pre-release sorts before the release it precedes
    if (pre.empty() || o.pre.empty()) return !pre.empty() && o.pre.empty();
    return compare_pre(pre, o.pre) < 0;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& input) {
    std::string s = trim(input);
    PartialVersion pv;

    size_t dash = s.find('-');
    if (dash != std::string::npos) {
        pv.pre = s.substr(dash + 1);
        s = s.substr(0, dash);
    }

    auto parts = split(s, '.');
    if (parts.empty() || parts.size() > 3) {
        return KilnError{KilnError::Version,
            "invalid version in requirement '" + input + "'"};
    }

    int* fields[3] = {&pv.major, &pv.minor, &pv.micro};
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& p = parts[i];
        if ((p == "*" || p == "x" || p == "X") && i > 0) {
            if (i + 1 != parts.size()) {
                return KilnError{KilnError::Version,
                    "wildcard must be the last component in '" + input + "'"};
            }
            break;
        }
        if (!parse_number(p, *fields[i])) {
            return KilnError{KilnError::Version,
                "invalid version component '" + p + "' in '" + input + "'"};
        }
    }

    return Result<PartialVersion>::ok(std::move(pv));
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor >= 0) {
        s += "." + std::to_string(minor);
        if (micro >= 0) s += "." + std::to_string(micro);
    }
    if (!pre.empty()) s += "-" + pre;
    return s;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

static Version floor_of(const PartialVersion& pv) {
    Version v;
    v.major = pv.major;
    v.minor = pv.minor >= 0 ? pv.minor : 0;
    v.micro = pv.micro >= 0 ? pv.micro : 0;
    v.pre = pv.pre;
    return v;
}

// Exclusive upper bound for the range of versions sharing the given prefix
static Version prefix_ceiling(const PartialVersion& pv) {
    Version v;
    if (pv.minor < 0) {
        v.major = pv.major + 1;
    } else if (pv.micro < 0) {
        v.major = pv.major;
        v.minor = pv.minor + 1;
    } else {
        v.major = pv.major;
        v.minor = pv.minor;
        v.micro = pv.micro + 1;
    }
    // "-0" is the lowest possible pre-release, so x.y.z-0 excludes x.y.z-*
    v.pre = "0";
    return v;
}

bool VersionConstraint::matches(const Version& v) const {
    if (op == ConstraintOp::Wildcard && version.major < 0) {
        return !v.is_prerelease();
    }

    // Pre-releases only match requirements naming a pre-release of the
    // same major.minor.micro
    if (v.is_prerelease()) {
        if (version.pre.empty()) return false;
        Version base = floor_of(version);
        if (v.major != base.major || v.minor != base.minor || v.micro != base.micro) {
            return false;
        }
    }

    const Version lo = floor_of(version);

    switch (op) {
    case ConstraintOp::Exact:
        if (version.micro >= 0) return v == lo;
        return v >= lo && v < prefix_ceiling(version);

    case ConstraintOp::Caret: {
        if (v < lo) return false;
        PartialVersion prefix;
        prefix.major = version.major;
        if (version.major == 0 && version.minor >= 0) {
            prefix.minor = version.minor;
            if (version.minor == 0 && version.micro >= 0) prefix.micro = version.micro;
        }
        return v < prefix_ceiling(prefix);
    }

    case ConstraintOp::Tilde: {
        if (v < lo) return false;
        PartialVersion prefix;
        prefix.major = version.major;
        prefix.minor = version.minor;
        return v < prefix_ceiling(prefix);
    }

    case ConstraintOp::Wildcard:
        return v >= lo && v < prefix_ceiling(version);

    case ConstraintOp::GreaterEq:
        return v >= lo;

    case ConstraintOp::Greater:
        if (version.micro >= 0) return v > lo;
        return v >= prefix_ceiling(version);

    case ConstraintOp::LessEq:
        if (version.micro >= 0) return v <= lo;
        return v < prefix_ceiling(version);

    case ConstraintOp::Less:
        return v < lo;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    switch (op) {
    case ConstraintOp::Caret:     return "^" + version.to_string();
    case ConstraintOp::Tilde:     return "~" + version.to_string();
    case ConstraintOp::Exact:     return "=" + version.to_string();
    case ConstraintOp::GreaterEq: return ">=" + version.to_string();
    case ConstraintOp::Greater:   return ">" + version.to_string();
    case ConstraintOp::LessEq:    return "<=" + version.to_string();
    case ConstraintOp::Less:      return "<" + version.to_string();
    case ConstraintOp::Wildcard:
        if (version.major < 0) return "*";
        return version.to_string() + ".*";
    }
    return version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static Result<VersionConstraint> parse_single_constraint(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) {
        return KilnError{KilnError::Version, "empty constraint in version requirement"};
    }

    VersionConstraint vc;
    if (s == "*") {
        vc.op = ConstraintOp::Wildcard;
        vc.version.major = -1;
        return Result<VersionConstraint>::ok(vc);
    }

    static const std::pair<const char*, ConstraintOp> prefixes[] = {
        {">=", ConstraintOp::GreaterEq},
        {"<=", ConstraintOp::LessEq},
        {">",  ConstraintOp::Greater},
        {"<",  ConstraintOp::Less},
        {"=",  ConstraintOp::Exact},
        {"^",  ConstraintOp::Caret},
        {"~",  ConstraintOp::Tilde},
    };
    size_t skip = 0;
    for (const auto& [text, op] : prefixes) {
        std::string p(text);
        if (s.compare(0, p.size(), p) == 0) {
            vc.op = op;
            skip = p.size();
            break;
        }
    }

    std::string ver = trim(s.substr(skip));
    if (ver.empty()) {
        return KilnError{KilnError::Version,
            "missing version in constraint '" + raw + "'"};
    }

    KILN_TRY_ASSIGN(pv, PartialVersion::parse(ver));
    vc.version = pv;

    bool has_wildcard = ver.find('*') != std::string::npos ||
                        ver.find(".x") != std::string::npos ||
                        ver.find(".X") != std::string::npos;
    if (has_wildcard) {
        if (skip != 0) {
            return KilnError{KilnError::Version,
                "wildcard cannot be combined with an operator in '" + raw + "'"};
        }
        vc.op = ConstraintOp::Wildcard;
    }

    return Result<VersionConstraint>::ok(vc);
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    if (trim(s).empty()) {
        return KilnError{KilnError::Version, "empty version requirement"};
    }

    VersionReq req;
    for (const auto& token : split(s, ',')) {
        auto c = parse_single_constraint(token);
        if (c.is_err()) {
            auto e = std::move(c).error();
            e.message += " (in '" + s + "')";
            return e;
        }
        req.constraints.push_back(std::move(c).value());
    }

    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.matches(v); });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

} // namespace kiln
