#include <kiln/glob.hpp>
#include <algorithm>

namespace fs = std::filesystem;

namespace kiln {

static std::vector<std::string> split_normalized(const std::string& p) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : p) {
        if (c == '\\') c = '/';
        if (c == '/') {
            // Empty segments come from "//", a leading "/" or "./"
            if (!cur.empty() && cur != ".") segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && cur != ".") segs.push_back(cur);
    return segs;
}

// Match one path segment; neither side contains '/'.
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            while (pi < pat.size() && pat[pi] == '*') ++pi;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); ++k) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (si == str.size()) return false;

        if (pc == '?') {
            ++pi;
            ++si;
            continue;
        }

        if (pc == '[') {
            size_t close = pat.find(']', pi + 1);
            if (close == std::string::npos) {
                // Unterminated class matches a literal '['
                if (str[si] != '[') return false;
                ++pi;
                ++si;
                continue;
            }
            size_t ci = pi + 1;
            bool negate = ci < close && pat[ci] == '!';
            if (negate) ++ci;
            bool hit = false;
            char sc = str[si];
            while (ci < close) {
                if (ci + 2 < close && pat[ci + 1] == '-') {
                    if (sc >= pat[ci] && sc <= pat[ci + 2]) hit = true;
                    ci += 3;
                } else {
                    if (sc == pat[ci]) hit = true;
                    ++ci;
                }
            }
            if (hit == negate) return false;
            pi = close + 1;
            ++si;
            continue;
        }

        if (pc != str[si]) return false;
        ++pi;
        ++si;
    }
    return si == str.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") ++pi;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pat, pi, path, k)) return true;
            }
            return false;
        }
        if (si == path.size()) return false;
        if (!match_segment(pat[pi], 0, path[si], 0)) return false;
        ++pi;
        ++si;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(split_normalized(pattern), 0, split_normalized(path), 0);
}

GlobSet::GlobSet(std::vector<std::string> patterns) {
    rules_.reserve(patterns.size());
    for (const auto& p : patterns) {
        Rule r;
        r.negate = !p.empty() && p[0] == '!';
        r.segments = split_normalized(r.negate ? p.substr(1) : p);
        rules_.push_back(std::move(r));
    }
}

bool GlobSet::matches(const std::string& rel_path) const {
    auto segs = split_normalized(rel_path);
    bool included = false;
    for (const auto& r : rules_) {
        if (match_segments(r.segments, 0, segs, 0)) {
            included = !r.negate;
        }
    }
    return included;
}

Result<std::vector<std::string>> glob_expand(
    const GlobSet& set,
    const fs::path& root_dir,
    bool include_dirs)
{
    std::error_code ec;
    if (!fs::is_directory(root_dir, ec)) {
        return KilnError(KilnError::IO,
            "glob root is not a directory: " + root_dir.string());
    }

    std::vector<std::string> results;
    fs::recursive_directory_iterator it(root_dir, ec), end;
    if (ec) {
        return KilnError(KilnError::IO,
            "cannot iterate " + root_dir.string() + ": " + ec.message());
    }

    for (; it != end; it.increment(ec)) {
        if (ec) break;
        std::string rel = it->path().lexically_relative(root_dir).generic_string();

        bool is_dir = it->is_directory(ec);
        if (ec) break;
        if (is_dir) {
            if (include_dirs && set.matches(rel)) {
                results.push_back(rel);
                it.disable_recursion_pending();
            }
            continue;
        }
        if (set.matches(rel)) {
            results.push_back(rel);
        }
    }

    // A failed increment ends the loop like a finished walk
    if (ec) {
        return KilnError(KilnError::IO,
            "error iterating " + root_dir.string() + ": " + ec.message());
    }

    std::sort(results.begin(), results.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

} // namespace kiln
