#pragma once

#include <kiln/result.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace kiln {

// Match a glob pattern against a relative path (both normalized to '/').
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& path);

// Ordered include/exclude pattern list. Patterns prefixed with '!' exclude;
// the last matching pattern decides. An empty set matches nothing.
class GlobSet {
public:
    GlobSet() = default;
    explicit GlobSet(std::vector<std::string> patterns);

    bool matches(const std::string& rel_path) const;
    bool empty() const { return rules_.empty(); }

private:
    struct Rule {
        std::vector<std::string> segments;
        bool negate = false;
    };
    std::vector<Rule> rules_;
};

// Walk root_dir and return the sorted relative paths matched by `set`.
// Directories are reported (and not descended into) when `include_dirs`
// is set and the directory itself matches.
Result<std::vector<std::string>> glob_expand(
    const GlobSet& set,
    const std::filesystem::path& root_dir,
    bool include_dirs = false);

} // namespace kiln
