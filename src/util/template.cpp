#include <kiln/template.hpp>

namespace kiln {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static std::string known_vars_hint(const TemplateVars& vars) {
    if (vars.empty()) return "no template variables are defined here";
    std::string hint = "available variables:";
    for (const auto& kv : vars) {
        hint += " " + kv.first;
    }
    return hint;
}

Result<std::string> expand_template(const std::string& tmpl, const TemplateVars& vars) {
    std::string out;
    out.reserve(tmpl.size());

    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl.compare(i, 3, "\\{{") == 0) {
            out += "{{";
            i += 3;
            continue;
        }

        if (tmpl.compare(i, 2, "{{") != 0) {
            out.push_back(tmpl[i++]);
            continue;
        }

        size_t close = tmpl.find("}}", i + 2);
        if (close == std::string::npos) {
            return KilnError(KilnError::Config,
                "unclosed '{{' in template '" + tmpl + "'");
        }

        std::string name = trim(tmpl.substr(i + 2, close - i - 2));
        if (name.empty()) {
            return KilnError(KilnError::Config,
                "empty placeholder in template '" + tmpl + "'");
        }

        auto it = vars.find(name);
        if (it == vars.end()) {
            return KilnError(KilnError::Config,
                "unknown template variable '" + name + "' in '" + tmpl + "'",
                known_vars_hint(vars));
        }
        out += it->second;
        i = close + 2;
    }

    return Result<std::string>::ok(std::move(out));
}

Result<std::vector<std::string>> expand_templates(const std::vector<std::string>& tmpls,
                                                  const TemplateVars& vars) {
    std::vector<std::string> out;
    out.reserve(tmpls.size());
    for (const auto& t : tmpls) {
        KILN_TRY_ASSIGN(expanded, expand_template(t, vars));
        out.push_back(std::move(expanded));
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

} // namespace kiln
