#pragma once

#include <kiln/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace kiln {

using TemplateVars = std::map<std::string, std::string>;

// Substitute {{ var }} placeholders. Undefined variables and unclosed
// braces are errors; \{{ produces a literal {{.
Result<std::string> expand_template(const std::string& tmpl, const TemplateVars& vars);

// Expand every element of an argv-style list
Result<std::vector<std::string>> expand_templates(const std::vector<std::string>& tmpls,
                                                  const TemplateVars& vars);

} // namespace kiln
