#pragma once

#include <wharf/result.hpp>
#include <string>
#include <unordered_map>

namespace wharf {

using TemplateVars = std::unordered_map<std::string, std::string>;

// Substitute ${name} placeholders in a template string.
// Strict mode: returns error on undefined variables or unclosed placeholders.
// Supports $${ to produce a literal ${ in output.
Result<std::string> expand_template(const std::string& tmpl, const TemplateVars& vars);

// Lenient substitution: undefined variables are left as-is (${name}),
// unclosed placeholders are left as-is. Never returns an error.
std::string expand_template_lenient(const std::string& tmpl, const TemplateVars& vars);

// homePath and separator, the variables every configured path may use
TemplateVars default_path_vars();

// Expand a clone-path template for a canonical remote (folderRelativePath)
// and lexically normalize the result.
Result<std::string> expand_clone_path(const std::string& tmpl,
                                      const std::string& canonical_remote);

} // namespace wharf
