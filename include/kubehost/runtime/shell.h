#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kubehost::runtime {

/// Quotes `value` for a POSIX shell: wraps it in single quotes and rewrites each
/// embedded single quote as `'\''`. The shell evaluates the result back to `value`
/// without word splitting, globbing or expansion.
std::string ShellEscape(const std::string& value);

/// True for a POSIX shell variable name: `[A-Za-z_][A-Za-z0-9_]*`.
bool IsShellVariableName(const std::string& name);

/// Builds one remote command line: `KEY='value'` assignments (in key order), then the
/// escaped command, then each escaped argument. Keys must pass IsShellVariableName;
/// any other key is quoted and therefore never acts as an assignment.
std::string JoinShellCommand(const std::string& command, const std::vector<std::string>& args,
                             const std::map<std::string, std::string>& env = {});

/// True when `value` can be placed literally inside a generated script: non-empty,
/// single line and free of quote, backslash, backtick and `$` characters.
bool IsScriptSafeValue(const std::string& value);

/// Script text with `__NAME__` placeholders that are replaced by validated values.
class ScriptTemplate {
 public:
  explicit ScriptTemplate(std::string text);

  /// Registers a substitution for `placeholder` (for example `__NEW_USER__`).
  ScriptTemplate& Set(const std::string& placeholder, const std::string& value);

  /// Returns the rendered script, or nullopt when a value fails the safety check or
  /// a placeholder in the text has no value.
  std::optional<std::string> Render(std::string& error) const;

 private:
  std::string text_;
  std::map<std::string, std::string> values_;
};

/// Trims ASCII whitespace from both ends.
std::string TrimCopy(const std::string& value);

}  // namespace kubehost::runtime
