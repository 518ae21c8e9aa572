#include "kubehost/runtime/shell.h"

#include <cctype>
#include <utility>

namespace kubehost::runtime {
namespace {

bool IsPlaceholderChar(char ch) { return std::isupper(static_cast<unsigned char>(ch)) || ch == '_'; }

//! Finds the next `__NAME__` token at or after `pos`. Returns npos when none remain.
size_t FindPlaceholder(const std::string& text, size_t pos, std::string& name) {
  while ((pos = text.find("__", pos)) != std::string::npos) {
    size_t end = pos + 2;
    while (end < text.size() && IsPlaceholderChar(text[end])) {
      ++end;
    }
    // `end` sits after the trailing "__" run; require at least one letter in between.
    if (end - pos > 4 && text.compare(end - 2, 2, "__") == 0) {
      const std::string inner = text.substr(pos + 2, end - pos - 4);
      if (!inner.empty() && inner.front() != '_' && inner.back() != '_') {
        name = text.substr(pos, end - pos);
        return pos;
      }
    }
    pos = end;
  }
  return std::string::npos;
}

}  // namespace

std::string ShellEscape(const std::string& value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('\'');
  for (char ch : value) {
    if (ch == '\'') {
      escaped += "'\\''";
    } else {
      escaped.push_back(ch);
    }
  }
  escaped.push_back('\'');
  return escaped;
}

bool IsShellVariableName(const std::string& name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
    return false;
  }
  for (char ch : name) {
    if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_') {
      return false;
    }
  }
  return true;
}

std::string JoinShellCommand(const std::string& command, const std::vector<std::string>& args,
                             const std::map<std::string, std::string>& env) {
  std::string result;
  for (const auto& [key, value] : env) {
    result += (IsShellVariableName(key) ? key : ShellEscape(key)) + "=" + ShellEscape(value) + " ";
  }
  result += ShellEscape(command);
  for (const auto& arg : args) {
    result += ' ';
    result += ShellEscape(arg);
  }
  return result;
}

bool IsScriptSafeValue(const std::string& value) {
  if (value.empty()) {
    return false;
  }
  for (char ch : value) {
    switch (ch) {
      case '\n':
      case '\r':
      case '\'':
      case '"':
      case '`':
      case '\\':
      case '$':
        return false;
      default:
        break;
    }
  }
  return true;
}

ScriptTemplate::ScriptTemplate(std::string text) : text_(std::move(text)) {}

ScriptTemplate& ScriptTemplate::Set(const std::string& placeholder, const std::string& value) {
  values_[placeholder] = value;
  return *this;
}

std::optional<std::string> ScriptTemplate::Render(std::string& error) const {
  for (const auto& [placeholder, value] : values_) {
    if (!IsScriptSafeValue(value)) {
      error = "unsafe value for " + placeholder + ": must be a non-empty single line without quotes, '\\', '`' or '$'";
      return std::nullopt;
    }
  }

  std::string rendered;
  rendered.reserve(text_.size());
  size_t pos = 0;
  std::string name;
  while (true) {
    const size_t found = FindPlaceholder(text_, pos, name);
    if (found == std::string::npos) {
      rendered.append(text_, pos, std::string::npos);
      break;
    }
    const auto it = values_.find(name);
    if (it == values_.end()) {
      error = "unresolved placeholder " + name;
      return std::nullopt;
    }
    rendered.append(text_, pos, found - pos);
    rendered += it->second;
    pos = found + name.size();
  }

  error.clear();
  return rendered;
}

std::string TrimCopy(const std::string& value) {
  size_t begin = 0;
  size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(begin, end - begin);
}

}  // namespace kubehost::runtime
