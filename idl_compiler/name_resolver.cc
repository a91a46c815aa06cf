// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "idl_compiler/name_resolver.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"

namespace carno {

static bool IsLower(char c) { return c >= 'a' && c <= 'z'; }
static bool IsDigit(char c) { return c >= '0' && c <= '9'; }

std::string CamelCase(std::string_view s) {
  std::string t;
  t.reserve(s.size() + 1);
  size_t i = 0;
  if (!s.empty() && s[0] == '_') {
    // Need a capital letter; drop the '_'.
    t += 'X';
    i++;
  }
  // If the next letter is lower case it must be converted to upper case.
  for (; i < s.size(); i++) {
    char c = s[i];
    if (c == '_' && i + 1 < s.size() && IsLower(s[i + 1])) {
      continue;
    }
    if (IsDigit(c)) {
      t += c;
      continue;
    }
    if (IsLower(c)) {
      c = static_cast<char>(c - 'a' + 'A');
    }
    t += c;
    // Copy the rest of the lowercase word.
    while (i + 1 < s.size() && IsLower(s[i + 1])) {
      i++;
      t += s[i];
    }
  }
  return t;
}

std::string Unexport(std::string_view s) {
  std::string t(s);
  if (!t.empty() && t[0] >= 'A' && t[0] <= 'Z') {
    t[0] = static_cast<char>(t[0] - 'A' + 'a');
  }
  return t;
}

std::string ResolveKeyword(const std::string &name) {
  static const absl::flat_hash_set<std::string> *keywords =
      new absl::flat_hash_set<std::string>{
          "NULL", "alignas", "alignof", "and", "and_eq", "asm", "auto",
          "bitand", "bitor", "bool", "break", "case", "catch", "char",
          "char8_t", "char16_t", "char32_t", "class", "compl", "concept",
          "const", "consteval", "constexpr", "constinit", "const_cast",
          "continue", "co_await", "co_return", "co_yield", "decltype",
          "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
          "explicit", "export", "extern", "false", "float", "for", "friend",
          "goto", "if", "inline", "int", "long", "mutable", "namespace", "new",
          "noexcept", "not", "not_eq", "nullptr", "operator", "or", "or_eq",
          "private", "protected", "public", "register", "reinterpret_cast",
          "requires", "return", "short", "signed", "sizeof", "static",
          "static_assert", "static_cast", "struct", "switch", "template",
          "this", "thread_local", "throw", "true", "try", "typedef", "typeid",
          "typename", "union", "unsigned", "using", "virtual", "void",
          "volatile", "wchar_t", "while", "xor", "xor_eq",
      };
  if (keywords->contains(name)) {
    return name + "_";
  }
  return name;
}

std::string NameResolver::Resolve(std::string_view raw_name,
                                  bool exported) const {
  std::string name = CamelCase(raw_name);
  if (IsReserved(name)) {
    name += kReservedNameSuffix;
  }
  if (!exported) {
    return Unexport(name);
  }
  return name;
}

std::string NameResolver::PackageIdentifier(const std::string &package) const {
  return CamelCase(absl::StrReplaceAll(package, {{".", "_"}}));
}

absl::StatusOr<std::vector<std::string>>
NameResolver::ResolveScope(const std::string &scope,
                           const std::vector<std::string> &raw_names) const {
  std::vector<std::string> result;
  result.reserve(raw_names.size());
  absl::flat_hash_map<std::string, std::string> seen;
  for (const auto &raw : raw_names) {
    std::string id = Resolve(raw, /*exported=*/true);
    auto [it, inserted] = seen.emplace(id, raw);
    if (!inserted) {
      return absl::AlreadyExistsError(absl::StrFormat(
          "%s: \"%s\" and \"%s\" both resolve to identifier %s", scope,
          it->second, raw, id));
    }
    result.push_back(std::move(id));
  }
  return result;
}

} // namespace carno
