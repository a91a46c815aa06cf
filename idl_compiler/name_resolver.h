// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include <string>
#include <string_view>
#include <vector>

namespace carno {

// Appended to an exported identifier that is in the reserved set.
constexpr char kReservedNameSuffix[] = "_";

// Converts a .proto name to an exported identifier.  A leading underscore
// becomes 'X', an underscore followed by a lowercase letter is removed and
// the letter is capitalized, and every lowercase letter that starts a word
// is capitalized.  Digits and the rest of each word are copied.
//   "say_hello" -> "SayHello", "_my_field" -> "XMyField",
//   "foo_bar.baz" -> "FooBar.baz"
std::string CamelCase(std::string_view s);

// Lowercases the first character only.
std::string Unexport(std::string_view s);

// protoc's C++ mangling of a name that is a C++ keyword: "class" becomes
// "class_".  Other names are returned unchanged.  Applies to package
// components and message names.
std::string ResolveKeyword(const std::string &name);

// Computes the identifiers used in generated code for packages, services
// and methods.  The reserved set is fixed at construction.
class NameResolver {
public:
  NameResolver() = default;
  explicit NameResolver(absl::flat_hash_set<std::string> reserved)
      : reserved_(std::move(reserved)) {}

  // Exported form is CamelCase(raw_name), unexported form lowercases its
  // first character.  A reserved exported form gets kReservedNameSuffix.
  std::string Resolve(std::string_view raw_name, bool exported) const;

  // "foo.bar" -> "FooBar".
  std::string PackageIdentifier(const std::string &package) const;

  // Resolves every name in 'raw_names' (exported) and checks that no two
  // distinct raw names end up with the same identifier.  'scope' is used
  // in the error message.
  absl::StatusOr<std::vector<std::string>>
  ResolveScope(const std::string &scope,
               const std::vector<std::string> &raw_names) const;

  bool IsReserved(std::string_view exported) const {
    return reserved_.contains(std::string(exported));
  }

private:
  absl::flat_hash_set<std::string> reserved_;
};

} // namespace carno
