// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "idl_compiler/emit_util.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "idl_compiler/name_resolver.h"
#include <algorithm>

namespace carno {

const std::vector<std::string_view> kRuntimeHeaders = {
    "carno/carno.h",         "carno/client/client.h",
    "carno/server/server.h", "carno/options.h",
    "carno/mux/service_desc.h",
};

void PrintBanner(std::ostream &os, std::string_view source) {
  os << "// Generated by protoc-gen-carno.  DO NOT EDIT.\n";
  os << "// source: " << source << "\n";
  os << "\n";
}

void PrintIncludes(std::ostream &os, const std::vector<std::string> &extra) {
  for (std::string_view header : kRuntimeHeaders) {
    os << "#include \"" << header << "\"\n";
  }
  for (const auto &header : extra) {
    os << "#include \"" << header << "\"\n";
  }
  os << "#include \"absl/status/status.h\"\n";
  os << "#include \"absl/status/statusor.h\"\n";
  os << "#include <concepts>\n";
  os << "#include <memory>\n";
  os << "\n";
}

void PrintVersionCheck(std::ostream &os) {
  os << "// This is a compile-time assertion to ensure that this generated "
        "file\n";
  os << "// is compatible with the carno runtime it is being compiled "
        "against.\n";
  os << "static_assert(carno::kSupportPackageIsVersion" << kGeneratedCodeVersion
     << ",\n";
  os << "              \"carno runtime does not support generated code "
        "version "
     << kGeneratedCodeVersion << "\");\n";
  os << "\n";
}

void OpenNamespace(std::ostream &os, const std::string &package,
                   const std::string &added_namespace) {
  std::vector<std::string> parts = absl::StrSplit(package, '.');
  for (const auto &part : parts) {
    os << "namespace " << ResolveKeyword(part) << " {\n";
  }
  if (!added_namespace.empty()) {
    os << "namespace " << added_namespace << " {\n";
  }
  os << "\n";
}

void CloseNamespace(std::ostream &os, const std::string &package,
                    const std::string &added_namespace) {
  if (!added_namespace.empty()) {
    os << "} // namespace " << added_namespace << "\n";
  }
  std::vector<std::string> parts = absl::StrSplit(package, '.');
  std::reverse(parts.begin(), parts.end());
  for (const auto &part : parts) {
    os << "} // namespace " << ResolveKeyword(part) << "\n";
  }
}

void PrintComments(std::ostream &os, const std::vector<std::string> &lines,
                   std::string_view indent) {
  for (const auto &line : lines) {
    // A trailing backslash would splice the next generated line into the
    // comment.
    absl::string_view text = absl::StripTrailingAsciiWhitespace(line);
    while (absl::ConsumeSuffix(&text, "\\")) {
      text = absl::StripTrailingAsciiWhitespace(text);
    }
    if (text.empty()) {
      os << indent << "//\n";
    } else {
      os << indent << "//" << text << "\n";
    }
  }
}

} // namespace carno
