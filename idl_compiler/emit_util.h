// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace carno {

// Version of the generated code.  Incremented whenever generated code
// stops being compatible with the runtime it was written against.  Every
// generated header refers to carno::kSupportPackageIsVersion<N>, so a
// runtime that does not provide it fails the build.
constexpr int kGeneratedCodeVersion = 4;

// Runtime headers included by every generated header.
extern const std::vector<std::string_view> kRuntimeHeaders;

// "Generated by" banner naming the source.
void PrintBanner(std::ostream &os, std::string_view source);

// #include lines for the runtime headers followed by 'extra'.
void PrintIncludes(std::ostream &os, const std::vector<std::string> &extra);

// Compile time assertion on kGeneratedCodeVersion.
void PrintVersionCheck(std::ostream &os);

// One namespace per package component, then the added namespace.
void OpenNamespace(std::ostream &os, const std::string &package,
                   const std::string &added_namespace);
void CloseNamespace(std::ostream &os, const std::string &package,
                    const std::string &added_namespace);

// Prints .proto comment lines as C++ line comments.
void PrintComments(std::ostream &os, const std::vector<std::string> &lines,
                   std::string_view indent);

} // namespace carno
