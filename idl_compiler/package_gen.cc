// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "idl_compiler/package_gen.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "idl_compiler/emit_util.h"

namespace carno {

void PackageGenerator::GenerateHeader(std::ostream &os) {
  os << "#pragma once\n";
  PrintBanner(os, absl::StrCat("package ", package_.package));
  PrintIncludes(os, package_.headers);

  OpenNamespace(os, package_.package, added_namespace_);
  PrintVersionCheck(os);

  os << "inline constexpr char kServerName[] = \""
     << absl::CEscape(package_.package) << "\";\n";
  os << "\n";
  os << "// Starts the carno runtime for the servers of package "
     << package_.package << ".\n";
  os << "absl::Status InitCarno(const carno::Options &opts = {});\n";
  os << "\n";

  os << "// Clients for every service in package " << package_.package
     << ".  All of them share\n";
  os << "// one connection and may be used concurrently.\n";
  os << "struct " << package_.name << " {\n";
  for (const auto &field : package_.fields) {
    os << "  std::unique_ptr<" << field.client_interface << "> " << field.name
       << ";\n";
  }
  os << "};\n";
  os << "\n";

  os << "// Opens and starts one connection for package " << package_.package
     << " and builds every\n";
  os << "// client over it.  On failure the connection error is returned "
        "and no\n";
  os << "// " << package_.name << " is built.\n";
  os << "absl::StatusOr<std::unique_ptr<" << package_.name << ">>\n";
  os << "New" << package_.name
     << "(const carno::client::Options &opts = {});\n";
  os << "\n";

  CloseNamespace(os, package_.package, added_namespace_);
}

void PackageGenerator::GenerateSource(std::ostream &os,
                                      std::string_view header) {
  PrintBanner(os, absl::StrCat("package ", package_.package));
  os << "#include \"" << header << "\"\n";
  os << "\n";

  OpenNamespace(os, package_.package, added_namespace_);

  os << "absl::Status InitCarno(const carno::Options &opts) {\n";
  os << "  return carno::Init(kServerName, opts);\n";
  os << "}\n";
  os << "\n";

  os << "absl::StatusOr<std::unique_ptr<" << package_.name << ">>\n";
  os << "New" << package_.name << "(const carno::client::Options &opts) {\n";
  os << "  absl::StatusOr<std::shared_ptr<carno::client::Client>> client =\n";
  os << "      carno::NewClient(kServerName, opts);\n";
  os << "  if (!client.ok()) {\n";
  os << "    return client.status();\n";
  os << "  }\n";
  os << "  if (absl::Status status = (*client)->Start(); !status.ok()) {\n";
  os << "    return status;\n";
  os << "  }\n";
  os << "  auto aggregate = std::make_unique<" << package_.name << ">();\n";
  for (const auto &field : package_.fields) {
    os << "  aggregate->" << field.name << " = std::make_unique<"
       << field.client_impl << ">(*client);\n";
  }
  os << "  return aggregate;\n";
  os << "}\n";
  os << "\n";

  CloseNamespace(os, package_.package, added_namespace_);
}

std::once_flag *AggregateGate::FlagFor(std::string_view package) {
  std::lock_guard<std::mutex> lock(lock_);
  auto &flag = flags_[std::string(package)];
  if (flag == nullptr) {
    flag = std::make_unique<std::once_flag>();
  }
  return flag.get();
}

bool AggregateGate::RunOnce(std::string_view package,
                            absl::FunctionRef<void()> fn) {
  bool ran = false;
  std::call_once(*FlagFor(package), [&]() {
    fn();
    ran = true;
    std::lock_guard<std::mutex> lock(lock_);
    done_.insert(std::string(package));
  });
  return ran;
}

bool AggregateGate::HasRun(std::string_view package) {
  std::lock_guard<std::mutex> lock(lock_);
  return done_.contains(std::string(package));
}

} // namespace carno
