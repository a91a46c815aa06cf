// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "idl_compiler/model.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "idl_compiler/registry_builder.h"

namespace carno {

template <typename DescriptorType>
static std::vector<std::string> LeadingComments(const DescriptorType *desc) {
  google::protobuf::SourceLocation location;
  if (!desc->GetSourceLocation(&location)) {
    return {};
  }
  std::vector<std::string> lines =
      absl::StrSplit(location.leading_comments, '\n');
  // The comment text ends with a newline.
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  return lines;
}

std::string QualifiedCppName(const google::protobuf::Descriptor *message) {
  std::string name(message->name());
  for (const auto *outer = message->containing_type(); outer != nullptr;
       outer = outer->containing_type()) {
    name = absl::StrCat(outer->name(), "_", name);
  }
  std::string ns = CppNamespace(message->file()->package(), "");
  return absl::StrCat(ns, "::", ResolveKeyword(name));
}

std::string CppNamespace(const std::string &package,
                         const std::string &added_namespace) {
  std::string ns;
  if (!package.empty()) {
    for (absl::string_view part : absl::StrSplit(package, '.')) {
      absl::StrAppend(&ns, "::", ResolveKeyword(std::string(part)));
    }
  }
  if (!added_namespace.empty()) {
    absl::StrAppend(&ns, "::", added_namespace);
  }
  return ns;
}

absl::StatusOr<ServiceModel>
BuildServiceModel(const google::protobuf::ServiceDescriptor *service,
                  const NameResolver &resolver,
                  const std::string &added_namespace) {
  ServiceModel model;
  model.raw_name = std::string(service->name());
  model.full_name = std::string(service->full_name());
  model.package = std::string(service->file()->package());
  model.name = resolver.Resolve(service->name(), /*exported=*/true);
  model.client_interface = absl::StrCat(model.name, "Client");
  model.client_impl =
      absl::StrCat(resolver.Resolve(service->name(), /*exported=*/false),
                   "Client");
  model.server_concept = absl::StrCat(model.name, "Server");
  model.desc_name = absl::StrCat("k", model.name, "ServiceDesc");
  model.cpp_namespace = CppNamespace(model.package, added_namespace);
  model.comments = LeadingComments(service);

  std::vector<std::string> raw_names;
  for (int i = 0; i < service->method_count(); i++) {
    raw_names.emplace_back(service->method(i)->name());
  }
  absl::StatusOr<std::vector<std::string>> ids = resolver.ResolveScope(
      absl::StrFormat("service %s", service->full_name()), raw_names);
  if (!ids.ok()) {
    return ids.status();
  }

  for (int i = 0; i < service->method_count(); i++) {
    const auto *method = service->method(i);
    MethodModel m;
    m.raw_name = raw_names[i];
    m.name = (*ids)[i];
    m.input_type = QualifiedCppName(method->input_type());
    m.output_type = QualifiedCppName(method->output_type());
    m.client_streaming = method->client_streaming();
    m.server_streaming = method->server_streaming();
    if (m.IsStreaming()) {
      m.client_stream_type = absl::StrCat(model.name, "_", m.name, "Client");
      m.server_stream_type = absl::StrCat(model.name, "_", m.name, "Server");
    }
    m.comments = LeadingComments(method);
    model.methods.push_back(std::move(m));
  }
  model.dispatch_table = BuildDispatchTable(service);
  return model;
}

absl::StatusOr<FileModel>
BuildFileModel(const google::protobuf::FileDescriptor *file,
               const NameResolver &resolver,
               const std::string &added_namespace) {
  FileModel model;
  model.file = file;
  for (int i = 0; i < file->service_count(); i++) {
    absl::StatusOr<ServiceModel> service =
        BuildServiceModel(file->service(i), resolver, added_namespace);
    if (!service.ok()) {
      return service.status();
    }
    model.services.push_back(std::move(*service));
  }
  return model;
}

// Every name the generated code declares in the package namespace must be
// declared exactly once.  'Foo_Bar' and the stream handle of Foo.Bar both
// produce Foo_BarClient, for example.
static absl::Status
CheckDeclaredNames(const std::string &package, const std::string &aggregate,
                   const std::vector<const ServiceModel *> &services) {
  // Declared name to what declares it.
  absl::flat_hash_map<std::string, std::string> declared;
  auto declare = [&](const std::string &name,
                     const std::string &owner) -> absl::Status {
    auto [it, inserted] = declared.emplace(name, owner);
    if (!inserted) {
      return absl::AlreadyExistsError(absl::StrFormat(
          "package %s: %s is declared by both %s and %s", package, name,
          it->second, owner));
    }
    return absl::OkStatus();
  };

  std::string owner = absl::StrFormat("package %s", package);
  for (const std::string &name :
       {aggregate, absl::StrCat("New", aggregate), std::string("kServerName"),
        std::string("InitCarno")}) {
    if (absl::Status status = declare(name, owner); !status.ok()) {
      return status;
    }
  }
  for (const auto *service : services) {
    std::vector<std::pair<std::string, std::string>> names = {
        {service->client_interface, service->full_name},
        {service->client_impl, service->full_name},
        {absl::StrCat("New", service->client_interface), service->full_name},
        {service->server_concept, service->full_name},
        {absl::StrCat("Register", service->server_concept),
         service->full_name},
        {service->desc_name, service->full_name},
    };
    for (const auto &method : service->methods) {
      if (!method.IsStreaming()) {
        continue;
      }
      std::string method_owner =
          absl::StrCat(service->full_name, ".", method.raw_name);
      names.emplace_back(method.client_stream_type, method_owner);
      names.emplace_back(method.server_stream_type, method_owner);
    }
    for (const auto &[name, name_owner] : names) {
      if (absl::Status status = declare(name, name_owner); !status.ok()) {
        return status;
      }
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<PackageModel>
BuildPackageModel(const PackageGroup &group,
                  const std::vector<const ServiceModel *> &services,
                  std::vector<std::string> headers,
                  const NameResolver &resolver) {
  if (group.package.empty()) {
    return absl::InvalidArgumentError("Cannot aggregate an empty package");
  }
  if (services.size() != group.services.size()) {
    return absl::InternalError(absl::StrFormat(
        "package %s: %d services collected but %d modelled", group.package,
        group.services.size(), services.size()));
  }
  PackageModel model;
  model.package = group.package;
  model.name = resolver.PackageIdentifier(group.package);
  model.headers = std::move(headers);

  std::vector<std::string> raw_names;
  for (const auto *service : group.services) {
    raw_names.emplace_back(service->name());
  }
  absl::StatusOr<std::vector<std::string>> ids = resolver.ResolveScope(
      absl::StrFormat("package %s", group.package), raw_names);
  if (!ids.ok()) {
    return ids.status();
  }
  if (absl::Status status = CheckDeclaredNames(model.package, model.name,
                                                services);
      !status.ok()) {
    return status;
  }
  for (const auto *service : services) {
    model.fields.push_back(AggregateField{
        .name = service->client_interface,
        .client_interface =
            absl::StrCat(service->cpp_namespace, "::", service->client_interface),
        .client_impl =
            absl::StrCat(service->cpp_namespace, "::", service->client_impl),
    });
  }
  return model;
}

} // namespace carno
