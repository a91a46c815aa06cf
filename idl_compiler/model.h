// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

// Intermediate representation of the generated bindings.  Everything the
// renderers print is decided here: identifiers, C++ type names, streaming
// shape, dispatch table and documentation.  Nothing in this file writes
// text.

#include "absl/status/statusor.h"
#include "google/protobuf/descriptor.h"
#include "idl_compiler/descriptor_collector.h"
#include "idl_compiler/name_resolver.h"
#include <string>
#include <string_view>
#include <vector>

namespace carno {

struct MethodModel {
  std::string raw_name;    // As declared, used on the wire.
  std::string name;        // Exported identifier.
  std::string input_type;  // Fully qualified C++ message type.
  std::string output_type;
  bool client_streaming = false;
  bool server_streaming = false;
  // Stream handle types, empty for unary methods.
  std::string client_stream_type; // <Service>_<Method>Client
  std::string server_stream_type; // <Service>_<Method>Server
  std::vector<std::string> comments;

  bool IsStreaming() const { return client_streaming || server_streaming; }
};

struct ServiceModel {
  std::string raw_name;
  std::string full_name;         // package.Service
  std::string package;
  std::string name;              // Exported identifier.
  std::string client_interface;  // <Service>Client
  std::string client_impl;       // <service>Client
  std::string server_concept;    // <Service>Server
  std::string desc_name;         // k<Service>ServiceDesc
  std::string cpp_namespace;     // ::a::b[::added]
  std::vector<MethodModel> methods;
  std::vector<std::string> dispatch_table;
  std::vector<std::string> comments;
};

struct FileModel {
  const google::protobuf::FileDescriptor *file = nullptr;
  std::vector<ServiceModel> services;
};

// One member of a package aggregate.
struct AggregateField {
  std::string name;             // <Service>Client
  std::string client_interface; // Qualified <Service>Client
  std::string client_impl;      // Qualified <service>Client
};

struct PackageModel {
  std::string package;
  std::string name; // PackageIdentifier(package)
  // Headers of the files whose services are aggregated.
  std::vector<std::string> headers;
  std::vector<AggregateField> fields;
};

// "::" followed by the package and the containing types.  Nested messages
// use protoc's C++ naming, Outer_Inner.
std::string QualifiedCppName(const google::protobuf::Descriptor *message);

// "::a::b" for package a.b, plus the added namespace if any.
std::string CppNamespace(const std::string &package,
                         const std::string &added_namespace);

absl::StatusOr<ServiceModel>
BuildServiceModel(const google::protobuf::ServiceDescriptor *service,
                  const NameResolver &resolver,
                  const std::string &added_namespace);

absl::StatusOr<FileModel>
BuildFileModel(const google::protobuf::FileDescriptor *file,
               const NameResolver &resolver,
               const std::string &added_namespace);

// 'services' are the models of every service in 'group', in group order.
absl::StatusOr<PackageModel>
BuildPackageModel(const PackageGroup &group,
                  const std::vector<const ServiceModel *> &services,
                  std::vector<std::string> headers,
                  const NameResolver &resolver);

} // namespace carno
