// Copyright 2023-2026 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/logging.h"
#include "google/protobuf/compiler/code_generator.h"
#include "google/protobuf/compiler/plugin.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/io/zero_copy_stream.h"

#include "idl_compiler/descriptor_collector.h"
#include "idl_compiler/model.h"
#include "idl_compiler/package_gen.h"
#include "idl_compiler/service_gen.h"

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace carno {

// Options passed in the --carno_out parameter as a comma separated list of
// key=value pairs.
struct GeneratorOptions {
  // Extra namespace nested inside the package namespaces.
  std::string added_namespace;
  // Prefixes for the generated file names.
  std::string package_name;
  std::string target_name;
  // Exported identifiers that get a trailing underscore.  Separated by ':'
  // in the parameter.
  absl::flat_hash_set<std::string> reserved_names;
  // Worker threads used to render packages.
  int jobs = 1;
  LogLevel log_level = LogLevel::kWarning;
};

absl::StatusOr<GeneratorOptions>
ParseGeneratorOptions(const std::string &parameter);

struct GeneratedFile {
  std::string name;
  std::string content;
};

// Output file names.  'package_name' and 'target_name' are prepended.
std::string GeneratedFilename(std::string_view package_name,
                              std::string_view target_name,
                              std::string_view filename);
std::string ClientHeaderName(const GeneratorOptions &options,
                             const google::protobuf::FileDescriptor *file);
std::string ServerHeaderName(const GeneratorOptions &options,
                             const google::protobuf::FileDescriptor *file);
std::string PackageHeaderName(const GeneratorOptions &options,
                              const std::string &package);

// Renders the bindings of one .proto file.
class Generator {
public:
  Generator(const FileModel &file, const GeneratorOptions &options);

  void GenerateClientHeaders(std::ostream &os);
  void GenerateClientSources(std::ostream &os);

  void GenerateServerHeaders(std::ostream &os);
  void GenerateServerSources(std::ostream &os);

private:
  const google::protobuf::FileDescriptor *file_;
  std::vector<std::unique_ptr<ServiceGenerator>> service_gens_;
  const GeneratorOptions &options_;
};

// Runs a whole generation request.  Stage one renders the services of
// every file; stage two, which starts only when stage one has finished
// for every package, renders the package aggregates.  Nothing is returned
// unless both stages succeed.
class Pipeline {
public:
  Pipeline(const GeneratorOptions &options, Logger &logger);

  absl::StatusOr<std::vector<GeneratedFile>>
  Run(const std::vector<const google::protobuf::FileDescriptor *> &files);

private:
  struct PackageState {
    std::vector<FileModel> files;
    std::vector<GeneratedFile> service_outputs;
    std::vector<GeneratedFile> aggregate_outputs;
    absl::Status status;
  };

  absl::Status EmitServices(const PackageGroup &group, PackageState &state);
  absl::Status EmitAggregate(const PackageGroup &group, PackageState &state,
                             AggregateGate &gate);

  // Calls fn(i) for i in [0, n) on up to options_.jobs threads and
  // returns when all calls are done.
  void ForEachPackage(size_t n, const std::function<void(size_t)> &fn);

  const GeneratorOptions &options_;
  Logger &logger_;
  NameResolver resolver_;
};

class CodeGenerator : public google::protobuf::compiler::CodeGenerator {
public:
  CodeGenerator() = default;
  bool Generate(const google::protobuf::FileDescriptor *file,
                const std::string &parameter,
                google::protobuf::compiler::GeneratorContext *generator_context,
                std::string *error) const override;

  bool GenerateAll(
      const std::vector<const google::protobuf::FileDescriptor *> &files,
      const std::string &parameter,
      google::protobuf::compiler::GeneratorContext *generator_context,
      std::string *error) const override;

  uint64_t GetSupportedFeatures() const override {
    return FEATURE_PROTO3_OPTIONAL;
  }

private:
  absl::Status
  WriteFiles(const std::vector<GeneratedFile> &outputs,
             google::protobuf::compiler::GeneratorContext *generator_context,
             Logger &logger) const;
};

// The plugin's generator.  Handed to PluginMain by main().
std::unique_ptr<google::protobuf::compiler::CodeGenerator> NewCodeGenerator();

} // namespace carno
