// Copyright 2023-2026 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "idl_compiler/gen.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "idl_compiler/emit_util.h"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

namespace carno {

using path = std::filesystem::path;

static absl::Status
WriteToZeroCopyStream(const std::string &data,
                      google::protobuf::io::ZeroCopyOutputStream *stream) {
  // Write to the stream that protobuf wants
  void *data_buffer;
  int size;
  size_t offset = 0;
  while (offset < data.size()) {
    if (!stream->Next(&data_buffer, &size)) {
      return absl::InternalError("Output stream refused more data");
    }
    int to_copy = std::min(size, static_cast<int>(data.size() - offset));
    std::memcpy(data_buffer, data.data() + offset, to_copy);
    offset += to_copy;
    stream->BackUp(size - to_copy);
  }
  return absl::OkStatus();
}

absl::StatusOr<GeneratorOptions>
ParseGeneratorOptions(const std::string &parameter) {
  std::vector<std::pair<std::string, std::string>> pairs;
  google::protobuf::compiler::ParseGeneratorParameter(parameter, &pairs);

  GeneratorOptions options;
  for (const auto &[key, value] : pairs) {
    if (key == "add_namespace") {
      options.added_namespace = value;
    } else if (key == "package_name") {
      options.package_name = value;
    } else if (key == "target_name") {
      options.target_name = value;
    } else if (key == "reserved_names") {
      for (absl::string_view name :
           absl::StrSplit(value, ':', absl::SkipEmpty())) {
        options.reserved_names.insert(std::string(name));
      }
    } else if (key == "jobs") {
      if (!absl::SimpleAtoi(value, &options.jobs) || options.jobs < 1) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid value for jobs: \"%s\"", value));
      }
    } else if (key == "log_level") {
      absl::StatusOr<LogLevel> level = ParseLogLevel(value);
      if (!level.ok()) {
        return level.status();
      }
      options.log_level = *level;
    } else {
      return absl::InvalidArgumentError(
          absl::StrFormat("Unknown option \"%s\"", key));
    }
  }
  return options;
}

std::string GeneratedFilename(std::string_view package_name,
                              std::string_view target_name,
                              std::string_view filename) {
  size_t virtual_imports = filename.find("_virtual_imports/");
  if (virtual_imports != std::string_view::npos) {
    // This is something like:
    // bazel-out/darwin_arm64-dbg/bin/external/protobuf/_virtual_imports/any_proto/google/protobuf/any.proto
    filename = filename.substr(virtual_imports + sizeof("_virtual_imports/"));
    // Remove the first directory.
    filename = filename.substr(filename.find('/') + 1);
  }
  return (path(package_name) / path(target_name) / path(filename)).string();
}

static std::string OutputName(const GeneratorOptions &options,
                              const google::protobuf::FileDescriptor *file,
                              std::string_view extension) {
  path p(GeneratedFilename(options.package_name, options.target_name,
                           file->name()));
  p.replace_extension(extension);
  return p.string();
}

std::string ClientHeaderName(const GeneratorOptions &options,
                             const google::protobuf::FileDescriptor *file) {
  return OutputName(options, file, ".carno_client.h");
}

std::string ServerHeaderName(const GeneratorOptions &options,
                             const google::protobuf::FileDescriptor *file) {
  return OutputName(options, file, ".carno_server.h");
}

std::string PackageHeaderName(const GeneratorOptions &options,
                              const std::string &package) {
  std::vector<std::string> parts = absl::StrSplit(package, '.');
  std::string filename =
      absl::StrCat(absl::StrReplaceAll(package, {{".", "/"}}), "/",
                   parts.back(), ".carno_pkg.h");
  return GeneratedFilename(options.package_name, options.target_name,
                           filename);
}

static std::string SourceName(std::string_view header) {
  path p(header);
  p.replace_extension(".cc");
  return p.string();
}

Generator::Generator(const FileModel &file, const GeneratorOptions &options)
    : file_(file.file), options_(options) {
  for (const auto &service : file.services) {
    service_gens_.push_back(std::make_unique<ServiceGenerator>(service));
  }
}

void Generator::GenerateClientHeaders(std::ostream &os) {
  os << "#pragma once\n";
  PrintBanner(os, file_->name());
  path cpp_header(GeneratedFilename("", "", file_->name()));
  cpp_header.replace_extension(".pb.h");
  PrintIncludes(os, {cpp_header.string()});

  OpenNamespace(os, file_->package(), options_.added_namespace);
  PrintVersionCheck(os);

  for (auto &svc_gen : service_gens_) {
    svc_gen->GenerateClientHeader(os);
  }

  CloseNamespace(os, file_->package(), options_.added_namespace);
}

void Generator::GenerateClientSources(std::ostream &os) {
  PrintBanner(os, file_->name());
  os << "#include \"" << ClientHeaderName(options_, file_) << "\"\n";
  os << "\n";

  OpenNamespace(os, file_->package(), options_.added_namespace);

  for (auto &svc_gen : service_gens_) {
    svc_gen->GenerateClientSource(os);
  }

  CloseNamespace(os, file_->package(), options_.added_namespace);
}

void Generator::GenerateServerHeaders(std::ostream &os) {
  os << "#pragma once\n";
  PrintBanner(os, file_->name());
  path cpp_header(GeneratedFilename("", "", file_->name()));
  cpp_header.replace_extension(".pb.h");
  PrintIncludes(os, {cpp_header.string()});

  OpenNamespace(os, file_->package(), options_.added_namespace);
  PrintVersionCheck(os);

  for (auto &svc_gen : service_gens_) {
    svc_gen->GenerateServerHeader(os);
  }

  CloseNamespace(os, file_->package(), options_.added_namespace);
}

void Generator::GenerateServerSources(std::ostream &os) {
  PrintBanner(os, file_->name());
  os << "#include \"" << ServerHeaderName(options_, file_) << "\"\n";
  os << "\n";

  OpenNamespace(os, file_->package(), options_.added_namespace);

  for (auto &svc_gen : service_gens_) {
    svc_gen->GenerateServerSource(os);
  }

  CloseNamespace(os, file_->package(), options_.added_namespace);
}

Pipeline::Pipeline(const GeneratorOptions &options, Logger &logger)
    : options_(options), logger_(logger), resolver_(options.reserved_names) {}

void Pipeline::ForEachPackage(size_t n,
                              const std::function<void(size_t)> &fn) {
  size_t num_threads =
      std::min(static_cast<size_t>(std::max(options_.jobs, 1)), n);
  if (num_threads <= 1) {
    for (size_t i = 0; i < n; i++) {
      fn(i);
    }
    return;
  }
  std::atomic<size_t> next = 0;
  std::vector<std::thread> workers;
  for (size_t t = 0; t < num_threads; t++) {
    workers.emplace_back([&next, n, &fn]() {
      for (size_t i = next++; i < n; i = next++) {
        fn(i);
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }
}

absl::Status Pipeline::EmitServices(const PackageGroup &group,
                                    PackageState &state) {
  // All models are built before rendering; the generators refer to them.
  for (const auto *file : group.files) {
    absl::StatusOr<FileModel> model =
        BuildFileModel(file, resolver_, options_.added_namespace);
    if (!model.ok()) {
      return model.status();
    }
    state.files.push_back(std::move(*model));
  }

  for (const auto &model : state.files) {
    Generator gen(model, options_);
    std::string client_header = ClientHeaderName(options_, model.file);
    std::string server_header = ServerHeaderName(options_, model.file);

    std::stringstream client_header_stream;
    gen.GenerateClientHeaders(client_header_stream);
    std::stringstream client_source_stream;
    gen.GenerateClientSources(client_source_stream);
    std::stringstream server_header_stream;
    gen.GenerateServerHeaders(server_header_stream);
    std::stringstream server_source_stream;
    gen.GenerateServerSources(server_source_stream);

    state.service_outputs.push_back(
        {SourceName(client_header), client_source_stream.str()});
    state.service_outputs.push_back(
        {std::move(client_header), client_header_stream.str()});
    state.service_outputs.push_back(
        {SourceName(server_header), server_source_stream.str()});
    state.service_outputs.push_back(
        {std::move(server_header), server_header_stream.str()});
    logger_.Log(LogLevel::kDebug, "Rendered %d services of %s",
                static_cast<int>(model.services.size()),
                std::string(model.file->name()).c_str());
  }
  return absl::OkStatus();
}

absl::Status Pipeline::EmitAggregate(const PackageGroup &group,
                                     PackageState &state,
                                     AggregateGate &gate) {
  absl::Status status;
  bool ran = gate.RunOnce(group.package, [&]() {
    std::vector<const ServiceModel *> services;
    std::vector<std::string> headers;
    for (const auto &file : state.files) {
      headers.push_back(ClientHeaderName(options_, file.file));
      for (const auto &service : file.services) {
        services.push_back(&service);
      }
    }
    absl::StatusOr<PackageModel> model =
        BuildPackageModel(group, services, std::move(headers), resolver_);
    if (!model.ok()) {
      status = model.status();
      return;
    }
    PackageGenerator gen(*model, options_.added_namespace);
    std::string header = PackageHeaderName(options_, group.package);

    std::stringstream header_stream;
    gen.GenerateHeader(header_stream);
    std::stringstream source_stream;
    gen.GenerateSource(source_stream, header);

    state.aggregate_outputs.push_back(
        {SourceName(header), source_stream.str()});
    state.aggregate_outputs.push_back(
        {std::move(header), header_stream.str()});
    logger_.Log(LogLevel::kDebug, "Rendered aggregate %s for package %s",
                model->name.c_str(), group.package.c_str());
  });
  if (!ran) {
    logger_.Log(LogLevel::kDebug, "Aggregate for package %s already emitted",
                group.package.c_str());
  }
  return status;
}

absl::StatusOr<std::vector<GeneratedFile>> Pipeline::Run(
    const std::vector<const google::protobuf::FileDescriptor *> &files) {
  absl::StatusOr<std::vector<PackageGroup>> groups = CollectPackages(files);
  if (!groups.ok()) {
    return groups.status();
  }
  std::vector<PackageState> states(groups->size());

  // Stage one: services of every file.
  ForEachPackage(groups->size(), [&](size_t i) {
    states[i].status = EmitServices((*groups)[i], states[i]);
  });
  for (const auto &state : states) {
    if (!state.status.ok()) {
      return state.status;
    }
  }

  // Stage two: package aggregates, now that every client type exists.
  AggregateGate gate;
  ForEachPackage(groups->size(), [&](size_t i) {
    states[i].status = EmitAggregate((*groups)[i], states[i], gate);
  });
  for (const auto &state : states) {
    if (!state.status.ok()) {
      return state.status;
    }
  }

  std::vector<GeneratedFile> outputs;
  for (auto &state : states) {
    for (auto &output : state.service_outputs) {
      outputs.push_back(std::move(output));
    }
    for (auto &output : state.aggregate_outputs) {
      outputs.push_back(std::move(output));
    }
  }
  return outputs;
}

absl::Status CodeGenerator::WriteFiles(
    const std::vector<GeneratedFile> &outputs,
    google::protobuf::compiler::GeneratorContext *generator_context,
    Logger &logger) const {
  for (const auto &output : outputs) {
    logger.Log(LogLevel::kDebug, "Generating %s", output.name.c_str());
    std::unique_ptr<google::protobuf::io::ZeroCopyOutputStream> stream(
        generator_context->Open(output.name));
    if (stream == nullptr) {
      return absl::InternalError(
          absl::StrFormat("Failed to open %s for writing", output.name));
    }
    if (absl::Status status =
            WriteToZeroCopyStream(output.content, stream.get());
        !status.ok()) {
      return absl::InternalError(absl::StrFormat(
          "Failed to write %s: %s", output.name, status.message()));
    }
  }
  return absl::OkStatus();
}

bool CodeGenerator::Generate(
    const google::protobuf::FileDescriptor *file, const std::string &parameter,
    google::protobuf::compiler::GeneratorContext *generator_context,
    std::string *error) const {
  return GenerateAll({file}, parameter, generator_context, error);
}

bool CodeGenerator::GenerateAll(
    const std::vector<const google::protobuf::FileDescriptor *> &files,
    const std::string &parameter,
    google::protobuf::compiler::GeneratorContext *generator_context,
    std::string *error) const {
  absl::StatusOr<GeneratorOptions> options = ParseGeneratorOptions(parameter);
  if (!options.ok()) {
    *error = std::string(options.status().message());
    return false;
  }
  Logger logger("protoc-gen-carno", options->log_level);

  Pipeline pipeline(*options, logger);
  absl::StatusOr<std::vector<GeneratedFile>> outputs = pipeline.Run(files);
  if (!outputs.ok()) {
    logger.Log(LogLevel::kError, "Generation failed: %s",
               outputs.status().ToString().c_str());
    *error = std::string(outputs.status().message());
    return false;
  }

  if (absl::Status status = WriteFiles(*outputs, generator_context, logger);
      !status.ok()) {
    logger.Log(LogLevel::kError, "%s", status.ToString().c_str());
    *error = std::string(status.message());
    return false;
  }
  return true;
}

std::unique_ptr<google::protobuf::compiler::CodeGenerator> NewCodeGenerator() {
  return std::make_unique<CodeGenerator>();
}

} // namespace carno
