// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "idl_compiler/service_gen.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "idl_compiler/emit_util.h"

namespace carno {

std::string ServiceGenerator::ClientReturnType(const MethodModel &method) const {
  if (method.IsStreaming()) {
    return absl::StrCat("absl::StatusOr<std::unique_ptr<",
                        method.client_stream_type, ">>");
  }
  return absl::StrCat("absl::StatusOr<std::unique_ptr<", method.output_type,
                      ">>");
}

std::string ServiceGenerator::ClientParameters(const MethodModel &method,
                                               bool definition) const {
  // Streaming bodies do not use their arguments.
  bool named = !(definition && method.IsStreaming());
  std::string params = named ? "carno::Context &ctx" : "carno::Context &";
  if (!method.client_streaming) {
    // A client streaming request is sent through the stream handle.
    absl::StrAppend(&params, ", const ", method.input_type,
                    named ? " &in" : " &");
  }
  absl::StrAppend(&params, ", const carno::client::CallOptions &");
  if (named) {
    absl::StrAppend(&params, "opts");
  }
  if (!definition) {
    absl::StrAppend(&params, " = {}");
  }
  return params;
}

void ServiceGenerator::GenerateClientHeader(std::ostream &os) {
  for (const auto &method : service_.methods) {
    if (method.IsStreaming()) {
      GenerateClientStreamHandle(method, os);
    }
  }

  // Client side interface.
  os << "// Client API for " << service_.name << " service.\n";
  PrintComments(os, service_.comments, "");
  os << "class " << service_.client_interface << " {\n";
  os << "public:\n";
  os << "  virtual ~" << service_.client_interface << "() = default;\n";
  for (const auto &method : service_.methods) {
    os << "\n";
    PrintComments(os, method.comments, "  ");
    if (method.IsStreaming()) {
      os << "  // Streaming calls are not routed by the carno runtime.  This "
            "always\n";
      os << "  // returns UNIMPLEMENTED and never produces a "
         << method.client_stream_type << ".\n";
    }
    os << "  virtual " << ClientReturnType(method) << "\n";
    os << "  " << method.name << "("
       << ClientParameters(method, /*definition=*/false)
       << ") = 0;\n";
  }
  os << "};\n";
  os << "\n";

  GenerateClientImplHeader(os);
}

void ServiceGenerator::GenerateClientImplHeader(std::ostream &os) {
  // All methods of the implementation go through the one connection it
  // holds.  The connection may be shared with other clients of the same
  // package.
  os << "class " << service_.client_impl << " final : public "
     << service_.client_interface << " {\n";
  os << "public:\n";
  os << "  explicit " << service_.client_impl
     << "(std::shared_ptr<carno::client::Client> client)\n";
  os << "      : client_(std::move(client)) {}\n";
  for (const auto &method : service_.methods) {
    os << "\n";
    os << "  " << ClientReturnType(method) << "\n";
    os << "  " << method.name << "("
       << ClientParameters(method, /*definition=*/false)
       << ") override;\n";
  }
  os << "\n";
  os << "private:\n";
  os << "  std::shared_ptr<carno::client::Client> client_;\n";
  os << "};\n";
  os << "\n";

  os << "// Opens and starts a connection for package " << service_.package
     << " and returns a\n";
  os << "// client that owns it.  Nothing is returned if the connection "
        "fails.\n";
  os << "absl::StatusOr<std::unique_ptr<" << service_.client_interface
     << ">>\n";
  os << "New" << service_.client_interface
     << "(const carno::client::Options &opts = {});\n";
  os << "\n";
}

void ServiceGenerator::GenerateClientStreamHandle(const MethodModel &method,
                                                  std::ostream &os) {
  os << "// Client side stream of " << service_.raw_name << "."
     << method.raw_name << ".\n";
  os << "class " << method.client_stream_type << " {\n";
  os << "public:\n";
  os << "  virtual ~" << method.client_stream_type << "() = default;\n";
  if (method.client_streaming) {
    os << "  virtual absl::Status Send(const " << method.input_type
       << " &in) = 0;\n";
  }
  if (method.server_streaming) {
    os << "  virtual absl::StatusOr<std::unique_ptr<" << method.output_type
       << ">> Recv() = 0;\n";
  }
  if (method.client_streaming && method.server_streaming) {
    os << "  virtual absl::Status CloseSend() = 0;\n";
  } else if (method.client_streaming) {
    os << "  virtual absl::StatusOr<std::unique_ptr<" << method.output_type
       << ">> CloseAndRecv() = 0;\n";
  }
  os << "};\n";
  os << "\n";
}

void ServiceGenerator::GenerateClientSource(std::ostream &os) {
  // Client side method definitions.
  for (const auto &method : service_.methods) {
    GenerateMethodClientSource(method, os);
  }

  os << "absl::StatusOr<std::unique_ptr<" << service_.client_interface
     << ">>\n";
  os << "New" << service_.client_interface
     << "(const carno::client::Options &opts) {\n";
  os << "  absl::StatusOr<std::shared_ptr<carno::client::Client>> client =\n";
  os << "      carno::NewClient(\"" << absl::CEscape(service_.package)
     << "\", opts);\n";
  os << "  if (!client.ok()) {\n";
  os << "    return client.status();\n";
  os << "  }\n";
  os << "  if (absl::Status status = (*client)->Start(); !status.ok()) {\n";
  os << "    return status;\n";
  os << "  }\n";
  os << "  return std::make_unique<" << service_.client_impl
     << ">(std::move(*client));\n";
  os << "}\n";
  os << "\n";
}

void ServiceGenerator::GenerateMethodClientSource(const MethodModel &method,
                                                  std::ostream &os) {
  os << ClientReturnType(method) << "\n";
  os << service_.client_impl << "::" << method.name << "("
     << ClientParameters(method, /*definition=*/true)
     << ") {\n";
  if (method.IsStreaming()) {
    // The dispatch registry only routes unary calls.
    os << "  // No " << method.client_stream_type
       << " is ever produced.\n";
    os << "  return absl::UnimplementedError(\""
       << absl::CEscape(service_.full_name) << "." << method.raw_name
       << " is a streaming method and is not routed by the carno "
          "runtime\");\n";
    os << "}\n";
    os << "\n";
    return;
  }
  // The status from the connection is returned untouched so that callers
  // can tell transport errors from encoding errors.
  os << "  carno::client::Client &conn = *client_;\n";
  os << "  auto out = std::make_unique<" << method.output_type << ">();\n";
  os << "  absl::Status status = conn.Call(ctx, \""
     << absl::CEscape(service_.raw_name) << "\", \""
     << absl::CEscape(method.raw_name) << "\", in, out.get(), opts);\n";
  os << "  if (!status.ok()) {\n";
  os << "    return status;\n";
  os << "  }\n";
  os << "  return out;\n";
  os << "}\n";
  os << "\n";
}

void ServiceGenerator::GenerateServerStreamHandle(const MethodModel &method,
                                                  std::ostream &os) {
  os << "// Server side stream of " << service_.raw_name << "."
     << method.raw_name << ".\n";
  os << "class " << method.server_stream_type << " {\n";
  os << "public:\n";
  os << "  virtual ~" << method.server_stream_type << "() = default;\n";
  if (method.server_streaming) {
    os << "  virtual absl::Status Send(const " << method.output_type
       << " &out) = 0;\n";
  }
  if (method.client_streaming) {
    os << "  virtual absl::StatusOr<std::unique_ptr<" << method.input_type
       << ">> Recv() = 0;\n";
  }
  if (method.client_streaming && !method.server_streaming) {
    os << "  virtual absl::Status SendAndClose(const " << method.output_type
       << " &out) = 0;\n";
  }
  os << "};\n";
  os << "\n";
}

void ServiceGenerator::GenerateServerHeader(std::ostream &os) {
  for (const auto &method : service_.methods) {
    if (method.IsStreaming()) {
      GenerateServerStreamHandle(method, os);
    }
  }

  // Server side contract.  Any handler type with matching member functions
  // satisfies it; there is no base class.
  os << "// Server API for " << service_.name << " service.\n";
  PrintComments(os, service_.comments, "");
  os << "template <typename T>\n";
  if (service_.methods.empty()) {
    // A requires-expression needs at least one requirement.
    os << "concept " << service_.server_concept << " = true;\n";
    os << "\n";
    registry_.GenerateHeader(os);
    return;
  }
  os << "concept " << service_.server_concept
     << " = requires(T &srv, carno::Context &ctx";
  for (const auto &method : service_.methods) {
    if (!method.client_streaming) {
      os << ",\n    const " << method.input_type << " &in_" << method.name;
    }
    if (method.IsStreaming()) {
      os << ",\n    " << method.server_stream_type << " &stream_"
         << method.name;
    }
  }
  os << ") {\n";
  for (const auto &method : service_.methods) {
    GenerateMethodServerRequirement(method, os);
  }
  os << "};\n";
  os << "\n";

  registry_.GenerateHeader(os);
}

void ServiceGenerator::GenerateMethodServerRequirement(
    const MethodModel &method, std::ostream &os) {
  PrintComments(os, method.comments, "  ");
  if (!method.IsStreaming()) {
    os << "  { srv." << method.name << "(ctx, in_" << method.name
       << ") } -> std::convertible_to<absl::StatusOr<std::unique_ptr<"
       << method.output_type << ">>>;\n";
    return;
  }
  os << "  { srv." << method.name << "(ctx, ";
  if (!method.client_streaming) {
    os << "in_" << method.name << ", ";
  }
  os << "stream_" << method.name
     << ") } -> std::convertible_to<absl::Status>;\n";
}

void ServiceGenerator::GenerateServerSource(std::ostream &os) {
  registry_.GenerateSource(os);
}

} // namespace carno
