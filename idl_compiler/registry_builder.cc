// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "idl_compiler/registry_builder.h"
#include "absl/strings/escaping.h"
#include "idl_compiler/model.h"

namespace carno {

std::vector<std::string>
BuildDispatchTable(const google::protobuf::ServiceDescriptor *service) {
  std::vector<std::string> table;
  for (int i = 0; i < service->method_count(); i++) {
    const auto *method = service->method(i);
    if (method->client_streaming() || method->server_streaming()) {
      continue;
    }
    table.emplace_back(method->name());
  }
  return table;
}

void RegistryGenerator::GenerateHeader(std::ostream &os) const {
  os << "// Dispatch registry for " << service_.full_name
     << ".  Calls are routed by\n";
  os << "// method name; streaming methods are not registered.\n";
  os << "extern const carno::mux::ServiceDesc " << service_.desc_name
     << ";\n";
  os << "\n";
  os << "template <" << service_.server_concept << " Handler>\n";
  // Without unary methods the handler is never referenced.
  os << "absl::Status Register" << service_.server_concept
     << "(std::shared_ptr<Handler>"
     << (service_.dispatch_table.empty() ? "" : " srv") << ") {\n";
  os << "  carno::mux::HandlerMap handlers;\n";
  for (const auto &method : service_.methods) {
    if (method.IsStreaming()) {
      continue;
    }
    os << "  handlers.emplace(\"" << absl::CEscape(method.raw_name) << "\",\n";
    os << "                   carno::mux::UnaryHandler<" << method.input_type
       << ", " << method.output_type << ">(\n";
    os << "                       [srv](carno::Context &ctx, const "
       << method.input_type << " &in) {\n";
    os << "                         return srv->" << method.name
       << "(ctx, in);\n";
    os << "                       }));\n";
  }
  os << "  return carno::HandleService(" << service_.desc_name
     << ", std::move(handlers));\n";
  os << "}\n";
  os << "\n";
}

void RegistryGenerator::GenerateSource(std::ostream &os) const {
  os << "const carno::mux::ServiceDesc " << service_.desc_name << " = {\n";
  os << "    .service_name = \"" << absl::CEscape(service_.raw_name)
     << "\",\n";
  os << "    .methods = {\n";
  for (const auto &name : service_.dispatch_table) {
    os << "        \"" << absl::CEscape(name) << "\",\n";
  }
  os << "    },\n";
  os << "};\n";
  os << "\n";
}

} // namespace carno
