// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once
#include "idl_compiler/model.h"
#include "idl_compiler/registry_builder.h"
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace carno {

// Renders the bindings for one service from its model.
class ServiceGenerator {
public:
  explicit ServiceGenerator(const ServiceModel &service)
      : service_(service), registry_(service) {}

  // Stream handles, the abstract <Service>Client, its implementation over
  // the shared connection and the New<Service>Client factory declaration.
  void GenerateClientHeader(std::ostream &os);
  void GenerateClientSource(std::ostream &os);

  // Server stream handles, the <Service>Server concept and the dispatch
  // registry.
  void GenerateServerHeader(std::ostream &os);
  void GenerateServerSource(std::ostream &os);

private:
  void GenerateClientStreamHandle(const MethodModel &method, std::ostream &os);
  void GenerateServerStreamHandle(const MethodModel &method, std::ostream &os);
  void GenerateClientImplHeader(std::ostream &os);

  // Return type and parameter list of a client method.  Declarations
  // carry the default options argument; definitions of streaming methods
  // leave their parameters unnamed.
  std::string ClientReturnType(const MethodModel &method) const;
  std::string ClientParameters(const MethodModel &method,
                               bool definition) const;

  void GenerateMethodClientSource(const MethodModel &method, std::ostream &os);
  void GenerateMethodServerRequirement(const MethodModel &method,
                                       std::ostream &os);

  const ServiceModel &service_;
  RegistryGenerator registry_;
};

} // namespace carno
