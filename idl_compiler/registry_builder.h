// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "google/protobuf/descriptor.h"
#include <iostream>
#include <string>
#include <vector>

namespace carno {

struct ServiceModel;

// The dispatch table of a service: raw names of the methods that are
// neither client nor server streaming, in declaration order.  The runtime
// looks methods up by name; the position of a name in the table carries no
// meaning.
std::vector<std::string>
BuildDispatchTable(const google::protobuf::ServiceDescriptor *service);

// Renders the static service descriptor and the registration function.
class RegistryGenerator {
public:
  explicit RegistryGenerator(const ServiceModel &service) : service_(service) {}

  // Declaration of the descriptor and the Register<Service>Server
  // template.  Must follow the server concept.
  void GenerateHeader(std::ostream &os) const;

  // Definition of the descriptor.
  void GenerateSource(std::ostream &os) const;

private:
  const ServiceModel &service_;
};

} // namespace carno
