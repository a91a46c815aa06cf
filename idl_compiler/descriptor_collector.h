// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/statusor.h"
#include "google/protobuf/descriptor.h"
#include <string>
#include <vector>

namespace carno {

// All services of one package, gathered from every file in the request
// that declares the package.
struct PackageGroup {
  std::string package;
  // Files that contributed at least one service, in processing order.
  std::vector<const google::protobuf::FileDescriptor *> files;
  // Services in file processing order, then declaration order.
  std::vector<const google::protobuf::ServiceDescriptor *> services;
};

// Groups the services of 'files' by package.  Packages appear in the order
// they are first seen.  Files without services are skipped; a file with
// services and no package is an InvalidArgument error.
absl::StatusOr<std::vector<PackageGroup>> CollectPackages(
    const std::vector<const google::protobuf::FileDescriptor *> &files);

} // namespace carno
