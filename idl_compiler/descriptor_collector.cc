// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "idl_compiler/descriptor_collector.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"

namespace carno {

absl::StatusOr<std::vector<PackageGroup>> CollectPackages(
    const std::vector<const google::protobuf::FileDescriptor *> &files) {
  std::vector<PackageGroup> groups;
  // Package name to index in groups.
  absl::flat_hash_map<std::string, size_t> index;

  for (const auto *file : files) {
    if (file->service_count() == 0) {
      continue;
    }
    std::string package(file->package());
    if (package.empty()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "%s: file declares services but has no package", file->name()));
    }
    auto [it, inserted] = index.emplace(package, groups.size());
    if (inserted) {
      groups.push_back(PackageGroup{.package = package});
    }
    PackageGroup &group = groups[it->second];
    group.files.push_back(file);
    for (int i = 0; i < file->service_count(); i++) {
      group.services.push_back(file->service(i));
    }
  }
  return groups;
}

} // namespace carno
