// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/functional/function_ref.h"
#include "idl_compiler/model.h"
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace carno {

// Renders the aggregate of a package: a struct with one client per service,
// all sharing the connection opened by New<Package>(), and the InitCarno()
// server bootstrap.  Must only run once every service of the package has
// been generated, since the aggregate refers to their client types.
class PackageGenerator {
public:
  PackageGenerator(const PackageModel &package, std::string added_namespace)
      : package_(package), added_namespace_(std::move(added_namespace)) {}

  void GenerateHeader(std::ostream &os);
  void GenerateSource(std::ostream &os, std::string_view header);

private:
  const PackageModel &package_;
  std::string added_namespace_;
};

// One-shot gate keyed by package name.  The first RunOnce() for a package
// runs the function; every later call for the same package returns false
// without running it.  Safe to use from several threads.
class AggregateGate {
public:
  AggregateGate() = default;
  AggregateGate(const AggregateGate &) = delete;
  AggregateGate &operator=(const AggregateGate &) = delete;

  bool RunOnce(std::string_view package, absl::FunctionRef<void()> fn);

  bool HasRun(std::string_view package);

private:
  std::once_flag *FlagFor(std::string_view package);

  std::mutex lock_;
  absl::flat_hash_map<std::string, std::unique_ptr<std::once_flag>> flags_;
  absl::flat_hash_set<std::string> done_;
};

} // namespace carno
