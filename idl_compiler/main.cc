// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "google/protobuf/compiler/code_generator.h"
#include "google/protobuf/compiler/plugin.h"
#include "idl_compiler/gen.h"

int main(int argc, char *argv[]) {
  std::unique_ptr<google::protobuf::compiler::CodeGenerator> generator =
      carno::NewCodeGenerator();
  return google::protobuf::compiler::PluginMain(argc, argv, generator.get());
}
