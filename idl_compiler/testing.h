// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

// Test helpers: descriptors built from text format FileDescriptorProtos and
// a GeneratorContext that keeps the generated files in memory.

#include "google/protobuf/compiler/code_generator.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/descriptor.pb.h"
#include "google/protobuf/io/zero_copy_stream_impl_lite.h"
#include "google/protobuf/text_format.h"
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

namespace carno::testing {

class TestPool {
public:
  // Parses 'text' as a FileDescriptorProto and adds it to the pool.
  // Returns nullptr (and fails the test) if it does not parse or build.
  const google::protobuf::FileDescriptor *Add(const std::string &text) {
    google::protobuf::FileDescriptorProto proto;
    if (!google::protobuf::TextFormat::ParseFromString(text, &proto)) {
      ADD_FAILURE() << "Bad FileDescriptorProto:\n" << text;
      return nullptr;
    }
    const google::protobuf::FileDescriptor *file = pool_.BuildFile(proto);
    if (file == nullptr) {
      ADD_FAILURE() << "Failed to build " << proto.name();
    }
    return file;
  }

private:
  google::protobuf::DescriptorPool pool_;
};

// demo/echo.proto: package demo, messages Input and Output and service
// Echo with a unary Say.
inline constexpr char kEchoProto[] = R"pb(
  name: "demo/echo.proto"
  package: "demo"
  message_type { name: "Input" }
  message_type { name: "Output" }
  service {
    name: "Echo"
    method { name: "Say" input_type: ".demo.Input" output_type: ".demo.Output" }
  }
)pb";

class MemoryGeneratorContext
    : public google::protobuf::compiler::GeneratorContext {
public:
  google::protobuf::io::ZeroCopyOutputStream *
  Open(const std::string &filename) override {
    std::string &contents = files_[filename];
    contents.clear();
    return new google::protobuf::io::StringOutputStream(&contents);
  }

  const std::map<std::string, std::string> &Files() const { return files_; }

  bool Has(const std::string &filename) const {
    return files_.find(filename) != files_.end();
  }

  const std::string &File(const std::string &filename) {
    return files_[filename];
  }

private:
  std::map<std::string, std::string> files_;
};

// Number of non-overlapping occurrences of 'needle' in 'haystack'.
inline int CountOccurrences(const std::string &haystack,
                            const std::string &needle) {
  int count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    count++;
  }
  return count;
}

} // namespace carno::testing
