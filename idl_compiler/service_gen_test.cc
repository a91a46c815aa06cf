// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "idl_compiler/service_gen.h"
#include "idl_compiler/emit_util.h"
#include "idl_compiler/model.h"
#include "idl_compiler/registry_builder.h"
#include "idl_compiler/testing.h"
#include <gtest/gtest.h>
#include <sstream>

using carno::testing::CountOccurrences;
using carno::testing::TestPool;

// Unary, server streaming, client streaming and bidirectional methods, in
// an order that interleaves them.
static constexpr char kStreamsProto[] = R"pb(
  name: "demo/streams.proto"
  package: "demo"
  message_type { name: "Input" }
  message_type { name: "Output" }
  service {
    name: "Echo"
    method { name: "Say" input_type: ".demo.Input" output_type: ".demo.Output" }
    method {
      name: "Watch"
      input_type: ".demo.Input"
      output_type: ".demo.Output"
      server_streaming: true
    }
    method {
      name: "get_status"
      input_type: ".demo.Input"
      output_type: ".demo.Output"
    }
    method {
      name: "Upload"
      input_type: ".demo.Input"
      output_type: ".demo.Output"
      client_streaming: true
    }
    method {
      name: "Chat"
      input_type: ".demo.Input"
      output_type: ".demo.Output"
      client_streaming: true
      server_streaming: true
    }
    method { name: "Ping" input_type: ".demo.Input" output_type: ".demo.Output" }
  }
  source_code_info {
    location {
      path: [ 6, 0, 2, 0 ]
      span: [ 5, 2, 50 ]
      leading_comments: " Says something back.\n Twice.\n"
    }
  }
)pb";

class ServiceGenTest : public ::testing::Test {
public:
  void Build(const char *text, carno::NameResolver resolver = {}) {
    const auto *file = pool_.Add(text);
    ASSERT_NE(nullptr, file);
    service_ = file->service(0);
    absl::StatusOr<carno::ServiceModel> model =
        carno::BuildServiceModel(service_, resolver, "");
    ASSERT_TRUE(model.ok()) << model.status();
    model_ = std::move(*model);

    carno::ServiceGenerator gen(model_);
    std::stringstream client_header;
    gen.GenerateClientHeader(client_header);
    client_header_ = client_header.str();
    std::stringstream client_source;
    gen.GenerateClientSource(client_source);
    client_source_ = client_source.str();
    std::stringstream server_header;
    gen.GenerateServerHeader(server_header);
    server_header_ = server_header.str();
    std::stringstream server_source;
    gen.GenerateServerSource(server_source);
    server_source_ = server_source.str();
  }

protected:
  TestPool pool_;
  const google::protobuf::ServiceDescriptor *service_ = nullptr;
  carno::ServiceModel model_;
  std::string client_header_;
  std::string client_source_;
  std::string server_header_;
  std::string server_source_;
};

TEST_F(ServiceGenTest, UnaryClientInterface) {
  Build(carno::testing::kEchoProto);
  EXPECT_NE(std::string::npos, client_header_.find("class EchoClient {\n"));
  EXPECT_NE(std::string::npos,
            client_header_.find(
                "  virtual absl::StatusOr<std::unique_ptr<::demo::Output>>\n"
                "  Say(carno::Context &ctx, const ::demo::Input &in, "
                "const carno::client::CallOptions &opts = {}) = 0;\n"));
  EXPECT_NE(std::string::npos,
            client_header_.find(
                "class echoClient final : public EchoClient {\n"));
  EXPECT_NE(std::string::npos,
            client_header_.find("NewEchoClient(const carno::client::Options "
                                "&opts = {});\n"));
}

TEST_F(ServiceGenTest, UnaryServerContract) {
  Build(carno::testing::kEchoProto);
  EXPECT_NE(std::string::npos,
            server_header_.find("template <typename T>\nconcept EchoServer = "
                                "requires(T &srv, carno::Context &ctx"));
  EXPECT_NE(std::string::npos,
            server_header_.find("  { srv.Say(ctx, in_Say) } -> "
                                "std::convertible_to<absl::StatusOr<std::"
                                "unique_ptr<::demo::Output>>>;\n"));
  // A concept, not a base class.
  EXPECT_EQ(std::string::npos, server_header_.find("class EchoServer"));
}

TEST_F(ServiceGenTest, UnaryClientBodyCallsConnectionInOrder) {
  Build(carno::testing::kEchoProto);
  size_t conn = client_source_.find("  carno::client::Client &conn = *client_;\n");
  size_t call = client_source_.find(
      "  absl::Status status = conn.Call(ctx, \"Echo\", \"Say\", in, "
      "out.get(), opts);\n");
  size_t fail = client_source_.find("    return status;\n", call);
  size_t done = client_source_.find("  return out;\n", call);
  ASSERT_NE(std::string::npos, conn);
  ASSERT_NE(std::string::npos, call);
  ASSERT_NE(std::string::npos, fail);
  ASSERT_NE(std::string::npos, done);
  EXPECT_LT(conn, call);
  EXPECT_LT(call, fail);
  EXPECT_LT(fail, done);
}

TEST_F(ServiceGenTest, FactoryReturnsNothingOnConnectionFailure) {
  Build(carno::testing::kEchoProto);
  size_t open = client_source_.find("carno::NewClient(\"demo\", opts);");
  size_t open_fail = client_source_.find("    return client.status();\n");
  size_t start =
      client_source_.find("if (absl::Status status = (*client)->Start(); "
                          "!status.ok()) {\n    return status;\n");
  size_t build = client_source_.find(
      "return std::make_unique<echoClient>(std::move(*client));");
  ASSERT_NE(std::string::npos, open);
  ASSERT_NE(std::string::npos, open_fail);
  ASSERT_NE(std::string::npos, start);
  ASSERT_NE(std::string::npos, build);
  EXPECT_LT(open, open_fail);
  EXPECT_LT(open_fail, start);
  EXPECT_LT(start, build);
}

TEST_F(ServiceGenTest, DispatchTable) {
  Build(carno::testing::kEchoProto);
  EXPECT_EQ((std::vector<std::string>{"Say"}),
            carno::BuildDispatchTable(service_));
  EXPECT_NE(std::string::npos,
            server_source_.find("const carno::mux::ServiceDesc "
                                "kEchoServiceDesc = {\n"
                                "    .service_name = \"Echo\",\n"
                                "    .methods = {\n"
                                "        \"Say\",\n"
                                "    },\n"
                                "};\n"));
}

TEST_F(ServiceGenTest, MethodOrderIsDeclarationOrder) {
  Build(kStreamsProto);
  std::vector<std::string> expected = {"Say",    "Watch", "GetStatus",
                                       "Upload", "Chat",  "Ping"};
  ASSERT_EQ(expected.size(), model_.methods.size());
  size_t last = 0;
  for (size_t i = 0; i < expected.size(); i++) {
    EXPECT_EQ(expected[i], model_.methods[i].name);
    size_t pos = client_header_.find("  " + expected[i] + "(carno::Context",
                                     client_header_.find("class EchoClient {"));
    ASSERT_NE(std::string::npos, pos) << expected[i];
    EXPECT_LT(last, pos) << expected[i];
    last = pos;
  }
}

TEST_F(ServiceGenTest, StreamingMethodsAreNotDispatched) {
  Build(kStreamsProto);
  EXPECT_EQ((std::vector<std::string>{"Say", "get_status", "Ping"}),
            carno::BuildDispatchTable(service_));
  EXPECT_EQ(model_.dispatch_table, carno::BuildDispatchTable(service_));
  EXPECT_NE(std::string::npos,
            server_source_.find("    .methods = {\n"
                                "        \"Say\",\n"
                                "        \"get_status\",\n"
                                "        \"Ping\",\n"
                                "    },\n"));
  for (const char *name : {"Watch", "Upload", "Chat"}) {
    EXPECT_EQ(std::string::npos,
              server_source_.find(std::string("\"") + name + "\""))
        << name;
    EXPECT_EQ(std::string::npos,
              server_header_.find(std::string("handlers.emplace(\"") + name))
        << name;
  }
  EXPECT_EQ(3, CountOccurrences(server_header_, "handlers.emplace("));
}

TEST_F(ServiceGenTest, ServerStreamingReturnsStreamHandle) {
  Build(kStreamsProto);
  EXPECT_NE(std::string::npos,
            client_header_.find(
                "  virtual absl::StatusOr<std::unique_ptr<Echo_WatchClient>>\n"
                "  Watch(carno::Context &ctx, const ::demo::Input &in, "
                "const carno::client::CallOptions &opts = {}) = 0;\n"));
  EXPECT_NE(std::string::npos,
            client_header_.find("class Echo_WatchClient {\n"));
  EXPECT_NE(std::string::npos,
            server_header_.find("class Echo_WatchServer {\n"));
  EXPECT_NE(std::string::npos,
            server_header_.find("  { srv.Watch(ctx, in_Watch, stream_Watch) } "
                                "-> std::convertible_to<absl::Status>;\n"));
}

TEST_F(ServiceGenTest, ClientStreamingOmitsRequest) {
  Build(kStreamsProto);
  EXPECT_NE(std::string::npos,
            client_header_.find(
                "  virtual absl::StatusOr<std::unique_ptr<Echo_UploadClient>>\n"
                "  Upload(carno::Context &ctx, "
                "const carno::client::CallOptions &opts = {}) = 0;\n"));
  EXPECT_NE(std::string::npos,
            client_header_.find(
                "  Chat(carno::Context &ctx, "
                "const carno::client::CallOptions &opts = {}) = 0;\n"));
  EXPECT_NE(std::string::npos,
            server_header_.find("  { srv.Upload(ctx, stream_Upload) } "
                                "-> std::convertible_to<absl::Status>;\n"));
  // Client streaming handles send requests and end with a response.
  size_t upload = client_header_.find("class Echo_UploadClient {\n");
  ASSERT_NE(std::string::npos, upload);
  EXPECT_NE(std::string::npos,
            client_header_.find(
                "  virtual absl::Status Send(const ::demo::Input &in) = 0;\n",
                upload));
  EXPECT_NE(std::string::npos,
            client_header_.find("CloseAndRecv() = 0;\n", upload));
}

TEST_F(ServiceGenTest, StreamingBodiesDoNotUseTheConnection) {
  Build(kStreamsProto);
  EXPECT_EQ(3, CountOccurrences(client_source_,
                                "carno::client::Client &conn = *client_;"));
  EXPECT_NE(std::string::npos,
            client_source_.find("echoClient::Watch(carno::Context &, const "
                                "::demo::Input &, const "
                                "carno::client::CallOptions &) {\n"
                                "  // No Echo_WatchClient is ever produced.\n"
                                "  return absl::UnimplementedError("));
}

TEST_F(ServiceGenTest, StreamingMethodsDocumentUnimplemented) {
  Build(kStreamsProto);
  for (const char *method : {"Watch", "Upload", "Chat"}) {
    std::string handle = std::string("Echo_") + method + "Client";
    EXPECT_NE(std::string::npos,
              client_header_.find(
                  "  // Streaming calls are not routed by the carno runtime.  "
                  "This always\n"
                  "  // returns UNIMPLEMENTED and never produces a " +
                  handle + ".\n"
                  "  virtual absl::StatusOr<std::unique_ptr<" + handle + ">>\n"))
        << method;
  }
  EXPECT_EQ(3, CountOccurrences(client_header_,
                                "Streaming calls are not routed"));
}

TEST_F(ServiceGenTest, ReservedNamesKeepRawWireNames) {
  Build(carno::testing::kEchoProto, carno::NameResolver({"Say"}));
  EXPECT_NE(std::string::npos, client_header_.find("  Say_(carno::Context"));
  EXPECT_NE(std::string::npos,
            client_source_.find("conn.Call(ctx, \"Echo\", \"Say\","));
  EXPECT_NE(std::string::npos, server_header_.find("srv.Say_(ctx, in_Say_)"));
  EXPECT_NE(std::string::npos, server_source_.find("        \"Say\",\n"));
}

TEST_F(ServiceGenTest, CommentsPrecedeMethods) {
  Build(kStreamsProto);
  EXPECT_NE(std::string::npos,
            client_header_.find("  // Says something back.\n"
                                "  // Twice.\n"
                                "  virtual absl::StatusOr<std::unique_ptr<::"
                                "demo::Output>>\n"
                                "  Say("));
  EXPECT_NE(std::string::npos,
            server_header_.find("  // Says something back.\n"
                                "  // Twice.\n"
                                "  { srv.Say(ctx, in_Say) }"));
}

TEST_F(ServiceGenTest, RegistrationRoutesByName) {
  Build(carno::testing::kEchoProto);
  EXPECT_NE(std::string::npos,
            server_header_.find("template <EchoServer Handler>\n"
                                "absl::Status RegisterEchoServer("
                                "std::shared_ptr<Handler> srv) {\n"));
  EXPECT_NE(std::string::npos,
            server_header_.find("  handlers.emplace(\"Say\",\n"));
  EXPECT_NE(std::string::npos,
            server_header_.find("  return carno::HandleService("
                                "kEchoServiceDesc, std::move(handlers));\n"));
}

TEST(ServiceModelTest, DuplicateMethodIdentifiers) {
  TestPool pool;
  const auto *file = pool.Add(R"pb(
    name: "dup.proto"
    package: "demo"
    message_type { name: "Req" }
    service {
      name: "Dup"
      method { name: "get_foo" input_type: ".demo.Req" output_type: ".demo.Req" }
      method { name: "GetFoo" input_type: ".demo.Req" output_type: ".demo.Req" }
    }
  )pb");
  ASSERT_NE(nullptr, file);
  absl::StatusOr<carno::ServiceModel> model =
      carno::BuildServiceModel(file->service(0), carno::NameResolver(), "");
  ASSERT_FALSE(model.ok());
  EXPECT_EQ(absl::StatusCode::kAlreadyExists, model.status().code());
}

TEST(ServiceModelTest, NestedAndForeignTypes) {
  TestPool pool;
  ASSERT_NE(nullptr, pool.Add(R"pb(
              name: "common/types.proto"
              package: "common.v1"
              message_type {
                name: "Outer"
                nested_type { name: "Inner" }
              }
            )pb"));
  const auto *file = pool.Add(R"pb(
    name: "demo/api.proto"
    package: "demo"
    dependency: "common/types.proto"
    service {
      name: "Api"
      method {
        name: "Get"
        input_type: ".common.v1.Outer"
        output_type: ".common.v1.Outer.Inner"
      }
    }
  )pb");
  ASSERT_NE(nullptr, file);
  absl::StatusOr<carno::ServiceModel> model =
      carno::BuildServiceModel(file->service(0), carno::NameResolver(), "rpc");
  ASSERT_TRUE(model.ok()) << model.status();
  ASSERT_EQ(1, model->methods.size());
  EXPECT_EQ("::common::v1::Outer", model->methods[0].input_type);
  EXPECT_EQ("::common::v1::Outer_Inner", model->methods[0].output_type);
  EXPECT_EQ("::demo::rpc", model->cpp_namespace);
  EXPECT_EQ("demo.Api", model->full_name);
}

TEST(ServiceModelTest, KeywordPackageComponents) {
  TestPool pool;
  const auto *file = pool.Add(R"pb(
    name: "foo/class/api.proto"
    package: "foo.class"
    message_type {
      name: "Req"
      nested_type { name: "new" }
    }
    service {
      name: "Api"
      method {
        name: "Get"
        input_type: ".foo.class.Req"
        output_type: ".foo.class.Req.new"
      }
    }
  )pb");
  ASSERT_NE(nullptr, file);
  absl::StatusOr<carno::ServiceModel> model =
      carno::BuildServiceModel(file->service(0), carno::NameResolver(), "");
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_EQ("::foo::class_::Req", model->methods[0].input_type);
  EXPECT_EQ("::foo::class_::Req_new", model->methods[0].output_type);
  EXPECT_EQ("::foo::class_", model->cpp_namespace);

  std::stringstream os;
  carno::OpenNamespace(os, "foo.class", "");
  carno::CloseNamespace(os, "foo.class", "");
  EXPECT_EQ("namespace foo {\nnamespace class_ {\n\n"
            "} // namespace class_\n} // namespace foo\n",
            os.str());
}

TEST_F(ServiceGenTest, ServiceWithoutMethods) {
  Build(R"pb(
    name: "demo/empty.proto"
    package: "demo"
    service { name: "Empty" }
  )pb");
  EXPECT_NE(std::string::npos,
            server_header_.find("template <typename T>\n"
                                "concept EmptyServer = true;\n"));
  EXPECT_EQ(std::string::npos, server_header_.find("requires("));
  EXPECT_NE(std::string::npos,
            server_header_.find("extern const carno::mux::ServiceDesc "
                                "kEmptyServiceDesc;\n"));
  EXPECT_NE(std::string::npos,
            server_header_.find("template <EmptyServer Handler>\n"
                                "absl::Status RegisterEmptyServer("
                                "std::shared_ptr<Handler>) {\n"
                                "  carno::mux::HandlerMap handlers;\n"
                                "  return carno::HandleService("
                                "kEmptyServiceDesc, std::move(handlers));\n"));
  EXPECT_NE(std::string::npos,
            server_source_.find("const carno::mux::ServiceDesc "
                                "kEmptyServiceDesc = {\n"
                                "    .service_name = \"Empty\",\n"
                                "    .methods = {\n"
                                "    },\n"
                                "};\n"));
  EXPECT_NE(std::string::npos, client_header_.find("class EmptyClient {\n"));
}

TEST_F(ServiceGenTest, TrailingBackslashInComment) {
  Build(R"pb(
    name: "demo/paths.proto"
    package: "demo"
    message_type { name: "Req" }
    service {
      name: "Paths"
      method { name: "Get" input_type: ".demo.Req" output_type: ".demo.Req" }
    }
    source_code_info {
      location {
        path: [ 6, 0, 2, 0 ]
        span: [ 5, 2, 50 ]
        leading_comments: " Reads C:\\dir\\\n Continued \\ \n"
      }
    }
  )pb");
  EXPECT_NE(std::string::npos,
            client_header_.find("  // Reads C:\\dir\n"
                                "  // Continued\n"
                                "  virtual absl::StatusOr<std::unique_ptr<"
                                "::demo::Req>>\n"
                                "  Get(carno::Context &ctx"));
  EXPECT_NE(std::string::npos,
            server_header_.find("  // Reads C:\\dir\n"
                                "  // Continued\n"
                                "  { srv.Get(ctx, in_Get) }"));
  EXPECT_EQ(std::string::npos, client_header_.find("\\\n"));
}

TEST(EmitUtilTest, PrintComments) {
  std::stringstream os;
  carno::PrintComments(os, {" One", "", " Two \\\\", " Three  "}, "  ");
  EXPECT_EQ("  // One\n  //\n  // Two\n  // Three\n", os.str());
}
