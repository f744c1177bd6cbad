#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/llm/model_client.hpp"
#include "prdchat/llm/v1/model_gateway.grpc.pb.h"

namespace prdchat::llm {

/*
  ModelClient backed by the ModelGateway gRPC service.

  Each StreamGenerate call opens one server-streaming Generate RPC with
  the configured deadline. Request identifiers travel as metadata.
  Transport failures surface as a terminal kError chunk.
*/
class GrpcModelClient final : public ModelClient {
 public:
  GrpcModelClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout);

  std::unique_ptr<ModelStream> StreamGenerate(const pipeline::RequestContext& ctx, const ModelRequest& request) override;

 private:
  std::unique_ptr<prdchat::llm::v1::ModelGateway::Stub> stub_;
  std::chrono::milliseconds                             timeout_;
};

} // namespace prdchat::llm
