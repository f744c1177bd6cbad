#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/compression/compression_worker.hpp"

namespace prdchat::factory {

/*
  Everything the process keeps alive: gRPC services handed to the
  server and the background workers stopped on shutdown.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>>                  grpc_services;
  std::vector<std::shared_ptr<compression::CompressionWorker>> background_workers;
};

/*
  Composition root. The only place that knows concrete repository and
  model client types.
*/
Application Build(const prdchat::runtime::config::RuntimeConfig& config);

} // namespace prdchat::factory
