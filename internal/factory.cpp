#include "factory.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/broadcast/group_broadcast_hub.hpp"
#include "internal/cache/document_store.hpp"
#include "internal/compression/checkpoint_store.hpp"
#include "internal/compression/compression_coordinator.hpp"
#include "internal/compression/compression_scheduler.hpp"
#include "internal/compression/context_summarizer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/chat_server.hpp"
#include "internal/llm/grpc_model_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/chat_pipeline.hpp"
#include "internal/pipeline/run_control.hpp"
#include "internal/pipeline/run_journal.hpp"
#include "internal/sequence/group_sequencer.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/chat_service.hpp"
#include "internal/service/service_context.hpp"

namespace prdchat::factory {

using namespace prdchat;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const prdchat::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    PRDCHAT_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  PRDCHAT_LOG_WARN("Using in-memory repository; history is lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<llm::ModelClient> BuildModelClient(const prdchat::runtime::config::LlmConfig& llm) {
  if (llm.endpoint().empty()) {
    throw std::runtime_error("llm.endpoint is required");
  }
  auto channel = ::grpc::CreateChannel(llm.endpoint(), ::grpc::InsecureChannelCredentials());
  return std::make_shared<llm::GrpcModelClient>(std::move(channel), std::chrono::milliseconds(llm.request_timeout_ms()));
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const prdchat::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto& chat        = config.chat();
  const auto& compression = config.compression();
  const auto& cache       = config.cache();

  // ------------------------------------------------------------------
  // Persistence and caches
  // ------------------------------------------------------------------
  auto repository  = BuildRepository(config);
  auto sequencer   = std::make_shared<sequence::GroupSequencer>(repository);
  auto documents   = std::make_shared<cache::DocumentStore>(repository, std::chrono::seconds(cache.document_ttl_sec()));
  auto checkpoints = std::make_shared<compression::CheckpointStore>(repository, std::chrono::seconds(cache.checkpoint_ttl_sec()));
  auto hub         = std::make_shared<broadcast::GroupBroadcastHub>(chat.broadcast_queue_capacity(), repository);
  auto runs        = std::make_shared<pipeline::RunRegistry>();
  auto journal     = std::make_shared<pipeline::RunJournal>(std::chrono::seconds(cache.run_retention_sec()));

  auto model_client = BuildModelClient(config.llm());

  // ------------------------------------------------------------------
  // Compression workers
  // ------------------------------------------------------------------
  std::shared_ptr<compression::CompressionCoordinator> coordinator;
  if (!compression.disabled()) {
    const auto& summarizer_model = config.llm().summarizer_model().empty() ? config.llm().chat_model() : config.llm().summarizer_model();

    auto scheduler  = std::make_shared<compression::CompressionScheduler>();
    auto summarizer = std::make_shared<compression::ContextSummarizer>(model_client, summarizer_model);

    for (std::uint32_t i = 0; i < compression.worker_threads(); ++i) {
      auto worker = std::make_shared<compression::CompressionWorker>(scheduler, summarizer, checkpoints);
      worker->Start();
      app.background_workers.push_back(std::move(worker));
    }

    compression::CompressionOptions options;
    options.enabled                   = true;
    options.planner.threshold_chars   = compression.threshold_chars();
    options.planner.target_keep_chars = compression.target_keep_chars();
    options.planner.min_keep_count    = compression.min_keep_count();
    options.max_wait                  = std::chrono::milliseconds(compression.max_wait_ms());

    coordinator = std::make_shared<compression::CompressionCoordinator>(repository, checkpoints, scheduler, options);
  }

  // ------------------------------------------------------------------
  // Chat pipeline
  // ------------------------------------------------------------------
  pipeline::PipelineDeps deps;
  deps.repository   = repository;
  deps.sequencer    = sequencer;
  deps.hub          = hub;
  deps.model_client = model_client;
  deps.documents    = documents;
  deps.compression  = coordinator;
  deps.runs         = runs;
  deps.journal      = journal;
  deps.prompts      = pipeline::SystemPrompts(std::map<std::string, std::string>(chat.system_prompts().begin(), chat.system_prompts().end()));

  pipeline::PipelineOptions options;
  options.chat_model           = config.llm().chat_model();
  options.max_output_tokens    = config.llm().max_output_tokens();
  options.temperature          = config.llm().temperature();
  options.max_history_messages = chat.max_history_messages();
  options.max_citations        = static_cast<int>(chat.max_citations());
  options.channel_capacity     = chat.stream_channel_capacity();

  auto chat_pipeline = std::make_shared<pipeline::ChatPipeline>(std::move(deps), options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository  = repository;
  ctx.pipeline    = chat_pipeline;
  ctx.runs        = runs;
  ctx.journal     = journal;
  ctx.hub         = hub;
  ctx.checkpoints = checkpoints;
  ctx.documents   = documents;

  auto chat_service  = std::make_shared<service::ChatService>(ctx);
  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ChatServer>(chat_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace prdchat::factory
