#pragma once

#include <cstddef>
#include <memory>

namespace prdchat::db {
class Repository;
}
namespace prdchat::pipeline {
class ChatPipeline;
class RunJournal;
class RunRegistry;
} // namespace prdchat::pipeline
namespace prdchat::broadcast {
class GroupBroadcastHub;
}
namespace prdchat::compression {
class CheckpointStore;
}
namespace prdchat::cache {
class DocumentStore;
}

namespace prdchat::service {

inline constexpr std::size_t kDefaultListLimit = 50;
inline constexpr std::size_t kMaxListLimit     = 200;

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<pipeline::ChatPipeline>       pipeline;
  std::shared_ptr<pipeline::RunRegistry>        runs;
  std::shared_ptr<pipeline::RunJournal>         journal;
  std::shared_ptr<broadcast::GroupBroadcastHub> hub;
  std::shared_ptr<compression::CheckpointStore> checkpoints;
  std::shared_ptr<cache::DocumentStore>         documents;
};

} // namespace prdchat::service
