#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/compression/compression_task.hpp"

namespace prdchat::compression {

/*
  Thread-safe blocking queue for compression workers.
*/
class CompressionScheduler {
 public:
  // False once shut down; the task is not queued.
  bool Enqueue(CompressionTask task);

  // Blocks; nullopt after shutdown once the queue is drained.
  std::optional<CompressionTask> Dequeue();

  void Shutdown();

 private:
  std::mutex                  mutex_;
  std::condition_variable     cv_;
  std::queue<CompressionTask> queue_;
  bool                        shutdown_ = false;
};

} // namespace prdchat::compression
