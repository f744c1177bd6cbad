#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "internal/compression/checkpoint_store.hpp"
#include "internal/compression/compression_scheduler.hpp"
#include "internal/compression/context_summarizer.hpp"

namespace prdchat::compression {

/*
  Background worker that performs summarization.

  Executes:
      summarize to_compress -> store checkpoint -> fulfil promise

  The checkpoint is stored even when the requesting turn stopped
  waiting, so the next turn benefits from it.
*/
class CompressionWorker {
 public:
  CompressionWorker(std::shared_ptr<CompressionScheduler> scheduler, std::shared_ptr<ContextSummarizer> summarizer,
                    std::shared_ptr<CheckpointStore> store);
  ~CompressionWorker();

  void Start();
  void Stop();

 private:
  void Run();
  void Execute(CompressionTask& task);

  std::shared_ptr<CompressionScheduler> scheduler_;
  std::shared_ptr<ContextSummarizer>    summarizer_;
  std::shared_ptr<CheckpointStore>      store_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace prdchat::compression
