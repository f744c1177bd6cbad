#include "internal/compression/compression_worker.hpp"

#include "internal/observability/logging.hpp"

namespace prdchat::compression {

CompressionWorker::CompressionWorker(std::shared_ptr<CompressionScheduler> scheduler, std::shared_ptr<ContextSummarizer> summarizer,
                                     std::shared_ptr<CheckpointStore> store)
    : scheduler_(std::move(scheduler)), summarizer_(std::move(summarizer)), store_(std::move(store)) {
}

CompressionWorker::~CompressionWorker() {
  Stop();
}

void CompressionWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&CompressionWorker::Run, this);
}

void CompressionWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void CompressionWorker::Run() {
  // Drains queued tasks after shutdown so no waiter is left hanging.
  while (auto task = scheduler_->Dequeue()) {
    Execute(*task);
  }
}

void CompressionWorker::Execute(CompressionTask& task) {
  CheckpointResult result;
  try {
    result = summarizer_->Summarize(task.ctx, task.to_compress, task.previous, task.current_goal);
    if (result && !store_->Put(*result)) {
      result.reset();
    }
  } catch (const std::exception& e) {
    PRDCHAT_LOG_ERROR("Compression failed", {observability::StringField("group_id", task.ctx.group_id), observability::StringField("error", e.what())});
    result.reset();
  }

  if (result) {
    PRDCHAT_LOG_INFO("Compression checkpoint stored",
                     {observability::StringField("group_id", result->group_id), observability::IntField("from_seq", result->from_seq),
                      observability::IntField("to_seq", result->to_seq), observability::IntField("original_chars", result->original_chars),
                      observability::IntField("compressed_chars", result->compressed_chars)});
  }
  if (task.result) task.result->set_value(std::move(result));
  if (task.on_done) task.on_done();
}

} // namespace prdchat::compression
