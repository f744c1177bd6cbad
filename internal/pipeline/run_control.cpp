#include "internal/pipeline/run_control.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace prdchat::pipeline {

void RunControl::Cancel() {
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard lock(mutex_);
    if (cancelled_.exchange(true)) return;
    callbacks.swap(callbacks_);
  }
  for (auto& callback : callbacks) {
    callback();
  }
}

void RunControl::OnCancel(std::function<void()> callback) {
  {
    std::lock_guard lock(mutex_);
    if (!cancelled_.load()) {
      callbacks_.push_back(std::move(callback));
      return;
    }
  }
  callback();
}

std::shared_ptr<RunControl> RunRegistry::Register(const std::string& run_id) {
  std::lock_guard lock(mutex_);
  auto [it, inserted] = runs_.try_emplace(run_id);
  if (!inserted) {
    throw util::AlreadyExists("run already active: " + run_id);
  }
  it->second = std::make_shared<RunControl>(run_id);
  return it->second;
}

void RunRegistry::Unregister(const std::string& run_id) {
  std::lock_guard lock(mutex_);
  runs_.erase(run_id);
}

bool RunRegistry::Cancel(const std::string& run_id) {
  std::shared_ptr<RunControl> control;
  {
    std::lock_guard lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) return false;
    control = it->second;
  }

  PRDCHAT_LOG_INFO("Cancelling run", {observability::StringField("run_id", run_id)});
  control->Cancel();
  return true;
}

std::size_t RunRegistry::ActiveCount() const {
  std::lock_guard lock(mutex_);
  return runs_.size();
}

} // namespace prdchat::pipeline
