#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace prdchat::pipeline {

/*
  Cancellation handle for one run.

  Callbacks registered before Cancel() fire once on the cancelling
  thread; callbacks registered after fire immediately.
*/
class RunControl {
 public:
  explicit RunControl(std::string run_id) : run_id_(std::move(run_id)) {
  }

  const std::string& RunId() const {
    return run_id_;
  }

  void Cancel();

  bool IsCancelled() const {
    return cancelled_.load();
  }

  void OnCancel(std::function<void()> callback);

 private:
  std::string                        run_id_;
  std::atomic<bool>                  cancelled_{false};
  std::mutex                         mutex_;
  std::vector<std::function<void()>> callbacks_;
};

// Live runs by id, so CancelRun can reach a turn served on another stream.
class RunRegistry {
 public:
  // Fails with util::AlreadyExists when the id is already running.
  std::shared_ptr<RunControl> Register(const std::string& run_id);

  void Unregister(const std::string& run_id);

  // False when no such run is active.
  bool Cancel(const std::string& run_id);

  std::size_t ActiveCount() const;

 private:
  mutable std::mutex                                           mutex_;
  std::unordered_map<std::string, std::shared_ptr<RunControl>> runs_;
};

} // namespace prdchat::pipeline
