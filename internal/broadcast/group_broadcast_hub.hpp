#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/citation/citation_extractor.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/markdown/block_tokenizer.hpp"
#include "prdchat/v1/chat.pb.h"

namespace prdchat::broadcast {

using GroupEvent = prdchat::v1::GroupStreamEvent;

/*
  One subscriber's view of a group.

  Live events land in a bounded queue; replayed history, when asked
  for, is delivered before any of them. Close() wakes a blocked Next().
*/
class Subscription {
 public:
  Subscription(std::string group_id, std::size_t capacity);

  // nullopt on timeout or once closed and drained.
  std::optional<GroupEvent> Next(std::chrono::milliseconds timeout);

  void Close();
  bool Closed() const;

  const std::string& GroupId() const {
    return group_id_;
  }

  std::uint64_t Dropped() const {
    return dropped_.load();
  }

 private:
  friend class GroupBroadcastHub;

  // False when the queue is full or the subscription is closed.
  bool TryPush(const GroupEvent& event);
  void PushReplay(std::vector<GroupEvent> events);

  const std::string group_id_;
  const std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<GroupEvent>  replay_;
  std::deque<GroupEvent>  live_;
  bool                    closed_ = false;

  std::atomic<std::uint64_t> dropped_{0};
};

/*
  In-process fan-out of group events.

  Publishing never blocks the caller: a subscriber whose queue is full
  misses the event, and the drop is counted and logged. Subscribers are
  expected to resync from ListMessages when they fall behind.
*/
class GroupBroadcastHub {
 public:
  explicit GroupBroadcastHub(std::size_t queue_capacity, std::shared_ptr<db::Repository> repository = nullptr);

  // With after_seq, persisted messages with group_seq > after_seq are
  // replayed first. Requires a repository.
  std::shared_ptr<Subscription> Subscribe(const std::string& group_id, std::optional<std::int64_t> after_seq = std::nullopt);
  void                          Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  void Publish(const db::model::MessageRecord& message);
  void PublishUpdated(const db::model::MessageRecord& message);
  void PublishDelta(const std::string& group_id, const std::string& message_id, const std::string& content, const std::string& block_id,
                    markdown::BlockKind kind, bool is_first);
  void PublishBlockEnd(const std::string& group_id, const std::string& message_id, const std::string& block_id, markdown::BlockKind kind);
  void PublishCitations(const std::string& group_id, const std::string& message_id, const std::vector<citation::Citation>& citations);

  std::size_t SubscriberCount(const std::string& group_id) const;

  // Groups with at least one registered subscriber.
  std::size_t GroupCount() const;

 private:
  void Fanout(const GroupEvent& event);

  const std::size_t               queue_capacity_;
  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex                                                          mutex_;
  std::unordered_map<std::string, std::vector<std::shared_ptr<Subscription>>> subscribers_;
};

} // namespace prdchat::broadcast
