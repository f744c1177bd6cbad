#include "internal/broadcast/group_broadcast_hub.hpp"

#include <algorithm>

#include "internal/db/api/tx_runner.hpp"
#include "internal/model/proto_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace prdchat::broadcast {

namespace {

GroupEvent MessageEvent(prdchat::v1::GroupEventType type, const db::model::MessageRecord& message) {
  GroupEvent event;
  event.set_type(type);
  event.set_group_id(message.group_id);
  event.set_message_id(message.id);
  *event.mutable_message() = model::ToProto(message);
  return event;
}

} // namespace

// ---------------------------------------------------------------------
// Subscription
// ---------------------------------------------------------------------

Subscription::Subscription(std::string group_id, std::size_t capacity) : group_id_(std::move(group_id)), capacity_(capacity == 0 ? 1 : capacity) {
}

std::optional<GroupEvent> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return closed_ || !replay_.empty() || !live_.empty(); });

  auto& source = !replay_.empty() ? replay_ : live_;
  if (source.empty()) return std::nullopt;

  GroupEvent event = std::move(source.front());
  source.pop_front();
  return event;
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

bool Subscription::TryPush(const GroupEvent& event) {
  {
    std::lock_guard lock(mutex_);
    if (closed_ || live_.size() >= capacity_) return false;
    live_.push_back(event);
  }
  cv_.notify_one();
  return true;
}

void Subscription::PushReplay(std::vector<GroupEvent> events) {
  {
    std::lock_guard lock(mutex_);
    for (auto& event : events) {
      replay_.push_back(std::move(event));
    }
  }
  cv_.notify_one();
}

// ---------------------------------------------------------------------
// Hub
// ---------------------------------------------------------------------

GroupBroadcastHub::GroupBroadcastHub(std::size_t queue_capacity, std::shared_ptr<db::Repository> repository)
    : queue_capacity_(queue_capacity), repository_(std::move(repository)) {
}

std::shared_ptr<Subscription> GroupBroadcastHub::Subscribe(const std::string& group_id, std::optional<std::int64_t> after_seq) {
  if (group_id.empty()) {
    throw util::InvalidArgument("subscribe requires a group id");
  }
  if (after_seq && !repository_) {
    throw util::InvalidStage("replay requested but no repository is attached");
  }

  auto subscription = std::make_shared<Subscription>(group_id, queue_capacity_);

  // Register before reading history so nothing published in between is lost.
  {
    std::lock_guard lock(mutex_);
    subscribers_[group_id].push_back(subscription);
  }

  if (after_seq) {
    auto history = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      return repository_->ListGroupMessagesAfter(tx, group_id, *after_seq, std::nullopt);
    });

    std::vector<GroupEvent> replay;
    replay.reserve(history.size());
    for (const auto& message : history) {
      replay.push_back(MessageEvent(prdchat::v1::GROUP_EVENT_TYPE_MESSAGE, message));
    }
    subscription->PushReplay(std::move(replay));
  }

  PRDCHAT_LOG_DEBUG("Group subscriber added", {observability::StringField("group_id", group_id)});
  return subscription;
}

void GroupBroadcastHub::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  if (!subscription) return;
  subscription->Close();

  std::lock_guard lock(mutex_);
  auto            it = subscribers_.find(subscription->GroupId());
  if (it == subscribers_.end()) return;

  auto& list = it->second;
  list.erase(std::remove(list.begin(), list.end(), subscription), list.end());
  if (list.empty()) subscribers_.erase(it);
}

void GroupBroadcastHub::Publish(const db::model::MessageRecord& message) {
  Fanout(MessageEvent(prdchat::v1::GROUP_EVENT_TYPE_MESSAGE, message));
}

void GroupBroadcastHub::PublishUpdated(const db::model::MessageRecord& message) {
  Fanout(MessageEvent(prdchat::v1::GROUP_EVENT_TYPE_MESSAGE_UPDATED, message));
}

void GroupBroadcastHub::PublishDelta(const std::string& group_id, const std::string& message_id, const std::string& content,
                                     const std::string& block_id, markdown::BlockKind kind, bool is_first) {
  GroupEvent event;
  event.set_type(prdchat::v1::GROUP_EVENT_TYPE_DELTA);
  event.set_group_id(group_id);
  event.set_message_id(message_id);
  event.set_content(content);
  event.set_block_id(block_id);
  event.set_block_kind(model::ToProto(kind));
  event.set_is_first(is_first);
  Fanout(event);
}

void GroupBroadcastHub::PublishBlockEnd(const std::string& group_id, const std::string& message_id, const std::string& block_id,
                                        markdown::BlockKind kind) {
  GroupEvent event;
  event.set_type(prdchat::v1::GROUP_EVENT_TYPE_BLOCK_END);
  event.set_group_id(group_id);
  event.set_message_id(message_id);
  event.set_block_id(block_id);
  event.set_block_kind(model::ToProto(kind));
  Fanout(event);
}

void GroupBroadcastHub::PublishCitations(const std::string& group_id, const std::string& message_id,
                                         const std::vector<citation::Citation>& citations) {
  GroupEvent event;
  event.set_type(prdchat::v1::GROUP_EVENT_TYPE_CITATIONS);
  event.set_group_id(group_id);
  event.set_message_id(message_id);
  model::AppendCitations(citations, event.mutable_citations());
  Fanout(event);
}

std::size_t GroupBroadcastHub::SubscriberCount(const std::string& group_id) const {
  std::lock_guard lock(mutex_);
  auto            it = subscribers_.find(group_id);
  return it == subscribers_.end() ? 0 : it->second.size();
}

std::size_t GroupBroadcastHub::GroupCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

void GroupBroadcastHub::Fanout(const GroupEvent& event) {
  if (event.group_id().empty()) return;

  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard lock(mutex_);
    auto            it = subscribers_.find(event.group_id());
    if (it == subscribers_.end()) return;

    auto& list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(), [](const auto& s) { return s->Closed(); }), list.end());
    if (list.empty()) {
      subscribers_.erase(it);
      return;
    }
    targets = list;
  }

  for (const auto& subscription : targets) {
    if (subscription->TryPush(event)) continue;
    if (subscription->Closed()) continue;

    const auto dropped = ++subscription->dropped_;
    observability::Metrics::Instance().RecordBroadcastDrop();
    if (dropped == 1 || dropped % 100 == 0) {
      PRDCHAT_LOG_WARN("Group subscriber queue full, event dropped",
                       {observability::StringField("group_id", event.group_id()), observability::StringField("message_id", event.message_id()),
                        observability::IntField("dropped_total", static_cast<std::int64_t>(dropped))});
    }
  }
}

} // namespace prdchat::broadcast
