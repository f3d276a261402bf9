#include "event_log.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/util/time.hpp"

namespace flotilla::events {

// ---------------------------------------------------------------------
// EventNotifier
// ---------------------------------------------------------------------

uint64_t EventNotifier::Generation() {
  std::lock_guard lock(mutex_);
  return generation_;
}

void EventNotifier::Notify() {
  {
    std::lock_guard lock(mutex_);
    ++generation_;
  }
  cv_.notify_all();
}

void EventNotifier::WaitFor(uint64_t seen, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return shutdown_ || generation_ != seen; });
}

void EventNotifier::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool EventNotifier::IsShutdown() {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

// ---------------------------------------------------------------------
// Subscription
// ---------------------------------------------------------------------

Subscription::Subscription(std::shared_ptr<db::Repository> repository, std::shared_ptr<EventNotifier> notifier, SubscriptionOptions options)
    : repository_(std::move(repository)), notifier_(std::move(notifier)), options_(std::move(options)), cursor_(options_.after_id) {
}

std::vector<flotilla::v1::Event> Subscription::Poll() {
  auto tx      = repository_->Begin();
  auto records = repository_->ReadEvents(*tx, cursor_, options_.key, options_.batch_size);
  tx->Commit();

  std::vector<flotilla::v1::Event> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    cursor_ = std::max(cursor_, record.id);
    out.push_back(EventLog::ToProto(record));
  }
  return out;
}

std::optional<std::vector<flotilla::v1::Event>> Subscription::Next(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  for (;;) {
    if (cancelled_ || notifier_->IsShutdown()) return std::nullopt;

    // read the generation first so a commit racing with Poll() still wakes us
    const auto seen   = notifier_->Generation();
    auto       events = Poll();
    if (!events.empty()) return events;

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return events;

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    notifier_->WaitFor(seen, std::min(remaining, kPollInterval));
  }
}

void Subscription::Cancel() {
  cancelled_ = true;
}

// ---------------------------------------------------------------------
// EventLog
// ---------------------------------------------------------------------

EventLog::EventLog(std::shared_ptr<db::Repository> repository, uint64_t retention_max_entries)
    : repository_(std::move(repository)), notifier_(std::make_shared<EventNotifier>()), retention_max_entries_(retention_max_entries) {
}

uint64_t EventLog::Append(db::Transaction& tx, std::string_view kind, std::optional<std::string> key, const google::protobuf::Message& payload) {
  db::model::EventRecord record;
  record.timestamp_ms = util::NowMillis();
  record.key          = std::move(key);
  record.kind         = std::string(kind);

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  const auto status = google::protobuf::util::MessageToJsonString(payload, &record.payload_json, options);
  if (!status.ok()) {
    throw std::runtime_error("event payload serialization failed: " + std::string(status.message()));
  }

  db::ThrowIfError(repository_->AppendEvent(tx, record), "append event");
  if (retention_max_entries_ > 0) {
    db::ThrowIfError(repository_->TrimEventsToMaxCount(tx, retention_max_entries_), "trim events");
  }
  return record.id;
}

void EventLog::NotifyCommitted() {
  notifier_->Notify();
}

std::unique_ptr<Subscription> EventLog::Subscribe(SubscriptionOptions options) {
  return std::make_unique<Subscription>(repository_, notifier_, std::move(options));
}

uint64_t EventLog::LatestId() {
  auto tx     = repository_->Begin();
  auto latest = repository_->GetMaxEventId(*tx);
  tx->Commit();
  return latest.value_or(0);
}

std::vector<flotilla::v1::Event> EventLog::Read(uint64_t after_id, const std::optional<std::string>& key, std::optional<uint64_t> max_entries) {
  auto tx      = repository_->Begin();
  auto records = repository_->ReadEvents(*tx, after_id, key, max_entries);
  tx->Commit();

  std::vector<flotilla::v1::Event> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToProto(record));
  }
  return out;
}

void EventLog::Shutdown() {
  notifier_->Shutdown();
}

flotilla::v1::Event EventLog::ToProto(const db::model::EventRecord& record) {
  flotilla::v1::Event event;
  event.set_id(record.id);
  *event.mutable_timestamp() = util::MillisToProto(record.timestamp_ms);
  if (record.key) {
    event.set_key(*record.key);
  }
  event.set_kind(record.kind);
  event.set_payload_json(record.payload_json);
  return event;
}

} // namespace flotilla::events
