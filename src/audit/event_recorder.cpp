#include "et/audit/event_recorder.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

#include "et/audit/escalation.h"
#include "et/error.h"
#include "et/errors.h"
#include "audit/json_escape.h"

namespace et::audit {
namespace {

std::size_t CheckedCapacity(const et::config::RecorderConfig& config) {
  et::config::ValidateRecorderConfig(config);
  return config.capacity;
}

void LogIdFallback(std::string_view component, std::string_view detail) {
  std::clog << "{\"event\":\"event_id_fallback\",\"component\":\"" << EscapeJson(component)
            << "\",\"detail\":\"" << EscapeJson(detail) << "\"}" << std::endl;
}

// Used when the random source is unavailable; unique within one recorder.
std::string FallbackEventId(std::string_view component, std::uint64_t sequence) {
  std::string id{"seq-"};
  id.append(component.empty() ? std::string_view{"recorder"} : component);
  id.push_back('-');
  id.append(std::to_string(sequence));
  return id;
}

} // namespace

EventRecorder::EventRecorder(et::config::RecorderConfig config, std::shared_ptr<AnalyticsDelivery> delivery,
                             std::shared_ptr<AuditContext> context)
    : config_(std::move(config)),
      delivery_(std::move(delivery)),
      context_(std::move(context)),
      buffer_(CheckedCapacity(config_)) {
  if (!delivery_) {
    throw Error{ErrorDomain::Validation, errors::validation::kMissingDelivery,
                std::string(errors::msg::kDeliveryMissing)};
  }
  if (!context_) {
    context_ = SharedAuditContext();
  }
  if (config_.delivery_mode == et::config::DeliveryMode::kBackground) {
    dispatcher_ = std::make_unique<DeliveryDispatcher>(delivery_, config_.component_name,
                                                       config_.max_pending_deliveries);
  }
}

EventRecorder::~EventRecorder() = default;

void EventRecorder::Record(std::string_view name, std::optional<Metadata> metadata) {
  const bool escalate = ClassifyEscalation(name, metadata);
  AuditSnapshot audit = context_->Snapshot();
  std::optional<std::string> context_name;
  if (!audit.component_name.empty()) {
    context_name = std::move(audit.component_name);
  } else if (!config_.component_name.empty()) {
    context_name = config_.component_name;
  }
  std::string id;
  try { // TSK214 a failed id source falls back instead of dropping the record
    id = config_.id_generator ? config_.id_generator() : GenerateEventId();
  } catch (const std::exception& err) {
    LogIdFallback(config_.component_name, err.what());
  }

  std::optional<EventRecord> inline_copy;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto now = EventRecord::Clock::now();
    if (now < last_timestamp_) {
      now = last_timestamp_; // wall clock stepped back
    }
    last_timestamp_ = now;

    const std::uint64_t sequence = next_sequence_++;
    if (id.empty()) {
      id = FallbackEventId(config_.component_name, sequence);
    }
    EventRecord record(std::move(id), sequence, now, std::string(name), std::move(metadata),
                       std::move(audit.role), std::move(audit.staff_id), std::move(context_name),
                       escalate);
    ++recorded_;
    if (escalate) {
      ++escalated_;
    }
    if (dispatcher_) {
      // Enqueued under the buffer lock so delivery order matches buffer order.
      dispatcher_->Enqueue(record);
    } else {
      inline_copy.emplace(record);
    }
    if (buffer_.Push(std::move(record))) {
      ++evicted_;
    }
  }

  if (inline_copy) {
    const bool ok = DeliverBestEffort(*delivery_, *inline_copy, config_.component_name);
    std::lock_guard<std::mutex> guard(mutex_);
    if (ok) {
      ++inline_delivered_;
    } else {
      ++inline_failures_;
    }
  }
}

std::vector<EventRecord> EventRecorder::Snapshot() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return buffer_.Snapshot();
}

std::vector<EventRecord> EventRecorder::EscalatedSnapshot() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return buffer_.SnapshotIf([](const EventRecord& record) { return record.escalate(); });
}

RecorderStats EventRecorder::Stats() const {
  RecorderStats stats;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    stats.buffered = buffer_.size();
    stats.capacity = buffer_.capacity();
    stats.recorded = recorded_;
    stats.evicted = evicted_;
    stats.escalated = escalated_;
    stats.delivered = inline_delivered_;
    stats.delivery_failures = inline_failures_;
  }
  if (dispatcher_) {
    const auto dispatch = dispatcher_->stats();
    stats.delivered += dispatch.delivered;
    stats.delivery_failures += dispatch.failed;
    stats.delivery_dropped = dispatch.dropped + dispatch.abandoned;
  }
  return stats;
}

std::map<std::string, std::string> EventRecorder::Diagnostics() const {
  const RecorderStats stats = Stats();
  return {
      {"component", config_.component_name.empty() ? std::string{"-"} : config_.component_name},
      {"capacity", std::to_string(stats.capacity)},
      {"buffered_events", std::to_string(stats.buffered)},
      {"recorded_events", std::to_string(stats.recorded)},
      {"escalated_events", std::to_string(stats.escalated)},
      {"delivered_events", std::to_string(stats.delivered)},
      {"delivery_failures", std::to_string(stats.delivery_failures)},
      {"delivery_dropped", std::to_string(stats.delivery_dropped)},
      {"delivery_mode", et::config::DeliveryModeToString(config_.delivery_mode)},
      {"delivery_verbose", delivery_->verbose() ? "true" : "false"},
  };
}

void EventRecorder::Flush() {
  if (dispatcher_) {
    dispatcher_->Flush();
  }
}

void EventRecorder::Clear() {
  std::lock_guard<std::mutex> guard(mutex_);
  buffer_.Clear();
}

} // namespace et::audit
