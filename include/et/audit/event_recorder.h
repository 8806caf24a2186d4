#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "et/audit/audit_context.h"
#include "et/audit/bounded_buffer.h"
#include "et/audit/delivery.h"
#include "et/audit/delivery_dispatcher.h"
#include "et/audit/event_record.h"
#include "et/audit/metadata.h"
#include "et/config/recorder_config.h"

namespace et::audit {

  struct RecorderStats {
    std::size_t buffered{0};
    std::size_t capacity{0};
    std::uint64_t recorded{0};
    std::uint64_t evicted{0};
    std::uint64_t escalated{0};
    std::uint64_t delivered{0};
    std::uint64_t delivery_failures{0};
    std::uint64_t delivery_dropped{0};
  };

  // Records events for one engine instance: classifies, stamps the audit
  // context, appends to a bounded buffer and forwards to the delivery sink.
  //
  // Record() and Snapshot() may be called from any thread. Buffer mutation is
  // serialized by one mutex; the sink is never called while it is held. The
  // buffer is authoritative: a record is visible to Snapshot() as soon as
  // Record() returns, whatever the sink does with it. // TSK213
  class EventRecorder {
  public:
    EventRecorder(et::config::RecorderConfig config, std::shared_ptr<AnalyticsDelivery> delivery,
                  std::shared_ptr<AuditContext> context = SharedAuditContext());
    ~EventRecorder();

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    void Record(std::string_view name, std::optional<Metadata> metadata = std::nullopt);

    std::vector<EventRecord> Snapshot() const;
    std::vector<EventRecord> EscalatedSnapshot() const;

    RecorderStats Stats() const;
    std::map<std::string, std::string> Diagnostics() const;

    // Waits for outstanding background deliveries. No-op in inline mode.
    void Flush();

    // Drops buffered records. Counters are not reset.
    void Clear();

    const et::config::RecorderConfig& config() const noexcept { return config_; }

  private:
    et::config::RecorderConfig config_;
    std::shared_ptr<AnalyticsDelivery> delivery_;
    std::shared_ptr<AuditContext> context_;
    std::unique_ptr<DeliveryDispatcher> dispatcher_;

    mutable std::mutex mutex_;
    BoundedBuffer<EventRecord> buffer_;
    std::uint64_t next_sequence_{1};
    EventRecord::Clock::time_point last_timestamp_{};
    std::uint64_t recorded_{0};
    std::uint64_t evicted_{0};
    std::uint64_t escalated_{0};
    std::uint64_t inline_delivered_{0};
    std::uint64_t inline_failures_{0};
  };

} // namespace et::audit
