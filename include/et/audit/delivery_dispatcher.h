#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "et/audit/delivery.h"
#include "et/audit/event_record.h"

namespace et::audit {

  // Single worker thread that hands queued records to a sink one at a time,
  // in enqueue order. The queue is bounded; overflow drops the delivery (not
  // the record, which the recorder has already buffered). // TSK212
  class DeliveryDispatcher {
  public:
    struct Stats {
      std::uint64_t delivered{0};
      std::uint64_t failed{0};
      std::uint64_t dropped{0};
      std::uint64_t abandoned{0};
    };

    DeliveryDispatcher(std::shared_ptr<AnalyticsDelivery> sink, std::string component,
                       std::size_t max_pending);
    ~DeliveryDispatcher();

    DeliveryDispatcher(const DeliveryDispatcher&) = delete;
    DeliveryDispatcher& operator=(const DeliveryDispatcher&) = delete;

    // Non-blocking. Returns false when the queue is full or shutting down.
    bool Enqueue(EventRecord record);

    // Blocks until everything enqueued so far has been handed to the sink.
    void Flush();

    Stats stats() const;

  private:
    void DispatchLoop();

    std::shared_ptr<AnalyticsDelivery> sink_;
    std::string component_;
    std::size_t max_pending_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<EventRecord> pending_;
    bool in_flight_{false};
    std::atomic<bool> stop_{false};
    std::uint64_t dropped_streak_{0};
    Stats stats_{};
    std::thread worker_;

    static constexpr std::size_t kMaxBatchSize = 32;
  };

} // namespace et::audit
