#include "et/audit/delivery_dispatcher.h"

#include <iostream>
#include <utility>
#include <vector>

#include "et/error.h"
#include "et/errors.h"
#include "audit/json_escape.h"

namespace et::audit {

DeliveryDispatcher::DeliveryDispatcher(std::shared_ptr<AnalyticsDelivery> sink, std::string component,
                                       std::size_t max_pending)
    : sink_(std::move(sink)), component_(std::move(component)), max_pending_(max_pending) {
  if (!sink_) {
    throw Error{ErrorDomain::Validation, errors::validation::kMissingDelivery,
                std::string(errors::msg::kDeliveryMissing)};
  }
  if (max_pending_ == 0) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidQueueDepth,
                std::string(errors::msg::kQueueDepthZero)};
  }
  worker_ = std::thread([this]() { DispatchLoop(); });
}

DeliveryDispatcher::~DeliveryDispatcher() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    stop_.store(true, std::memory_order_release);
    stats_.abandoned += pending_.size();
    pending_.clear();
  }
  work_cv_.notify_all();
  idle_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  // Counted after join so records cut off mid-batch are included.
  const std::uint64_t abandoned = stats_.abandoned;
  if (abandoned > 0) {
    std::clog << "{\"event\":\"delivery_abandoned\",\"component\":\"" << EscapeJson(component_)
              << "\",\"count\":" << abandoned << "}" << std::endl;
  }
}

bool DeliveryDispatcher::Enqueue(EventRecord record) {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (stop_.load(std::memory_order_acquire)) {
      return false;
    }
    if (pending_.size() >= max_pending_) {
      ++stats_.dropped;
      ++dropped_streak_;
      if (dropped_streak_ == 1) {
        std::clog << "{\"event\":\"delivery_backpressure\",\"state\":\"drop\",\"component\":\""
                  << EscapeJson(component_) << "\",\"count\":" << dropped_streak_ << "}" << std::endl;
      }
      return false;
    }
    if (dropped_streak_ > 0) {
      std::clog << "{\"event\":\"delivery_backpressure\",\"state\":\"recover\",\"component\":\""
                << EscapeJson(component_) << "\",\"count\":" << dropped_streak_ << "}" << std::endl;
      dropped_streak_ = 0;
    }
    pending_.push_back(std::move(record));
  }
  work_cv_.notify_one();
  return true;
}

void DeliveryDispatcher::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() {
    return stop_.load(std::memory_order_acquire) || (pending_.empty() && !in_flight_);
  });
}

DeliveryDispatcher::Stats DeliveryDispatcher::stats() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return stats_;
}

void DeliveryDispatcher::DispatchLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    work_cv_.wait(lock, [this]() { return stop_.load(std::memory_order_acquire) || !pending_.empty(); });
    if (stop_.load(std::memory_order_acquire)) {
      break;
    }

    std::vector<EventRecord> batch;
    batch.reserve(kMaxBatchSize);
    while (!pending_.empty() && batch.size() < kMaxBatchSize) {
      batch.push_back(std::move(pending_.front()));
      pending_.pop_front();
    }
    in_flight_ = true;

    lock.unlock();
    std::uint64_t delivered = 0;
    std::uint64_t failed = 0;
    std::size_t handled = 0;
    for (const auto& record : batch) {
      if (stop_.load(std::memory_order_acquire)) {
        break;
      }
      if (DeliverBestEffort(*sink_, record, component_)) {
        ++delivered;
      } else {
        ++failed;
      }
      ++handled;
    }
    lock.lock();

    stats_.delivered += delivered;
    stats_.failed += failed;
    stats_.abandoned += batch.size() - handled;
    in_flight_ = false;
    if (pending_.empty()) {
      idle_cv_.notify_all();
    }
  }
  in_flight_ = false;
  idle_cv_.notify_all();
}

} // namespace et::audit
