#include "et/audit/audit_context.h"
#include "et/audit/delivery.h"
#include "et/audit/event_recorder.h"
#include "et/config/recorder_config.h"

#include <atomic>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

class CountingDelivery : public et::audit::AnalyticsDelivery {
public:
  void Deliver(const et::audit::EventRecord&) override { count_.fetch_add(1, std::memory_order_relaxed); }
  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }

private:
  std::atomic<std::uint64_t> count_{0};
};

void RunConcurrentRecord(et::config::DeliveryMode mode) { // TSK213
  constexpr int kThreads = 8;
  constexpr int kPerThread = 250;
  constexpr std::size_t kCapacity = 50;

  et::config::RecorderConfig config;
  config.capacity = kCapacity;
  config.component_name = "CloudKitSyncEngine";
  config.delivery_mode = mode;
  config.max_pending_deliveries = kThreads * kPerThread;

  auto sink = std::make_shared<CountingDelivery>();
  auto context = std::make_shared<et::audit::AuditContext>();
  et::audit::EventRecorder recorder(config, sink, context);

  std::atomic<bool> readers_done{false};
  std::thread reader([&]() {
    while (!readers_done.load()) {
      auto snapshot = recorder.Snapshot();
      assert(snapshot.size() <= kCapacity && "buffer never exceeds capacity");
      for (std::size_t i = 1; i < snapshot.size(); ++i) {
        assert(snapshot[i].sequence() > snapshot[i - 1].sequence() && "snapshot is oldest-first");
      }
    }
  });
  std::thread session([&]() {
    for (int i = 0; i < 200; ++i) {
      context->BeginSession("admin", "staff-" + std::to_string(i));
      context->EndSession();
    }
  });

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&recorder, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        recorder.Record("worker_" + std::to_string(t) + "_" + std::to_string(i));
      }
    });
  }
  for (auto& w : writers) {
    w.join();
  }
  session.join();
  readers_done.store(true);
  reader.join();
  recorder.Flush();

  const std::uint64_t total = kThreads * kPerThread;
  auto records = recorder.Snapshot();
  assert(records.size() == kCapacity);
  std::set<std::uint64_t> sequences;
  for (const auto& record : records) {
    sequences.insert(record.sequence());
    // role and staff are set and cleared together
    assert(record.role().has_value() == record.staff_id().has_value());
  }
  assert(sequences.size() == records.size() && "no duplicated records");
  assert(*sequences.begin() == total - kCapacity + 1 && "buffer holds the most recent records");
  assert(*sequences.rbegin() == total);

  auto stats = recorder.Stats();
  assert(stats.recorded == total);
  assert(stats.evicted == total - kCapacity);
  assert(sink->count() == total && "every record is delivered once");
  assert(stats.delivered == total);
}

} // namespace

int main() {
  RunConcurrentRecord(et::config::DeliveryMode::kInline);
  RunConcurrentRecord(et::config::DeliveryMode::kBackground);
  std::cout << "concurrent record test ok\n";
  return 0;
}
