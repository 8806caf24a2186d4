#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "et/audit/event_record.h"

namespace et::audit {

  // Destination for recorded events. Deliver() may block on I/O and may
  // throw; EventRecorder isolates the buffer from both. // TSK210
  class AnalyticsDelivery {
  public:
    virtual ~AnalyticsDelivery() = default;
    virtual void Deliver(const EventRecord& record) = 0;

    // Test mode: the sink echoes every record somewhere a human can read it.
    virtual bool verbose() const noexcept { return false; }
  };

  // Calls sink.Deliver(record), catching and logging anything it throws.
  // Returns false when the sink failed.
  bool DeliverBestEffort(AnalyticsDelivery& sink, const EventRecord& record,
                         std::string_view component) noexcept;

  // Reference sink. Verbose mode writes RenderRecord() lines to `out`;
  // otherwise it does nothing.
  class ConsoleDelivery : public AnalyticsDelivery {
  public:
    explicit ConsoleDelivery(bool verbose);
    ConsoleDelivery(bool verbose, std::ostream& out);

    void Deliver(const EventRecord& record) override;
    bool verbose() const noexcept override { return verbose_; }

  private:
    bool verbose_;
    std::ostream& out_;
    std::mutex mutex_;
  };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct JsonLineOptions {
    FieldPrivacy staff_id_privacy{FieldPrivacy::kPublic};
    std::size_t max_line_bytes{16 * 1024};
  };

  // One JSON object per line. Write failures raise et::Error (IO domain).
  class JsonLineDelivery : public AnalyticsDelivery {
  public:
    explicit JsonLineDelivery(std::ostream& out, JsonLineOptions options = {});

    void Deliver(const EventRecord& record) override;

  private:
    std::ostream& out_;
    JsonLineOptions options_;
    std::mutex mutex_;
  };

  // Serialized form used by JsonLineDelivery, without the trailing newline.
  std::string BuildEventJson(const EventRecord& record, const JsonLineOptions& options);

  // Delivers to every attached sink and subscriber in attach order. A failing
  // subscriber does not stop the others; after all have run, a single
  // et::Error (Delivery domain) reports that at least one failed.
  class FanoutDelivery : public AnalyticsDelivery {
  public:
    using Subscriber = std::function<void(const EventRecord&)>;

    FanoutDelivery();

    void Subscribe(Subscriber fn);
    void Attach(std::shared_ptr<AnalyticsDelivery> sink);
    std::size_t subscriber_count() const;

    void Deliver(const EventRecord& record) override;

    // True when any attached sink is verbose.
    bool verbose() const noexcept override { return verbose_.load(std::memory_order_acquire); }

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    mutable std::mutex subscribers_mutex_;
    std::atomic<bool> verbose_{false};
  };

} // namespace et::audit
