#include "et/audit/delivery.h"

#include <atomic>
#include <exception>
#include <iostream>
#include <ostream>
#include <utility>

#include "et/audit/diagnostics.h"
#include "et/crypto/sha256.h"
#include "et/error.h"
#include "et/errors.h"
#include "audit/json_escape.h"

namespace et::audit {
namespace {

void AppendJsonString(std::string& out, std::string_view text) {
  out.push_back('"');
  out.append(EscapeJson(text));
  out.push_back('"');
}

void AppendOptionalString(std::string& out, const std::optional<std::string>& value) {
  if (value) {
    AppendJsonString(out, *value);
  } else {
    out.append("null");
  }
}

std::string HashTag(std::string_view value) {
  if (value.empty()) {
    return std::string{"hash:"};
  }
  return std::string{"hash:"} + et::crypto::SHA256_Hex(value);
}

std::optional<std::string> ApplyPrivacy(const std::optional<std::string>& value, FieldPrivacy privacy) {
  if (!value) {
    return std::nullopt;
  }
  switch (privacy) {
  case FieldPrivacy::kPublic:
    return value;
  case FieldPrivacy::kRedact:
    return std::string{"[redacted]"};
  case FieldPrivacy::kHash:
    return HashTag(*value);
  }
  return value;
}

void AppendMetadata(std::string& out, const std::optional<Metadata>& metadata) {
  if (!metadata) {
    out.append("null");
    return;
  }
  out.push_back('{');
  bool first = true;
  for (const auto& entry : *metadata) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    AppendJsonString(out, entry.key);
    out.push_back(':');
    const std::string rendered = entry.value.ToString();
    if (entry.value.IsJsonLiteral()) {
      out.append(rendered);
    } else {
      AppendJsonString(out, rendered);
    }
  }
  out.push_back('}');
}

std::string BuildOversizeJson(const EventRecord& record, std::size_t limit) { // redacted fallback
  std::string out;
  out.append("{\"ts\":");
  AppendJsonString(out, FormatTimestamp(record.timestamp()));
  out.append(",\"id\":");
  AppendJsonString(out, record.id());
  out.append(",\"seq\":");
  out.append(std::to_string(record.sequence()));
  out.append(",\"event\":\"event_oversize\",\"original_event\":");
  AppendJsonString(out, record.name().substr(0, 128));
  out.append(",\"limit_bytes\":");
  out.append(std::to_string(limit));
  out.append(",\"escalate\":");
  out.append(record.escalate() ? "true" : "false");
  out.push_back('}');
  return out;
}

} // namespace

bool DeliverBestEffort(AnalyticsDelivery& sink, const EventRecord& record,
                       std::string_view component) noexcept {
  try {
    sink.Deliver(record);
    return true;
  } catch (const et::Error& err) {
    std::clog << "{\"event\":\"delivery_failure\",\"component\":\"" << EscapeJson(component)
              << "\",\"id\":\"" << record.id() << "\",\"code\":" << err.code << ",\"detail\":\""
              << EscapeJson(err.what()) << "\"}" << std::endl;
  } catch (const std::exception& err) {
    std::clog << "{\"event\":\"delivery_failure\",\"component\":\"" << EscapeJson(component)
              << "\",\"id\":\"" << record.id() << "\",\"detail\":\"" << EscapeJson(err.what())
              << "\"}" << std::endl;
  } catch (...) { // TSK210 sinks must never unwind into the recorder
    std::clog << "{\"event\":\"delivery_failure\",\"component\":\"" << EscapeJson(component)
              << "\",\"id\":\"" << record.id() << "\",\"detail\":\"unknown exception\"}"
              << std::endl;
  }
  return false;
}

ConsoleDelivery::ConsoleDelivery(bool verbose) : ConsoleDelivery(verbose, std::clog) {}

ConsoleDelivery::ConsoleDelivery(bool verbose, std::ostream& out) : verbose_(verbose), out_(out) {}

void ConsoleDelivery::Deliver(const EventRecord& record) {
  if (!verbose_) {
    return;
  }
  std::string line = RenderRecord(record);
  std::lock_guard<std::mutex> guard(mutex_);
  out_ << line << '\n';
  out_.flush();
}

std::string BuildEventJson(const EventRecord& record, const JsonLineOptions& options) {
  std::string out;
  out.reserve(256);
  out.append("{\"ts\":");
  AppendJsonString(out, FormatTimestamp(record.timestamp()));
  out.append(",\"id\":");
  AppendJsonString(out, record.id());
  out.append(",\"seq\":");
  out.append(std::to_string(record.sequence()));
  out.append(",\"event\":");
  AppendJsonString(out, record.name());
  out.append(",\"metadata\":");
  AppendMetadata(out, record.metadata());
  out.append(",\"role\":");
  AppendOptionalString(out, record.role());
  out.append(",\"staff_id\":");
  AppendOptionalString(out, ApplyPrivacy(record.staff_id(), options.staff_id_privacy));
  out.append(",\"context\":");
  AppendOptionalString(out, record.context());
  out.append(",\"escalate\":");
  out.append(record.escalate() ? "true" : "false");
  out.push_back('}');
  if (out.size() > options.max_line_bytes) {
    return BuildOversizeJson(record, options.max_line_bytes);
  }
  return out;
}

JsonLineDelivery::JsonLineDelivery(std::ostream& out, JsonLineOptions options)
    : out_(out), options_(options) {}

void JsonLineDelivery::Deliver(const EventRecord& record) {
  std::string line = BuildEventJson(record, options_);
  std::lock_guard<std::mutex> guard(mutex_);
  out_ << line << '\n';
  out_.flush();
  if (!out_) {
    out_.clear(); // let the next line try again
    throw Error{ErrorDomain::IO, errors::io::kStreamWriteFailed,
                std::string(errors::msg::kStreamWriteFailed), std::nullopt,
                Retryability::kTransient};
  }
}

FanoutDelivery::FanoutDelivery() {
  auto initial = std::make_shared<const SubscriberList>();
  std::atomic_store_explicit(&subscribers_snapshot_, initial, std::memory_order_release);
}

void FanoutDelivery::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void FanoutDelivery::Attach(std::shared_ptr<AnalyticsDelivery> sink) {
  if (!sink) {
    return;
  }
  if (sink->verbose()) {
    verbose_.store(true, std::memory_order_release);
  }
  Subscribe([sink = std::move(sink)](const EventRecord& record) { sink->Deliver(record); });
}

std::size_t FanoutDelivery::subscriber_count() const {
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  return targets ? targets->size() : 0;
}

void FanoutDelivery::Deliver(const EventRecord& record) {
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  std::size_t failures = 0;
  for (const auto& subscriber : *targets) {
    if (!subscriber) {
      continue;
    }
    try {
      subscriber(record);
    } catch (const std::exception& err) {
      ++failures;
      std::clog << "{\"event\":\"fanout_subscriber_failure\",\"id\":\"" << record.id()
                << "\",\"detail\":\"" << EscapeJson(err.what()) << "\"}" << std::endl;
    }
  }
  if (failures > 0) {
    throw Error{ErrorDomain::Delivery, errors::delivery::kSubscriberFailed,
                std::string(errors::msg::kSubscriberFailed) + " (" + std::to_string(failures) + " of " +
                    std::to_string(targets->size()) + ")"};
  }
}

} // namespace et::audit
