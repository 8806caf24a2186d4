#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "et/audit/audit_context.h"
#include "et/audit/delivery.h"
#include "et/audit/event_recorder.h"
#include "et/audit/metadata.h"
#include "et/error.h"

namespace et::cli {

  inline constexpr int kExitOk = 0;
  inline constexpr int kExitUsage = 64;
  inline constexpr int kExitIO = 74;

  struct ReplayOptions {
    bool verbose{false};
    bool json{false};
    bool inline_delivery{false};
    bool hash_staff{false};
    std::optional<std::size_t> capacity;
  };

  // Integer, then double, then true/false, otherwise the raw string.
  et::audit::MetadataValue ParseScalar(std::string_view text);

  // 64 for Validation/Config errors, 74 for everything else. // TSK215
  int ExitCodeFor(const et::Error& err);

  // Drives one recorder per component from an event script:
  //   login <role> <staff_id>
  //   logout
  //   <component> <event_name> [key=value ...]
  // Blank lines and '#' comments are skipped. Malformed lines throw
  // et::Error (Validation domain) naming the line number.
  class ReplaySession {
  public:
    ReplaySession(const ReplayOptions& options, std::ostream& sink_out,
                  std::shared_ptr<et::audit::AuditContext> context = et::audit::SharedAuditContext());

    ReplaySession(const ReplaySession&) = delete;
    ReplaySession& operator=(const ReplaySession&) = delete;

    void Apply(std::string_view line, std::size_t line_number);
    void ApplyScript(std::istream& in, std::string_view source_name);

    // Flushes every recorder, then prints each component's records and
    // diagnostics in first-use order.
    void PrintReport(std::ostream& out);

    std::size_t recorder_count() const noexcept { return recorders_.size(); }

  private:
    et::audit::EventRecorder& RecorderFor(const std::string& component);

    ReplayOptions options_;
    std::shared_ptr<et::audit::AuditContext> context_;
    std::shared_ptr<et::audit::AnalyticsDelivery> delivery_;
    std::vector<std::pair<std::string, std::unique_ptr<et::audit::EventRecorder>>> recorders_;
  };

  // Replays `source` ("-" reads stdin) and writes the report to `out`.
  // Sink output goes to `sink_out`. Unreadable scripts throw et::Error (IO).
  void RunReplay(std::string_view source, const ReplayOptions& options, std::ostream& out,
                 std::ostream& sink_out);

} // namespace et::cli
