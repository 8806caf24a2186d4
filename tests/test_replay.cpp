#include "et/audit/audit_context.h"
#include "et/audit/metadata.h"
#include "et/cli/replay.h"
#include "et/config/recorder_config.h"
#include "et/error.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>

namespace {

  using et::audit::MetadataValue;
  using et::cli::ParseScalar;
  using et::cli::ReplayOptions;
  using et::cli::ReplaySession;

  class TempDir {
  public:
    TempDir() {
      auto base = std::filesystem::temp_directory_path();
      auto name = std::string{"et_replay_"} +
                  std::to_string(static_cast<unsigned long long>(
                      std::chrono::steady_clock::now().time_since_epoch().count()));
      path_ = base / name;
      std::filesystem::create_directories(path_);
    }

    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_{};
  };

  constexpr const char* kScript =
      "# shift start\n"
      "NotificationEngine app_opened\n"
      "\n"
      "login admin staff-1\n"
      "CloudKitSyncEngine sync_error error=Critical\n"
      "NotificationEngine reminder_sent count=42 ratio=0.5 urgent=true note=text\n"
      "logout\n"
      "CloudKitSyncEngine sync_done\n";

  bool Contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
  }

  void TestScalarTyping() { // TSK215
    assert(ParseScalar("42") == MetadataValue(std::int64_t{42}));
    assert(ParseScalar("-7") == MetadataValue(std::int64_t{-7}));
    assert(ParseScalar("0.5") == MetadataValue(0.5));
    assert(ParseScalar("1e3") == MetadataValue(1000.0));
    assert(ParseScalar("true") == MetadataValue(true));
    assert(ParseScalar("false") == MetadataValue(false));
    assert(ParseScalar("text") == MetadataValue("text"));
    assert(ParseScalar("12abc") == MetadataValue("12abc") && "partial numbers stay strings");
    assert(ParseScalar("True") == MetadataValue("True") && "booleans are lower-case only");
  }

  void TestScriptReport() {
    ReplayOptions options;
    options.inline_delivery = true;
    std::ostringstream sink_out;
    ReplaySession session(options, sink_out, std::make_shared<et::audit::AuditContext>());
    std::istringstream script(kScript);
    session.ApplyScript(script, "inline-script");
    assert(session.recorder_count() == 2);

    std::ostringstream report;
    session.PrintReport(report);
    const std::string text = report.str();

    const auto notification = text.find("== NotificationEngine");
    const auto cloudkit = text.find("== CloudKitSyncEngine");
    assert(notification != std::string::npos && cloudkit != std::string::npos);
    assert(notification < cloudkit && "components print in first-use order");

    assert(Contains(text, " app_opened none | role:- staffID:- context:NotificationEngine escalate:NO"));
    assert(Contains(text, " sync_error error: Critical | role:admin staffID:staff-1 "
                          "context:CloudKitSyncEngine escalate:YES"));
    assert(Contains(text, " reminder_sent count: 42, ratio: 0.5, urgent: true, note: text | role:admin "
                          "staffID:staff-1 context:NotificationEngine escalate:NO"));
    assert(Contains(text, " sync_done none | role:- staffID:- context:CloudKitSyncEngine escalate:NO") &&
           "logout clears the session for later records");
    assert(Contains(text, "  recorded_events: 2\n"));
    assert(Contains(text, "  delivery_mode: inline\n"));
    assert(Contains(text, "  delivery_verbose: false\n"));
    assert(sink_out.str().empty() && "no sink output without --verbose or --json");
  }

  void TestSinkOutput() {
    ReplayOptions options;
    options.inline_delivery = true;
    options.verbose = true;
    options.json = true;
    options.hash_staff = true;
    std::ostringstream sink_out;
    ReplaySession session(options, sink_out, std::make_shared<et::audit::AuditContext>());
    std::istringstream script(kScript);
    session.ApplyScript(script, "inline-script");

    const std::string text = sink_out.str();
    assert(std::count(text.begin(), text.end(), '\n') == 8 && "one console and one JSON line per record");
    assert(!Contains(text, "\"staff_id\":\"staff-1\"") && "JSON staff ids are hashed");
    assert(Contains(text, "\"staff_id\":\"hash:"));

    std::ostringstream report;
    session.PrintReport(report);
    assert(Contains(report.str(), "  delivery_verbose: true\n"));
  }

  void TestCapacityOverride() {
    ReplayOptions options;
    options.inline_delivery = true;
    options.capacity = 1;
    std::ostringstream sink_out;
    ReplaySession session(options, sink_out, std::make_shared<et::audit::AuditContext>());
    std::istringstream script(kScript);
    session.ApplyScript(script, "inline-script");
    std::ostringstream report;
    session.PrintReport(report);
    const std::string text = report.str();
    assert(!Contains(text, " app_opened ") && "capacity 1 keeps only the newest record");
    assert(Contains(text, " reminder_sent "));
    assert(Contains(text, "  capacity: 1\n"));
  }

  void ExpectMalformed(std::string_view line) {
    ReplayOptions options;
    options.inline_delivery = true;
    std::ostringstream sink_out;
    ReplaySession session(options, sink_out, std::make_shared<et::audit::AuditContext>());
    bool threw = false;
    try {
      session.Apply(line, 3);
    } catch (const et::Error& err) {
      threw = true;
      assert(err.domain == et::ErrorDomain::Validation);
      assert(err.code == et::errors::validation::kMalformedScriptLine);
      assert(Contains(err.what(), " 3: ") && "message names the line");
      assert(et::cli::ExitCodeFor(err) == et::cli::kExitUsage);
    }
    if (!threw) {
      std::cerr << "expected a malformed-line error for: " << line << std::endl;
      std::abort();
    }
    assert(session.recorder_count() == 0 && "malformed lines record nothing");
  }

  void TestMalformedLines() {
    ExpectMalformed("NotificationEngine reminder_sent key");
    ExpectMalformed("NotificationEngine reminder_sent =value");
    ExpectMalformed("login admin");
    ExpectMalformed("logout now");
    ExpectMalformed("orphan");
  }

  void TestRunReplayFromFile() {
    TempDir dir;
    auto script_path = dir.path() / "shift.et";
    {
      std::ofstream out(script_path);
      out << kScript;
    }
    ReplayOptions options;
    options.inline_delivery = true;
    std::ostringstream report;
    std::ostringstream sink_out;
    et::cli::RunReplay(script_path.string(), options, report, sink_out);
    assert(Contains(report.str(), "== NotificationEngine"));
    assert(Contains(report.str(), "== CloudKitSyncEngine"));
  }

  void TestUnreadableScript() {
    TempDir dir;
    auto missing = dir.path() / "missing.et";
    ReplayOptions options;
    std::ostringstream report;
    std::ostringstream sink_out;
    bool threw = false;
    try {
      et::cli::RunReplay(missing.string(), options, report, sink_out);
    } catch (const et::Error& err) {
      threw = true;
      assert(err.domain == et::ErrorDomain::IO);
      assert(err.code == et::errors::io::kScriptUnreadable);
      assert(et::cli::ExitCodeFor(err) == et::cli::kExitIO);
    }
    assert(threw && "missing scripts must be reported");
    assert(report.str().empty());
  }

  void TestExitCodes() {
    et::Error config{et::ErrorDomain::Config, et::errors::config::kInvalidCapacity, "bad"};
    et::Error delivery{et::ErrorDomain::Delivery, et::errors::delivery::kSubscriberFailed, "bad"};
    assert(et::cli::ExitCodeFor(config) == 64);
    assert(et::cli::ExitCodeFor(delivery) == 74);
  }

} // namespace

int main() {
  ::unsetenv(et::config::kCapacityEnv);
  ::unsetenv(et::config::kDeliveryModeEnv);
  ::unsetenv(et::config::kQueueDepthEnv);
  TestScalarTyping();
  TestScriptReport();
  TestSinkOutput();
  TestCapacityOverride();
  TestMalformedLines();
  TestRunReplayFromFile();
  TestUnreadableScript();
  TestExitCodes();
  std::cout << "replay test ok\n";
  return 0;
}
