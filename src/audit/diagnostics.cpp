#include "et/audit/diagnostics.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace et::audit {
namespace {

const std::string& OrDash(const std::optional<std::string>& value) {
  static const std::string kDash{"-"};
  return value ? *value : kDash;
}

} // namespace

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

std::string RenderRecord(const EventRecord& record) {
  std::string line = FormatTimestamp(record.timestamp());
  line.push_back(' ');
  line.append(record.name());
  line.push_back(' ');
  line.append(RenderMetadata(record.metadata()));
  line.append(" | role:");
  line.append(OrDash(record.role()));
  line.append(" staffID:");
  line.append(OrDash(record.staff_id()));
  line.append(" context:");
  line.append(OrDash(record.context()));
  line.append(" escalate:");
  line.append(record.escalate() ? "YES" : "NO");
  return line;
}

std::string RenderRecords(const std::vector<EventRecord>& records) {
  std::string out;
  for (const auto& record : records) {
    out.append(RenderRecord(record));
    out.push_back('\n');
  }
  return out;
}

} // namespace et::audit
