#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "et/audit/event_record.h"

namespace et::audit {

  // ISO-8601 UTC with microseconds, e.g. 2026-10-18T09:15:02.000123Z.
  std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

  // <timestamp> <name> <metadata> | role:<r> staffID:<s> context:<c> escalate:<YES|NO>
  // Absent optional fields render as "-". // TSK209
  std::string RenderRecord(const EventRecord& record);

  // One RenderRecord() line per record, oldest first, each ending in '\n'.
  std::string RenderRecords(const std::vector<EventRecord>& records);

} // namespace et::audit
