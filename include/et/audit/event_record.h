#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "et/audit/metadata.h"

namespace et::audit {

  // One recorded occurrence. Built once by EventRecorder and never modified;
  // the audit fields are copies taken at record time.
  class EventRecord {
  public:
    using Clock = std::chrono::system_clock;

    EventRecord(std::string id, std::uint64_t sequence, Clock::time_point timestamp, std::string name,
                std::optional<Metadata> metadata, std::optional<std::string> role,
                std::optional<std::string> staff_id, std::optional<std::string> context,
                bool escalate);

    const std::string& id() const noexcept { return id_; }
    std::uint64_t sequence() const noexcept { return sequence_; }
    Clock::time_point timestamp() const noexcept { return timestamp_; }
    const std::string& name() const noexcept { return name_; }
    const std::optional<Metadata>& metadata() const noexcept { return metadata_; }
    const std::optional<std::string>& role() const noexcept { return role_; }
    const std::optional<std::string>& staff_id() const noexcept { return staff_id_; }
    const std::optional<std::string>& context() const noexcept { return context_; }
    bool escalate() const noexcept { return escalate_; }

    friend bool operator==(const EventRecord&, const EventRecord&) = default;

  private:
    std::string id_;
    std::uint64_t sequence_;
    Clock::time_point timestamp_;
    std::string name_;
    std::optional<Metadata> metadata_;
    std::optional<std::string> role_;
    std::optional<std::string> staff_id_;
    std::optional<std::string> context_;
    bool escalate_;
  };

  // Random (version 4) UUID in canonical 8-4-4-4-12 form. // TSK207
  std::string GenerateEventId();

} // namespace et::audit
