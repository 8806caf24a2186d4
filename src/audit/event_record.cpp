#include "et/audit/event_record.h"

#include <array>
#include <iomanip>
#include <span>
#include <sstream>
#include <utility>

#include "et/crypto/random.h"

namespace et::audit {
namespace {

std::string FormatUuid(const std::array<uint8_t, 16>& uuid) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < uuid.size(); ++i) {
    oss << std::setw(2) << static_cast<int>(uuid[i]);
    if (i == 3 || i == 5 || i == 7 || i == 9) {
      oss << '-';
    }
  }
  return oss.str();
}

} // namespace

EventRecord::EventRecord(std::string id, std::uint64_t sequence, Clock::time_point timestamp,
                         std::string name, std::optional<Metadata> metadata,
                         std::optional<std::string> role, std::optional<std::string> staff_id,
                         std::optional<std::string> context, bool escalate)
    : id_(std::move(id)),
      sequence_(sequence),
      timestamp_(timestamp),
      name_(std::move(name)),
      metadata_(std::move(metadata)),
      role_(std::move(role)),
      staff_id_(std::move(staff_id)),
      context_(std::move(context)),
      escalate_(escalate) {}

std::string GenerateEventId() {
  std::array<uint8_t, 16> bytes{};
  et::crypto::SystemRandomBytes(std::span<uint8_t>(bytes));
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant
  return FormatUuid(bytes);
}

} // namespace et::audit
