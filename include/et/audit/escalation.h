#pragma once

#include <array>
#include <optional>
#include <span>
#include <string_view>

#include "et/audit/metadata.h"

namespace et::audit {

  inline constexpr std::array<std::string_view, 3> kEscalationKeywords{"danger", "critical", "delete"};

  // True when the lower-cased event name, or any metadata value rendered to a
  // string and lower-cased, contains one of kEscalationKeywords. Keys are not
  // inspected. // TSK205
  bool ClassifyEscalation(std::string_view name, const std::optional<Metadata>& metadata) noexcept;

  bool ContainsEscalationKeyword(std::string_view text) noexcept;

  std::span<const std::string_view> EscalationKeywords() noexcept;

} // namespace et::audit
