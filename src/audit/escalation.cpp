#include "et/audit/escalation.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <string>

namespace et::audit {
namespace {

std::string AsciiLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return lowered;
}

} // namespace

std::span<const std::string_view> EscalationKeywords() noexcept {
  return std::span<const std::string_view>(kEscalationKeywords);
}

bool ContainsEscalationKeyword(std::string_view text) noexcept {
  try {
    const std::string lowered = AsciiLower(text);
    return std::any_of(kEscalationKeywords.begin(), kEscalationKeywords.end(),
                       [&lowered](std::string_view keyword) {
                         return lowered.find(keyword) != std::string::npos;
                       });
  } catch (const std::exception& err) { // allocation failure while lowering
    std::clog << "{\"event\":\"escalation_classifier_error\",\"detail\":\"" << err.what() << "\"}"
              << std::endl;
    return false;
  }
}

bool ClassifyEscalation(std::string_view name, const std::optional<Metadata>& metadata) noexcept {
  if (ContainsEscalationKeyword(name)) {
    return true;
  }
  if (!metadata) {
    return false;
  }
  for (const auto& entry : *metadata) {
    try {
      if (ContainsEscalationKeyword(entry.value.ToString())) {
        return true;
      }
    } catch (const std::exception& err) {
      std::clog << "{\"event\":\"escalation_classifier_error\",\"detail\":\"" << err.what()
                << "\"}" << std::endl;
    }
  }
  return false;
}

} // namespace et::audit
