#include "et/config/recorder_config.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>
#include <system_error>

#include "et/error.h"
#include "et/errors.h"

namespace et::config {
namespace {

// TSK211 capacities observed across the engines
constexpr std::array<EngineProfile, 5> kEngineProfiles{{
    {"ChurnPredictionEngine", 20},
    {"CriticalAlertEngine", 30},
    {"RetentionTagEngine", 50},
    {"NotificationEngine", 30},
    {"CloudKitSyncEngine", 50},
}};

std::optional<std::string_view> ReadEnv(const char* name) {
  const char* env = std::getenv(name);
  if (!env || *env == '\0') {
    return std::nullopt;
  }
  return std::string_view(env);
}

std::size_t ParsePositive(const char* name, std::string_view text, int code, std::string_view message) {
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value == 0 ||
      value > std::numeric_limits<std::size_t>::max()) {
    throw Error{ErrorDomain::Config, code,
                std::string(message) + ": " + name + "=" + std::string(text)};
  }
  return static_cast<std::size_t>(value);
}

std::string Lowercase(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

} // namespace

std::span<const EngineProfile> KnownEngineProfiles() noexcept {
  return std::span<const EngineProfile>(kEngineProfiles);
}

std::optional<EngineProfile> FindEngineProfile(std::string_view component_name) noexcept {
  for (const auto& profile : kEngineProfiles) {
    if (profile.component_name == component_name) {
      return profile;
    }
  }
  return std::nullopt;
}

void ValidateRecorderConfig(const RecorderConfig& config) {
  if (config.capacity == 0) {
    throw Error{ErrorDomain::Validation, errors::validation::kZeroCapacity,
                std::string(errors::msg::kBufferCapacityZero)};
  }
  if (config.max_pending_deliveries == 0) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidQueueDepth,
                std::string(errors::msg::kQueueDepthZero)};
  }
}

RecorderConfig LoadRecorderConfig(std::string_view component_name) {
  RecorderConfig config;
  config.component_name = std::string(component_name);
  if (auto profile = FindEngineProfile(component_name)) {
    config.capacity = profile->capacity;
  }
  if (auto value = ReadEnv(kCapacityEnv)) {
    config.capacity = ParsePositive(kCapacityEnv, *value, errors::config::kInvalidCapacity,
                                    errors::msg::kInvalidCapacityValue);
  }
  if (auto value = ReadEnv(kDeliveryModeEnv)) {
    auto mode = ParseDeliveryMode(*value);
    if (!mode) {
      throw Error{ErrorDomain::Config, errors::config::kInvalidDeliveryMode,
                  std::string(errors::msg::kInvalidDeliveryModeValue) + ": " + kDeliveryModeEnv + "=" +
                      std::string(*value)};
    }
    config.delivery_mode = *mode;
  }
  if (auto value = ReadEnv(kQueueDepthEnv)) {
    config.max_pending_deliveries = ParsePositive(kQueueDepthEnv, *value, errors::config::kInvalidQueueDepth,
                                                  errors::msg::kInvalidQueueDepthValue);
  }
  ValidateRecorderConfig(config);
  return config;
}

bool ResolveVerboseFromEnvironment(bool fallback) {
  auto value = ReadEnv(kVerboseEnv);
  if (!value) {
    return fallback;
  }
  const std::string lowered = Lowercase(*value);
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  throw Error{ErrorDomain::Config, errors::config::kInvalidBoolean,
              std::string(errors::msg::kInvalidBooleanValue) + ": " + kVerboseEnv + "=" + std::string(*value)};
}

const char* DeliveryModeToString(DeliveryMode mode) noexcept {
  switch (mode) {
  case DeliveryMode::kInline:
    return "inline";
  case DeliveryMode::kBackground:
    return "background";
  }
  return "background";
}

std::optional<DeliveryMode> ParseDeliveryMode(std::string_view text) noexcept {
  if (text == "inline") {
    return DeliveryMode::kInline;
  }
  if (text == "background") {
    return DeliveryMode::kBackground;
  }
  return std::nullopt;
}

} // namespace et::config
