#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace et::config {

  enum class DeliveryMode { kInline, kBackground };

  struct RecorderConfig {
    std::size_t capacity{20};
    std::string component_name;
    DeliveryMode delivery_mode{DeliveryMode::kBackground};
    std::size_t max_pending_deliveries{1024};
    // Source of event ids. Empty means et::audit::GenerateEventId().
    std::function<std::string()> id_generator;
  };

  // Default buffer sizing for the engines that embed a recorder.
  struct EngineProfile {
    std::string_view component_name;
    std::size_t capacity;
  };

  std::span<const EngineProfile> KnownEngineProfiles() noexcept;
  std::optional<EngineProfile> FindEngineProfile(std::string_view component_name) noexcept;

  // Throws et::Error (Config or Validation domain) when the config cannot be
  // used to construct a recorder.
  void ValidateRecorderConfig(const RecorderConfig& config);

  // Profile defaults for `component_name`, then environment overrides:
  //   ET_EVENT_BUFFER_CAPACITY, ET_DELIVERY_MODE, ET_DELIVERY_QUEUE_DEPTH.
  // Malformed values throw et::Error (Config domain).
  RecorderConfig LoadRecorderConfig(std::string_view component_name);

  // ET_ANALYTICS_VERBOSE, defaulting to `fallback` when unset.
  bool ResolveVerboseFromEnvironment(bool fallback = false);

  const char* DeliveryModeToString(DeliveryMode mode) noexcept;
  std::optional<DeliveryMode> ParseDeliveryMode(std::string_view text) noexcept;

  inline constexpr const char* kCapacityEnv = "ET_EVENT_BUFFER_CAPACITY";
  inline constexpr const char* kDeliveryModeEnv = "ET_DELIVERY_MODE";
  inline constexpr const char* kQueueDepthEnv = "ET_DELIVERY_QUEUE_DEPTH";
  inline constexpr const char* kVerboseEnv = "ET_ANALYTICS_VERBOSE";

} // namespace et::config
