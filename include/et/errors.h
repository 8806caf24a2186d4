#pragma once

#include <string_view>

namespace et::errors::msg {
// TSK202 centralized message catalog
inline constexpr std::string_view kBufferCapacityZero{"Event buffer capacity must be at least 1"};
inline constexpr std::string_view kDeliveryMissing{"Recorder requires an analytics delivery sink"};
inline constexpr std::string_view kQueueDepthZero{"Delivery queue depth must be at least 1"};
inline constexpr std::string_view kInvalidCapacityValue{"Invalid event buffer capacity"};
inline constexpr std::string_view kInvalidQueueDepthValue{"Invalid delivery queue depth"};
inline constexpr std::string_view kInvalidDeliveryModeValue{"Delivery mode must be 'inline' or 'background'"};
inline constexpr std::string_view kInvalidBooleanValue{"Expected a boolean value (1/0, true/false, yes/no, on/off)"};
inline constexpr std::string_view kStreamWriteFailed{"Failed to write analytics line to output stream"};
inline constexpr std::string_view kSubscriberFailed{"One or more delivery subscribers failed"};
inline constexpr std::string_view kRandomSourceFailed{"System random source failed"};
inline constexpr std::string_view kDigestFailed{"SHA-256 digest failed"};
inline constexpr std::string_view kScriptUnreadable{"Unable to read event script"};
inline constexpr std::string_view kMalformedScriptLine{"Malformed event script line"};
}  // namespace et::errors::msg
