#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace et {
  // TSK201_Error_Model
  enum class ErrorDomain : std::uint16_t {
    IO = 0x01,
    Validation = 0x02,
    Config = 0x03,
    Delivery = 0x04,
    State = 0x05,
    Crypto = 0x06,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so propagated errno values never
  // collide with framework codes.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::IO:
      return 0x0100;
    case ErrorDomain::Validation:
      return 0x0200;
    case ErrorDomain::Config:
      return 0x0300;
    case ErrorDomain::Delivery:
      return 0x0400;
    case ErrorDomain::State:
      return 0x0500;
    case ErrorDomain::Crypto:
      return 0x0600;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kStreamWriteFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kScriptUnreadable = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kRandomSourceUnavailable = Make(ErrorDomain::IO, 0x03);
    } // namespace io

    namespace validation {
      inline constexpr int kZeroCapacity = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kMissingDelivery = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kMalformedScriptLine = Make(ErrorDomain::Validation, 0x03);
    } // namespace validation

    namespace config {
      inline constexpr int kInvalidCapacity = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kInvalidDeliveryMode = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kInvalidQueueDepth = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kInvalidBoolean = Make(ErrorDomain::Config, 0x04);
    } // namespace config

    namespace delivery {
      inline constexpr int kSubscriberFailed = Make(ErrorDomain::Delivery, 0x01);
    } // namespace delivery

    namespace crypto {
      inline constexpr int kDigestFailed = Make(ErrorDomain::Crypto, 0x01);
    } // namespace crypto

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };
} // namespace et
