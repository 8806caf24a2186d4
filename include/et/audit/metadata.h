#pragma once

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace et::audit {

  // Scalar carried in event metadata. Every alternative renders to a string,
  // which is what escalation and diagnostics operate on. // TSK204
  class MetadataValue {
  public:
    using Storage = std::variant<std::string, std::int64_t, double, bool>;

    MetadataValue() : storage_(std::string{}) {}
    MetadataValue(std::string value) : storage_(std::move(value)) {}
    MetadataValue(std::string_view value) : storage_(std::string(value)) {}
    MetadataValue(const char* value) : storage_(std::string(value ? value : "")) {}
    MetadataValue(bool value) : storage_(value) {}

    template <class T>
      requires(std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char>)
    MetadataValue(T value) : storage_(static_cast<std::int64_t>(value)) {}

    template <class T>
      requires std::floating_point<T>
    MetadataValue(T value) : storage_(static_cast<double>(value)) {}

    std::string ToString() const;

    // Integer, boolean, or finite double: has a bare JSON literal.
    bool IsJsonLiteral() const noexcept;

    friend bool operator==(const MetadataValue&, const MetadataValue&) = default;

  private:
    Storage storage_;
  };

  struct MetadataEntry {
    std::string key;
    MetadataValue value;

    friend bool operator==(const MetadataEntry&, const MetadataEntry&) = default;
  };

  // Insertion-ordered string-keyed mapping. Keys are unique; Set() on an
  // existing key replaces the value without moving it.
  class Metadata {
  public:
    using const_iterator = std::vector<MetadataEntry>::const_iterator;

    Metadata() = default;
    Metadata(std::initializer_list<MetadataEntry> entries);

    void Set(std::string key, MetadataValue value);
    const MetadataValue* Find(std::string_view key) const noexcept;
    bool Contains(std::string_view key) const noexcept { return Find(key) != nullptr; }

    bool empty() const noexcept { return entries_.empty(); }
    std::size_t size() const noexcept { return entries_.size(); }
    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    friend bool operator==(const Metadata&, const Metadata&) = default;

  private:
    std::vector<MetadataEntry> entries_;
  };

  // "key: value" pairs joined with ", "; absent or empty metadata is "none".
  std::string RenderMetadata(const std::optional<Metadata>& metadata);

} // namespace et::audit
