#include "et/audit/metadata.h"

#include <array>
#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace et::audit {
namespace {

std::string FormatDouble(double value) { // TSK204 shortest round-trip form
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value < 0 ? "-inf" : "inf";
  }
  std::array<char, 64> buffer{};
  auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (ec != std::errc()) {
    return std::to_string(value);
  }
  std::string text(buffer.data(), ptr);
  if (text.find_first_of(".e") == std::string::npos) {
    text.append(".0");
  }
  return text;
}

struct ValueRenderer {
  std::string operator()(const std::string& value) const { return value; }
  std::string operator()(std::int64_t value) const { return std::to_string(value); }
  std::string operator()(double value) const { return FormatDouble(value); }
  std::string operator()(bool value) const { return value ? "true" : "false"; }
};

} // namespace

std::string MetadataValue::ToString() const {
  return std::visit(ValueRenderer{}, storage_);
}

bool MetadataValue::IsJsonLiteral() const noexcept {
  if (const double* real = std::get_if<double>(&storage_)) {
    return std::isfinite(*real);
  }
  return !std::holds_alternative<std::string>(storage_);
}

Metadata::Metadata(std::initializer_list<MetadataEntry> entries) {
  entries_.reserve(entries.size());
  for (const auto& entry : entries) {
    Set(entry.key, entry.value);
  }
}

void Metadata::Set(std::string key, MetadataValue value) {
  for (auto& entry : entries_) {
    if (entry.key == key) {
      entry.value = std::move(value);
      return;
    }
  }
  entries_.push_back(MetadataEntry{std::move(key), std::move(value)});
}

const MetadataValue* Metadata::Find(std::string_view key) const noexcept {
  for (const auto& entry : entries_) {
    if (entry.key == key) {
      return &entry.value;
    }
  }
  return nullptr;
}

std::string RenderMetadata(const std::optional<Metadata>& metadata) {
  if (!metadata || metadata->empty()) {
    return "none";
  }
  std::string out;
  bool first = true;
  for (const auto& entry : *metadata) {
    if (!first) {
      out.append(", ");
    }
    first = false;
    out.append(entry.key);
    out.append(": ");
    out.append(entry.value.ToString());
  }
  return out;
}

} // namespace et::audit
