#include "et/cli/replay.h"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <istream>
#include <sstream>
#include <system_error>

#include "et/audit/diagnostics.h"
#include "et/config/recorder_config.h"
#include "et/errors.h"

namespace et::cli {
namespace {

std::vector<std::string> SplitWords(std::string_view line) {
  std::vector<std::string> words;
  std::istringstream iss{std::string(line)};
  std::string word;
  while (iss >> word) {
    words.push_back(std::move(word));
  }
  return words;
}

[[noreturn]] void ThrowMalformedLine(std::size_t line_number, std::string_view reason) {
  throw Error{ErrorDomain::Validation, errors::validation::kMalformedScriptLine,
              std::string(errors::msg::kMalformedScriptLine) + " " + std::to_string(line_number) + ": " +
                  std::string(reason)};
}

[[noreturn]] void ThrowUnreadable(std::string_view source) {
  throw Error{ErrorDomain::IO, errors::io::kScriptUnreadable,
              std::string(errors::msg::kScriptUnreadable) + ": " + std::string(source)};
}

} // namespace

et::audit::MetadataValue ParseScalar(std::string_view text) {
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  std::int64_t integer = 0;
  if (auto [ptr, ec] = std::from_chars(begin, end, integer); ec == std::errc() && ptr == end) {
    return et::audit::MetadataValue(integer);
  }
  double real = 0.0;
  if (auto [ptr, ec] = std::from_chars(begin, end, real); ec == std::errc() && ptr == end) {
    return et::audit::MetadataValue(real);
  }
  if (text == "true") {
    return et::audit::MetadataValue(true);
  }
  if (text == "false") {
    return et::audit::MetadataValue(false);
  }
  return et::audit::MetadataValue(text);
}

int ExitCodeFor(const Error& err) {
  switch (err.domain) {
  case ErrorDomain::Validation:
  case ErrorDomain::Config:
    return kExitUsage;
  case ErrorDomain::IO:
  case ErrorDomain::Delivery:
  case ErrorDomain::State:
  case ErrorDomain::Crypto:
  case ErrorDomain::Internal:
  default:
    return kExitIO;
  }
}

ReplaySession::ReplaySession(const ReplayOptions& options, std::ostream& sink_out,
                             std::shared_ptr<et::audit::AuditContext> context)
    : options_(options), context_(context ? std::move(context) : et::audit::SharedAuditContext()) {
  auto fanout = std::make_shared<et::audit::FanoutDelivery>();
  if (options_.verbose) {
    fanout->Attach(std::make_shared<et::audit::ConsoleDelivery>(true, sink_out));
  }
  if (options_.json) {
    et::audit::JsonLineOptions json_options;
    json_options.staff_id_privacy =
        options_.hash_staff ? et::audit::FieldPrivacy::kHash : et::audit::FieldPrivacy::kPublic;
    fanout->Attach(std::make_shared<et::audit::JsonLineDelivery>(sink_out, json_options));
  }
  if (fanout->subscriber_count() == 0) {
    delivery_ = std::make_shared<et::audit::ConsoleDelivery>(false);
  } else {
    delivery_ = std::move(fanout);
  }
}

void ReplaySession::Apply(std::string_view line, std::size_t line_number) {
  auto words = SplitWords(line);
  if (words.empty() || words.front().front() == '#') {
    return;
  }
  if (words.front() == "login") {
    if (words.size() != 3) {
      ThrowMalformedLine(line_number, "login expects <role> <staff_id>");
    }
    context_->BeginSession(words[1], words[2]);
    return;
  }
  if (words.front() == "logout") {
    if (words.size() != 1) {
      ThrowMalformedLine(line_number, "logout takes no arguments");
    }
    context_->EndSession();
    return;
  }
  if (words.size() < 2) {
    ThrowMalformedLine(line_number, "expected <component> <event_name>");
  }

  std::optional<et::audit::Metadata> metadata;
  for (std::size_t i = 2; i < words.size(); ++i) {
    const auto& pair = words[i];
    auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
      ThrowMalformedLine(line_number, "metadata must be key=value: " + pair);
    }
    if (!metadata) {
      metadata.emplace();
    }
    metadata->Set(pair.substr(0, eq), ParseScalar(std::string_view(pair).substr(eq + 1)));
  }
  RecorderFor(words[0]).Record(words[1], std::move(metadata));
}

void ReplaySession::ApplyScript(std::istream& in, std::string_view source_name) {
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    Apply(line, line_number);
  }
  if (in.bad()) {
    ThrowUnreadable(source_name);
  }
}

void ReplaySession::PrintReport(std::ostream& out) {
  for (auto& [component, recorder] : recorders_) {
    recorder->Flush();
    out << "== " << component << '\n';
    out << et::audit::RenderRecords(recorder->Snapshot());
    for (const auto& [key, value] : recorder->Diagnostics()) {
      out << "  " << key << ": " << value << '\n';
    }
  }
}

et::audit::EventRecorder& ReplaySession::RecorderFor(const std::string& component) {
  for (auto& [name, recorder] : recorders_) {
    if (name == component) {
      return *recorder;
    }
  }
  auto config = et::config::LoadRecorderConfig(component);
  if (options_.capacity) {
    config.capacity = *options_.capacity;
  }
  if (options_.inline_delivery) {
    config.delivery_mode = et::config::DeliveryMode::kInline;
  }
  auto recorder = std::make_unique<et::audit::EventRecorder>(config, delivery_, context_);
  auto& ref = *recorder;
  recorders_.emplace_back(component, std::move(recorder));
  return ref;
}

void RunReplay(std::string_view source, const ReplayOptions& options, std::ostream& out,
               std::ostream& sink_out) {
  ReplaySession session(options, sink_out);
  if (source == "-") {
    session.ApplyScript(std::cin, "<stdin>");
  } else {
    std::ifstream file{std::string(source)};
    if (!file) {
      ThrowUnreadable(source);
    }
    session.ApplyScript(file, source);
  }
  session.PrintReport(out);
}

} // namespace et::cli
