#include <charconv>
#include <cstddef>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include "et/cli/replay.h"
#include "et/config/recorder_config.h"
#include "et/error.h"

namespace {

  using et::cli::kExitIO;
  using et::cli::kExitOk;
  using et::cli::kExitUsage;

  void PrintUsage() {
    std::cerr << "EventTrail\n";
    std::cerr << "Usage:\n";
    std::cerr << "  et-trail [flags] replay <script|->\n";
    std::cerr << "  et-trail profiles\n";
    std::cerr << "\nFlags:\n";
    std::cerr << "  --verbose       Echo every delivered event to stderr\n";
    std::cerr << "  --json          Emit JSON lines for every delivered event to stderr\n";
    std::cerr << "  --inline        Deliver on the recording thread instead of a worker\n";
    std::cerr << "  --capacity=N    Override the event buffer capacity of every recorder\n";
    std::cerr << "  --hash-staff    Replace staff IDs with SHA-256 tags in JSON output\n";
    std::cerr << "\nScript lines:\n";
    std::cerr << "  login <role> <staff_id>\n";
    std::cerr << "  logout\n";
    std::cerr << "  <component> <event_name> [key=value ...]\n";
  }

  const char* DomainPrefix(et::ErrorDomain domain) {
    switch (domain) {
    case et::ErrorDomain::IO:
      return "I/O error";
    case et::ErrorDomain::Validation:
      return "Validation error";
    case et::ErrorDomain::Config:
      return "Configuration error";
    case et::ErrorDomain::Delivery:
      return "Delivery error";
    case et::ErrorDomain::State:
      return "State error";
    case et::ErrorDomain::Crypto:
      return "Crypto error";
    case et::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const et::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what();
    if (err.native_code) {
      std::cerr << " (native " << *err.native_code << ")";
    }
    std::cerr << '\n';
  }

  int HandleProfiles() {
    for (const auto& profile : et::config::KnownEngineProfiles()) {
      std::cout << profile.component_name << ' ' << profile.capacity << '\n';
    }
    return kExitOk;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    et::cli::ReplayOptions options;
    options.verbose = et::config::ResolveVerboseFromEnvironment(false);
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg == "--verbose") {
        options.verbose = true;
        continue;
      }
      if (arg == "--json") {
        options.json = true;
        continue;
      }
      if (arg == "--inline") {
        options.inline_delivery = true;
        continue;
      }
      if (arg == "--hash-staff") {
        options.hash_staff = true;
        continue;
      }
      if (arg.rfind("--capacity=", 0) == 0) {
        auto value = arg.substr(std::string_view("--capacity=").size());
        unsigned long long parsed = 0;
        auto [endptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (value.empty() || ec != std::errc() || endptr != value.data() + value.size() || parsed == 0) {
          PrintUsage();
          return kExitUsage;
        }
        options.capacity = static_cast<std::size_t>(parsed);
        continue;
      }

      PrintUsage();
      return kExitUsage;
    }

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }

    std::string cmd = argv[index++];
    if (cmd == "replay") {
      if (argc - index != 1) {
        PrintUsage();
        return kExitUsage;
      }
      et::cli::RunReplay(argv[index], options, std::cout, std::cerr);
      return kExitOk;
    }
    if (cmd == "profiles") {
      if (argc != index) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleProfiles();
    }

    PrintUsage();
    return kExitUsage;
  } catch (const et::Error& err) {
    ReportError(err);
    return et::cli::ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
