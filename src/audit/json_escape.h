#pragma once

#include <string>
#include <string_view>

namespace et::audit {

  // JSON string-body escaping for sink output and clog diagnostics.
  std::string EscapeJson(std::string_view text);

} // namespace et::audit
