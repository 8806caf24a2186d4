#include "et/audit/escalation.h"
#include "et/audit/metadata.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

namespace {

using et::audit::ClassifyEscalation;
using et::audit::Metadata;

void TestNameKeywords() { // TSK205
  assert(ClassifyEscalation("delete_customer", std::nullopt));
  assert(ClassifyEscalation("DangerZoneEntered", std::nullopt) && "match is case-insensitive");
  assert(ClassifyEscalation("system_CRITICAL", std::nullopt));
  assert(!ClassifyEscalation("normal_event", std::nullopt));
  assert(!ClassifyEscalation("", std::nullopt));
  assert(ClassifyEscalation("undeleted", std::nullopt) && "substring match, not whole word");
}

void TestKeywordSet() {
  auto keywords = et::audit::EscalationKeywords();
  assert(keywords.size() == 3);
  assert(keywords[0] == "danger" && keywords[1] == "critical" && keywords[2] == "delete");
}

void TestMetadataValues() {
  assert(!ClassifyEscalation("normal_event", Metadata{{"note", "all good"}}));
  assert(ClassifyEscalation("sync_error", Metadata{{"error", "Critical failure"}}));
  assert(ClassifyEscalation("export", Metadata{{"a", 1}, {"b", "pending DELETE"}}) &&
         "any value may trigger");
  assert(!ClassifyEscalation("export", Metadata{{"critical", "no"}}) && "keys are not inspected");
  assert(!ClassifyEscalation("export", Metadata{}));
}

void TestNonStringValues() {
  assert(!ClassifyEscalation("retry", Metadata{{"attempts", 3}, {"ok", true}, {"ratio", 0.5}}));
}

void TestMetadataRendering() {
  assert(et::audit::RenderMetadata(std::nullopt) == "none");
  assert(et::audit::RenderMetadata(Metadata{}) == "none");
  Metadata md{{"note", "all good"}, {"count", 3}, {"ok", false}, {"ratio", 2.0}};
  assert(et::audit::RenderMetadata(md) == "note: all good, count: 3, ok: false, ratio: 2.0");

  md.Set("count", 4);
  assert(et::audit::RenderMetadata(md) == "note: all good, count: 4, ok: false, ratio: 2.0" &&
         "Set keeps the first insertion position");
  assert(md.size() == 4);
  assert(md.Contains("ratio") && !md.Contains("missing"));

  assert(et::audit::MetadataValue(0.25).ToString() == "0.25");
  assert(et::audit::MetadataValue(std::numeric_limits<double>::infinity()).ToString() == "inf");
  assert(et::audit::MetadataValue(std::nan("")).ToString() == "nan");
}

} // namespace

int main() {
  TestNameKeywords();
  TestKeywordSet();
  TestMetadataValues();
  TestNonStringValues();
  TestMetadataRendering();
  std::cout << "escalation test ok\n";
  return 0;
}
