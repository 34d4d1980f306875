#include "ckmcp/catalog/fingerprint.h"

#include "ckmcp/core/sha256.h"

#include <algorithm>

namespace ckmcp::catalog {

namespace {

constexpr char kFieldSeparator = '\x1f';
constexpr char kToolTerminator = '\0';

}  // namespace

std::string toolset_fingerprint(const std::vector<Tool>& tools) {
  std::vector<const Tool*> sorted;
  sorted.reserve(tools.size());
  for (const auto& tool : tools) {
    sorted.push_back(&tool);
  }
  std::sort(sorted.begin(), sorted.end(),
            [](const Tool* a, const Tool* b) { return a->name < b->name; });

  core::Sha256 hasher;
  for (const Tool* tool : sorted) {
    hasher.update(tool->name);
    hasher.update(kFieldSeparator);
    hasher.update(tool->description);
    hasher.update(kFieldSeparator);
    // nlohmann objects keep keys sorted, so dump() is canonical for a given schema.
    hasher.update(tool->input_schema.dump());
    hasher.update(kToolTerminator);
  }
  return hasher.hex_digest().substr(0, kFingerprintLength);
}

}  // namespace ckmcp::catalog
