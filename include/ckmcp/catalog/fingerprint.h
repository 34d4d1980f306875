#pragma once

#include "ckmcp/catalog/tool.h"

#include <cstddef>
#include <string>
#include <vector>

namespace ckmcp::catalog {

constexpr std::size_t kFingerprintLength = 16;

// toolset_fingerprint hashes the membership and content (name, description, input schema)
// of tools. Input order does not matter; the list is re-sorted by name before hashing.
// Always kFingerprintLength lower-case hex characters, including for an empty list.
[[nodiscard]] std::string toolset_fingerprint(const std::vector<Tool>& tools);

}  // namespace ckmcp::catalog
