#pragma once
#include <string>
#include <vector>

namespace mpng {
// Canonical text of every address configured on a local interface.
std::vector<std::string> local_addresses();
}  // namespace mpng
