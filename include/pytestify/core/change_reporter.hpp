#pragma once

#include "pytestify/types.hpp"
#include <span>

namespace pytestify {

// Pure aggregation of per-file results; results are counted in the order given
auto summarize(std::span<const FileTransformResult> results) -> MigrationSummary;

} // namespace pytestify
