#pragma once

#include <cstddef>
#include <functional>

namespace pytestify {

// Runs task(0) .. task(count - 1) on up to `jobs` threads. Workers stop
// taking new indices once should_stop() returns true; indices already
// started always finish. Returns how many tasks ran.
auto parallel_for(size_t count, size_t jobs, const std::function<void(size_t)>& task,
                  const std::function<bool()>& should_stop) -> size_t;

} // namespace pytestify
