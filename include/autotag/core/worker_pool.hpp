#pragma once

#include <cstddef>
#include <functional>

namespace autotag::core {

/// Resolves a configured worker count; 0 means hardware concurrency (at least 1).
[[nodiscard]] std::size_t effective_workers(std::size_t num_workers);

/// Calls fn(i) exactly once for every i in [0, n), spread over up to num_workers
/// threads (0 = hardware concurrency). Runs on the calling thread when one worker
/// suffices. fn must only touch state owned by its index. Returns after every call.
void parallel_for_index(std::size_t n,
                        std::size_t num_workers,
                        const std::function<void(std::size_t)>& fn);

}  // namespace autotag::core
