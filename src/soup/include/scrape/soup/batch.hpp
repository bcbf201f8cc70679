#pragma once

#include "soup.hpp"
#include <functional>

namespace scrape {

// ============================================================================
// Parallel batch processing
// ============================================================================

// Runs task(0) .. task(count - 1) on up to `threads` workers. Workers claim
// indices from a shared counter; 0 threads means hardware concurrency.
// Returns once every task has finished. If a task throws, no further
// indices are started and the first exception is rethrown after every
// worker has joined.
void parallel_for(usize count, usize threads, const std::function<void(usize)>& task);

// One Soup per input, in input order. A failed parse becomes an empty
// document and is logged.
[[nodiscard]] std::vector<Soup> parse_batch(const std::vector<String>& inputs,
                                            const SoupConfig& config = {},
                                            usize threads = 0);

} // namespace scrape
