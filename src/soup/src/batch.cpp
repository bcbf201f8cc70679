#include "scrape/soup/batch.hpp"
#include "scrape/core/logger.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace scrape {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("soup");
    return instance;
}

} // namespace

void parallel_for(usize count, usize threads, const std::function<void(usize)>& task) {
    if (count == 0) {
        return;
    }
    if (threads == 0) {
        threads = std::max<usize>(1, std::thread::hardware_concurrency());
    }
    threads = std::min(threads, count);

    if (threads == 1) {
        for (usize index = 0; index < count; ++index) {
            task(index);
        }
        return;
    }

    std::atomic<usize> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            usize index = next.fetch_add(1, std::memory_order_relaxed);
            if (index >= count) {
                return;
            }
            try {
                task(index);
            } catch (...) {
                std::lock_guard lock(failure_mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
                failed.store(true, std::memory_order_relaxed);
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (usize i = 1; i < threads; ++i) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error& e) {
            // Fewer workers; the indices are still all claimed
            logger().warn_fmt("could not start worker thread: {}", e.what());
            break;
        }
    }
    // The calling thread works too
    worker();
    for (auto& thread : workers) {
        thread.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

std::vector<Soup> parse_batch(const std::vector<String>& inputs, const SoupConfig& config, usize threads) {
    std::vector<Soup> results(inputs.size());

    parallel_for(inputs.size(), threads, [&](usize index) {
        auto result = Soup::parse_with_config(inputs[index].view(), config);
        if (result.is_err()) {
            logger().warn_fmt("batch input {} failed to parse, using an empty document: {}",
                              index, result.error().to_string().view());
            return;
        }
        results[index] = std::move(result).value();
    });

    logger().debug_fmt("parsed a batch of {} documents", inputs.size());
    return results;
}

} // namespace scrape
