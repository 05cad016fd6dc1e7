#include "pytestify/application/worker_pool.hpp"
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace pytestify {

auto parallel_for(size_t count, size_t jobs, const std::function<void(size_t)>& task,
                  const std::function<bool()>& should_stop) -> size_t {
    std::atomic<size_t> next{0};
    std::atomic<size_t> completed{0};

    auto worker = [&]() {
        while (!should_stop()) {
            auto index = next.fetch_add(1);
            if (index >= count) {
                break;
            }
            task(index);
            completed.fetch_add(1);
        }
    };

    auto threads = std::clamp<size_t>(jobs, 1, std::max<size_t>(count, 1));
    if (threads == 1) {
        worker();
        return completed.load();
    }

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (size_t t = 0; t < threads; ++t) {
        pool.emplace_back(worker);
    }
    for (auto& thread : pool) {
        thread.join();
    }
    return completed.load();
}

} // namespace pytestify
