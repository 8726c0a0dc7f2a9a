#pragma once

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @brief Runs task(item) for every item, at most chunk_size at a time.
 *
 * Items in a chunk are started in order, each on its own thread. Results
 * are handed to on_result on the calling thread in completion order. The
 * next chunk starts only after every result of the current one has been
 * delivered. If on_result returns false, the rest of the current chunk is
 * still delivered but no further chunk is started.
 *
 * An exception thrown by a task is rethrown here once its chunk has
 * finished.
 *
 * @return false if on_result asked to stop.
 */
template <typename Item, typename Result>
bool run_in_chunks(const std::vector<Item>& items, size_t chunk_size,
                   const std::function<Result(const Item&)>& task,
                   const std::function<bool(Result&&)>& on_result) {
    chunk_size = std::max<size_t>(chunk_size, 1);
    bool keep_going = true;

    for (size_t begin = 0; begin < items.size() && keep_going; begin += chunk_size) {
        const size_t end = std::min(items.size(), begin + chunk_size);

        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Result> done;
        size_t failed_tasks = 0;
        std::exception_ptr first_error;

        std::vector<std::thread> threads;
        threads.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            threads.emplace_back([&, i] {
                try {
                    Result r = task(items[i]);
                    std::lock_guard<std::mutex> lock(mutex);
                    done.push_back(std::move(r));
                } catch (...) {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (!first_error) first_error = std::current_exception();
                    failed_tasks++;
                }
                cv.notify_one();
            });
        }

        size_t delivered = 0;
        const size_t expected = end - begin;
        while (true) {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&] { return !done.empty() || delivered + failed_tasks == expected; });
            if (done.empty()) break;

            Result r = std::move(done.front());
            done.pop_front();
            lock.unlock();

            delivered++;
            if (!on_result(std::move(r))) keep_going = false;
        }

        for (auto& t : threads) t.join();

        if (first_error) std::rethrow_exception(first_error);
    }
    return keep_going;
}
