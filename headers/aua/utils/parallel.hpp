//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_PARALLEL_HPP
#define AUA_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Worker pool used to analyze corpus files and merge aggregates.
 *
 * The engine analyzes files with map() and combines per-file aggregates with
 * tree_reduce(), which only needs the reducer to be associative.
 */

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace aua::parallel {

    /**
     * Number of hardware threads, never less than one.
     */
    inline unsigned int hardware_concurrency() noexcept {
        return std::max(1u, std::thread::hardware_concurrency());
    }

    /**
     * Fixed set of worker threads draining a FIFO of jobs.
     *
     * Destruction finishes every queued job before joining.
     */
    class ThreadPool {
    public:
        /**
         * @param workers Thread count, 0 for hardware_concurrency().
         */
        explicit ThreadPool(const unsigned int workers = 0) {
            const unsigned int count = workers == 0 ? hardware_concurrency() : workers;
            threads_.reserve(count);
            for (unsigned int i = 0; i < count; ++i) {
                threads_.emplace_back([this] { drain(); });
            }
        }

        ~ThreadPool() {
            {
                std::lock_guard lock(mutex_);
                closing_ = true;
            }
            wake_.notify_all();
            for (auto& thread : threads_) {
                thread.join();
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Queues a nullary job. An exception thrown by the job is rethrown
         * from the returned future.
         */
        template<typename F>
        auto submit(F&& job) -> std::future<std::invoke_result_t<F>> {
            using R = std::invoke_result_t<F>;
            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(job));
            auto future = task->get_future();
            {
                std::lock_guard lock(mutex_);
                if (closing_) {
                    throw std::logic_error("thread pool is shutting down");
                }
                jobs_.emplace_back([task] { (*task)(); });
            }
            wake_.notify_one();
            return future;
        }

        [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

    private:
        void drain() {
            for (;;) {
                std::function<void()> job;
                {
                    std::unique_lock lock(mutex_);
                    wake_.wait(lock, [this] { return closing_ || !jobs_.empty(); });
                    if (jobs_.empty()) {
                        return;
                    }
                    job = std::move(jobs_.front());
                    jobs_.pop_front();
                }
                job();
            }
        }

        std::vector<std::thread> threads_;
        std::deque<std::function<void()>> jobs_;
        std::mutex mutex_;
        std::condition_variable wake_;
        bool closing_ = false;
    };

    /**
     * Applies `f` to every item on the pool. Results keep the input order.
     *
     * Jobs borrow `items` and `f`, so every job is waited for before the
     * first exception thrown by a job is rethrown.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, ThreadPool& pool)
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using R = std::invoke_result_t<F, const T&>;

        std::vector<std::future<R>> pending;
        pending.reserve(items.size());
        for (const auto& item : items) {
            pending.push_back(pool.submit([&f, &item] { return f(item); }));
        }

        std::vector<R> results;
        results.reserve(items.size());
        std::exception_ptr failure;
        for (auto& future : pending) {
            try {
                results.push_back(future.get());
            } catch (...) {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
        if (failure) {
            std::rethrow_exception(failure);
        }
        return results;
    }

    /**
     * Reduces a collection by combining neighbours pairwise, one round per
     * tree level, each round running on the pool.
     *
     * The reducer must be associative; it does not need to be commutative
     * because neighbours are always combined left to right.
     *
     * @param items The items to reduce (consumed).
     * @param identity Value returned for an empty input.
     * @param reducer Binary function `T(T, T)`.
     */
    template<typename T, typename F>
    T tree_reduce(std::vector<T> items, T identity, F&& reducer, ThreadPool& pool) {
        if (items.empty()) {
            return identity;
        }

        while (items.size() > 1) {
            std::vector<std::future<T>> round;
            round.reserve(items.size() / 2);
            for (std::size_t i = 0; i + 1 < items.size(); i += 2) {
                round.push_back(pool.submit([&reducer, &items, i] {
                    return reducer(std::move(items[i]), std::move(items[i + 1]));
                }));
            }

            std::vector<T> next;
            next.reserve(round.size() + 1);
            std::exception_ptr failure;
            for (auto& future : round) {
                try {
                    next.push_back(future.get());
                } catch (...) {
                    if (!failure) {
                        failure = std::current_exception();
                    }
                }
            }
            if (failure) {
                std::rethrow_exception(failure);
            }
            if (items.size() % 2 == 1) {
                next.push_back(std::move(items.back()));
            }
            items = std::move(next);
        }

        return std::move(items.front());
    }

}  // namespace aua::parallel

#endif //AUA_PARALLEL_HPP
