/*
 * Blob Codec
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once
#include "codes.h"
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <pthread.h>
#include <string>
#include <type_traits>
#include <vector>

struct BlobPoolConfig {
    size_t workers = 2;

    // a 2MB stack overflows inside the commitment step
    size_t stack_size = 8 * 1024 * 1024;

    // linux truncates thread names to 15 chars
    std::string thread_name = "blob-worker";
};

// Fixed set of long lived worker threads with enlarged stacks, used to run
// blob encoding and commitment work off the caller's thread. Jobs queue
// FIFO once every worker is busy. A job that throws is reported through
// its future as THREAD_PANICKED and the worker keeps serving.
//
// Jobs cannot be cancelled: dropping the future does not stop the job.
class BlobPool {
public:
    explicit BlobPool(BlobPoolConfig config = BlobPoolConfig{});
    ~BlobPool();

    BlobPool(const BlobPool&) = delete;
    BlobPool& operator=(const BlobPool&) = delete;

    // job must return Result<T, BlobError>
    template <typename F>
    std::future<std::invoke_result_t<F>> spawn_blocking(F job);

    const BlobPoolConfig& config() const { return config_; }
    size_t workers() const { return threads_.size(); }
    size_t pending() const;

private:
    using Task = std::function<void()>;

    BlobPoolConfig config_;
    std::vector<pthread_t> threads_;

    std::deque<Task> queue_;
    mutable std::mutex mux_;
    std::condition_variable cv_;
    bool stopping_;

    void push(Task task);
    void run_worker();
    void shutdown();
    static void* worker_entry(void* self);
};

// Process wide pool with the default config, built on first use and
// kept for the life of the process. It is never shut down, so jobs still
// queued or running at exit are dropped rather than waited on.
BlobPool& global_blob_pool();


template <typename F>
std::future<std::invoke_result_t<F>> BlobPool::spawn_blocking(F job) {
    using R = std::invoke_result_t<F>;

    auto promise = std::make_shared<std::promise<R>>();
    std::future<R> fut = promise->get_future();

    push([promise, job = std::move(job)]() mutable {
        std::string what;
        try {
            promise->set_value(job());
            return;
        } catch (const std::exception &e) {
            what = e.what();
        } catch (...) {
            what = "unknown exception";
        }

        fprintf(stderr, "[blob-pool] job failed: %s\n", what.c_str());
        promise->set_value(R(thread_panicked(what)));
    });

    return fut;
}
