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

#include "blob_pool.h"
#include <stdexcept>
#include <utility>

BlobPool::BlobPool(BlobPoolConfig config)
    : config_(std::move(config))
    , stopping_(false)
{
    if (config_.workers == 0)
        throw std::invalid_argument("blob pool: workers must be > 0");

    pthread_attr_t attr;
    pthread_attr_init(&attr);

    int rc = pthread_attr_setstacksize(&attr, config_.stack_size);
    if (rc != 0) {
        pthread_attr_destroy(&attr);
        throw std::invalid_argument(
            "blob pool: invalid stack size " + std::to_string(config_.stack_size));
    }

    threads_.reserve(config_.workers);
    for (size_t i{}; i < config_.workers; i++) {
        pthread_t tid;
        rc = pthread_create(&tid, &attr, &BlobPool::worker_entry, this);
        if (rc != 0) {
            pthread_attr_destroy(&attr);
            shutdown();
            throw std::runtime_error(
                "blob pool: failed to spawn worker, pthread_create=" + std::to_string(rc));
        }

        std::string name = config_.thread_name.substr(0, 15);
        pthread_setname_np(tid, name.c_str());
        threads_.push_back(tid);
    }

    pthread_attr_destroy(&attr);
}

BlobPool::~BlobPool() {
    shutdown();
}

// drains the queue, then joins every worker
void BlobPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mux_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (pthread_t tid : threads_)
        pthread_join(tid, nullptr);
    threads_.clear();
}

size_t BlobPool::pending() const {
    std::lock_guard<std::mutex> lock(mux_);
    return queue_.size();
}

void BlobPool::push(Task task) {
    {
        std::lock_guard<std::mutex> lock(mux_);
        if (stopping_)
            throw std::runtime_error("blob pool: submit after shutdown");
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void* BlobPool::worker_entry(void* self) {
    static_cast<BlobPool*>(self)->run_worker();
    return nullptr;
}

void BlobPool::run_worker() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mux_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });

            if (queue_.empty()) return;

            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

// never destroyed: exit must not wait on queued work or join a worker
// from inside one of its own jobs
BlobPool& global_blob_pool() {
    static BlobPool* pool = new BlobPool{BlobPoolConfig{}};
    return *pool;
}
