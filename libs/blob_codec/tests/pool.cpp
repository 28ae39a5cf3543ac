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

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "blob_pool.h"
#include "offload.h"
#include "splitter.h"
#include "tests.h"

void test_concurrent_jobs() {
    printf("TESTING 3 JOBS ON 2 WORKERS\n");

    BlobPool pool;
    assert(pool.workers() == 2);

    std::vector<std::vector<byte>> payloads = {
        test_payload(MAX_BLOB_DATA_SIZE + 17, 21),
        test_payload(2 * MAX_BLOB_DATA_SIZE, 22),
        test_payload(999, 23),
    };

    std::vector<std::future<Result<std::vector<Blob>, BlobError>>> futures;
    for (const auto &p : payloads)
        futures.push_back(create_blobs_from_data_async(pool, p));

    for (size_t i{}; i < payloads.size(); i++) {
        auto r = futures[i].get();
        assert(r.is_ok());

        auto expected = create_blobs_from_data(payloads[i]);
        assert(r.unwrap() == expected.unwrap());
    }
}

void test_queueing() {
    printf("TESTING JOBS QUEUE BEHIND BUSY WORKERS\n");

    BlobPool pool;

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<bool> release{false};

    auto job = [&]() -> Result<int, BlobError> {
        int now = ++running;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}

        while (!release.load())
            std::this_thread::sleep_for(std::chrono::milliseconds(1));

        --running;
        return now;
    };

    auto a = pool.spawn_blocking(job);
    auto b = pool.spawn_blocking(job);
    auto c = pool.spawn_blocking(job);

    // two workers pick up a and b, c waits
    while (running.load() < 2)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    assert(pool.pending() == 1);

    release.store(true);
    assert(a.get().is_ok());
    assert(b.get().is_ok());
    assert(c.get().is_ok());
    assert(peak.load() == 2);
}

void test_panic_isolation() {
    printf("TESTING PANIC ISOLATION\n");

    BlobPool pool;

    auto bad = pool.spawn_blocking([]() -> Result<int, BlobError> {
        throw std::runtime_error("boom");
    });
    auto r = bad.get();
    assert(r.is_err());
    assert(r.unwrap_err().code == THREAD_PANICKED);
    assert(r.unwrap_err().to_string() == "thread panicked: boom");

    // job errors are not panics
    std::vector<byte> fine = test_payload(4096, 24);
    auto good = pool.spawn_blocking([fine]() {
        return create_blobs_from_data(ByteSlice(fine));
    });
    auto g = good.get();
    assert(g.is_ok());
    assert(g.unwrap().size() == 1);

    // both workers still serve after a failure
    auto x = pool.spawn_blocking([]() -> Result<int, BlobError> { throw std::logic_error("x"); });
    auto y = pool.spawn_blocking([]() -> Result<int, BlobError> { return 7; });
    auto z = pool.spawn_blocking([]() -> Result<int, BlobError> { return 8; });
    assert(x.get().unwrap_err().code == THREAD_PANICKED);
    assert(y.get().unwrap() == 7);
    assert(z.get().unwrap() == 8);
}

void test_worker_threads() {
    printf("TESTING WORKER STACK SIZE & NAME\n");

    BlobPoolConfig config;
    config.workers = 1;
    config.stack_size = 16 * 1024 * 1024;
    config.thread_name = "blob-test";

    BlobPool pool(config);

    auto f = pool.spawn_blocking([]() -> Result<size_t, BlobError> {
        pthread_attr_t attr;
        size_t stack_size = 0;
        if (pthread_getattr_np(pthread_self(), &attr) != 0)
            return BlobError{THREAD_PANICKED};
        pthread_attr_getstacksize(&attr, &stack_size);
        pthread_attr_destroy(&attr);
        return stack_size;
    });
    auto r = f.get();
    assert(r.is_ok());
    assert(r.unwrap() >= 16 * 1024 * 1024);

    auto n = pool.spawn_blocking([]() -> Result<std::string, BlobError> {
        char name[16] = {0};
        pthread_getname_np(pthread_self(), name, sizeof(name));
        return std::string(name);
    });
    assert(n.get().unwrap() == "blob-test");

    bool threw = false;
    try {
        BlobPoolConfig empty;
        empty.workers = 0;
        BlobPool p(empty);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
}

void test_global_pool() {
    printf("TESTING GLOBAL POOL\n");

    BlobPool &a = global_blob_pool();
    BlobPool &b = global_blob_pool();
    assert(&a == &b);
    assert(a.workers() == 2);
    assert(a.config().stack_size == 8 * 1024 * 1024);

    auto f = a.spawn_blocking([]() { return create_blobs_from_data(ByteSlice()); });
    assert(f.get().unwrap().empty());
}

// runs in a forked child so that exit() tears down a process whose
// global pool still holds a sleeping job
void test_global_pool_exit() {
    printf("TESTING EXIT DOES NOT WAIT ON GLOBAL POOL JOBS\n");

    fflush(stdout);
    auto start = std::chrono::steady_clock::now();

    pid_t pid = fork();
    assert(pid >= 0);

    if (pid == 0) {
        std::atomic<bool> started{false};

        BlobPool &pool = global_blob_pool();
        {
            auto abandoned = pool.spawn_blocking([&started]() {
                started = true;
                std::this_thread::sleep_for(std::chrono::seconds(3));
                return Result<int, BlobError>(0);
            });
        }
        // keeps the second worker busy, its future still held at exit
        auto held = pool.spawn_blocking([]() {
            std::this_thread::sleep_for(std::chrono::seconds(3));
            return Result<int, BlobError>(0);
        });
        (void)held;

        while (!started)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));

        exit(0);
    }

    int status = 0;
    assert(waitpid(pid, &status, 0) == pid);
    assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);

    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(elapsed < std::chrono::seconds(2));
}

void main_pool() {
    test_concurrent_jobs();
    test_queueing();
    test_panic_isolation();
    test_worker_threads();

    // before anything builds the global pool in this process
    test_global_pool_exit();
    test_global_pool();

    printf("SUCCESSFUL POOL \n\n");
}
