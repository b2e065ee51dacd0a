#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <pthread.h>
#include "permits/common/utility.hpp"

struct Semaphore;

// Holds one permit for as long as it lives. Acquires (blocking) on construction, releases on destruction.
// Not copyable or movable, each acquisition is released exactly once.
struct ScopedPermit {
    explicit ScopedPermit(Semaphore& semaphore);
    ~ScopedPermit();

    ScopedPermit(const ScopedPermit&) = delete;
    ScopedPermit& operator=(const ScopedPermit&) = delete;
    ScopedPermit(ScopedPermit&&) = delete;
    ScopedPermit& operator=(ScopedPermit&&) = delete;

private:
    Semaphore& semaphore;
};

enum class ReleasePolicy {
    // Every release increments the count, even past the initial count
    Permissive,
    // Releases that would push the count past the initial count are dropped with a warning
    Strict,
};

// Counting semaphore for threads. The count is guarded by a robust mutex, blocked threads wait on a
// condition variable on the monotonic clock. Waking is notify-one with no ordering among waiters.
struct Semaphore {
    // Policy comes from semaphore.strict_release in g_config, read here.
    // Don't use this one for semaphores at namespace scope, g_config may not be constructed yet
    explicit Semaphore(u64 count);
    Semaphore(u64 count, ReleasePolicy policy);
    ~Semaphore();

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;
    Semaphore(Semaphore&&) = delete;
    Semaphore& operator=(Semaphore&&) = delete;

    // Blocks until a permit is available, then takes it
    void acquire();

    // Takes a permit only if one is available right now
    [[nodiscard]] bool tryAcquire();

    // Blocks for at most timeout. A permit that is already available is taken without waiting,
    // so a zero timeout behaves like tryAcquire
    [[nodiscard]] bool acquireTimeout(std::chrono::nanoseconds timeout);

    void release();

    [[nodiscard]] ScopedPermit lock() {
        return ScopedPermit(*this);
    }

    // Snapshots, may be stale by the time they return
    u64 getValue() const;
    u64 getWaiters() const;

    u64 getCapacity() const {
        return capacity;
    }

    ReleasePolicy getPolicy() const {
        return policy;
    }

    std::string ToString() const;

private:
    friend struct SemaphoreLock;

    const u64 capacity;
    const ReleasePolicy policy;

    mutable pthread_mutex_t mutex;
    pthread_cond_t cond;
    u64 count = 0;
    u64 waiters = 0;
};

using SharedSemaphore = std::shared_ptr<Semaphore>;

inline SharedSemaphore make_semaphore(u64 count) {
    return std::make_shared<Semaphore>(count);
}

inline SharedSemaphore make_semaphore(u64 count, ReleasePolicy policy) {
    return std::make_shared<Semaphore>(count, policy);
}

const char* print_release_policy(ReleasePolicy policy);
