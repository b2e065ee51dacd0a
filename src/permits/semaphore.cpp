#include <cerrno>
#include <cstring>
#include <ctime>
#include <fmt/format.h>
#include "permits/common/config.hpp"
#include "permits/common/log.hpp"
#include "permits/semaphore.hpp"

namespace {
constexpr i64 nanoseconds_per_second = 1'000'000'000;

void check_lock_result(int result, const char* operation) {
    if (result == EOWNERDEAD || result == ENOTRECOVERABLE) {
        ERROR("A thread died while holding a semaphore lock (%s), its count can no longer be trusted", operation);
    } else if (result != 0) {
        ERROR("Semaphore %s failed. Error: %s", operation, strerror(result));
    }
}

// Absolute CLOCK_MONOTONIC time, matching the clock the condition variable was created with
timespec deadline_after(std::chrono::nanoseconds timeout) {
    timespec now{};
    if (clock_gettime(CLOCK_MONOTONIC, &now) != 0) {
        ERROR("Failed to read the monotonic clock. Error: %s", strerror(errno));
    }

    i64 ns = timeout.count() > 0 ? timeout.count() : 0;
    i64 nsec = now.tv_nsec + ns % nanoseconds_per_second;

    timespec deadline{};
    deadline.tv_sec = now.tv_sec + ns / nanoseconds_per_second + nsec / nanoseconds_per_second;
    deadline.tv_nsec = nsec % nanoseconds_per_second;
    return deadline;
}
} // namespace

// Holds the semaphore's internal mutex for a scope
struct SemaphoreLock {
    explicit SemaphoreLock(const Semaphore& semaphore) : mutex(&semaphore.mutex) {
        check_lock_result(pthread_mutex_lock(mutex), "lock");
    }

    ~SemaphoreLock() {
        int result = pthread_mutex_unlock(mutex);
        if (result != 0) {
            ERROR("Failed to unlock semaphore mutex. Error: %s", strerror(result));
        }
    }

    SemaphoreLock(const SemaphoreLock&) = delete;
    SemaphoreLock& operator=(const SemaphoreLock&) = delete;

private:
    pthread_mutex_t* mutex;
};

ScopedPermit::ScopedPermit(Semaphore& semaphore) : semaphore(semaphore) {
    semaphore.acquire();
}

ScopedPermit::~ScopedPermit() {
    semaphore.release();
}

Semaphore::Semaphore(u64 count) : Semaphore(count, g_config.strict_release ? ReleasePolicy::Strict : ReleasePolicy::Permissive) {}

Semaphore::Semaphore(u64 count, ReleasePolicy policy) : capacity(count), policy(policy), count(count) {
    pthread_mutexattr_t mutex_attr;
    int result = pthread_mutexattr_init(&mutex_attr);
    if (result != 0) {
        ERROR("Failed to initialize semaphore mutex attributes. Error: %s", strerror(result));
    }

    // Robust, so a holder dying mid critical section shows up as EOWNERDEAD instead of a silent deadlock
    result = pthread_mutexattr_setrobust(&mutex_attr, PTHREAD_MUTEX_ROBUST);
    if (result != 0) {
        ERROR("Failed to make semaphore mutex robust. Error: %s", strerror(result));
    }

    result = pthread_mutex_init(&mutex, &mutex_attr);
    if (result != 0) {
        ERROR("Failed to initialize semaphore mutex. Error: %s", strerror(result));
    }
    pthread_mutexattr_destroy(&mutex_attr);

    pthread_condattr_t cond_attr;
    result = pthread_condattr_init(&cond_attr);
    if (result != 0) {
        ERROR("Failed to initialize semaphore condition variable attributes. Error: %s", strerror(result));
    }

    // Timed waits must not jump when someone changes the wall clock
    result = pthread_condattr_setclock(&cond_attr, CLOCK_MONOTONIC);
    if (result != 0) {
        ERROR("Failed to set semaphore condition variable clock. Error: %s", strerror(result));
    }

    result = pthread_cond_init(&cond, &cond_attr);
    if (result != 0) {
        ERROR("Failed to initialize semaphore condition variable. Error: %s", strerror(result));
    }
    pthread_condattr_destroy(&cond_attr);
}

Semaphore::~Semaphore() {
    int result = pthread_cond_destroy(&cond);
    if (result != 0) {
        WARN("Failed to destroy semaphore condition variable. Error: %s", strerror(result));
    }

    result = pthread_mutex_destroy(&mutex);
    if (result != 0) {
        WARN("Failed to destroy semaphore mutex. Error: %s", strerror(result));
    }
}

void Semaphore::acquire() {
    auto start = std::chrono::steady_clock::now();
    bool blocked = false;

    {
        SemaphoreLock guard(*this);
        if (count == 0) {
            blocked = true;
            waiters++;
            // Woken up doesn't mean we got it, the wakeup may be spurious or someone else may have taken the permit first
            while (count == 0) {
                check_lock_result(pthread_cond_wait(&cond, &mutex), "wait");
            }
            waiters--;
        }
        count--;
    }

    if (blocked) {
        u64 waited_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
        VERBOSE("Blocked for %lu ms on semaphore %p", waited_ms, (void*)this);
        if (g_config.slow_acquire_ms != 0 && waited_ms >= g_config.slow_acquire_ms) {
            WARN("Waited %lu ms to acquire semaphore %p (capacity %lu)", waited_ms, (void*)this, capacity);
        }
    }
}

bool Semaphore::tryAcquire() {
    SemaphoreLock guard(*this);
    if (count == 0) {
        return false;
    }

    count--;
    return true;
}

bool Semaphore::acquireTimeout(std::chrono::nanoseconds timeout) {
    // The whole budget is measured from here, every re-wait uses the same deadline
    timespec deadline = deadline_after(timeout);
    bool acquired = false;

    {
        SemaphoreLock guard(*this);
        if (count == 0 && timeout.count() > 0) {
            waiters++;
            while (count == 0) {
                int result = pthread_cond_timedwait(&cond, &mutex, &deadline);
                if (result == ETIMEDOUT) {
                    break;
                }
                check_lock_result(result, "timed wait");
            }
            waiters--;
        }

        // Also covers a permit that showed up right as the deadline passed
        if (count > 0) {
            count--;
            acquired = true;
        }
    }

    if (!acquired) {
        VERBOSE("Timed out after %ld ns waiting on semaphore %p", (long)timeout.count(), (void*)this);
    }
    return acquired;
}

void Semaphore::release() {
    bool dropped = false;

    {
        SemaphoreLock guard(*this);
        if (policy == ReleasePolicy::Strict && count >= capacity) {
            dropped = true;
        } else {
            ASSERT_MSG(count != UINT64_MAX, "Semaphore %p count overflowed", (void*)this);
            count++;
            int result = pthread_cond_signal(&cond);
            if (result != 0) {
                ERROR("Failed to signal semaphore condition variable. Error: %s", strerror(result));
            }
        }
    }

    if (dropped) {
        WARN("Ignoring release of semaphore %p, it already holds its full capacity of %lu", (void*)this, capacity);
    }
}

u64 Semaphore::getValue() const {
    SemaphoreLock guard(*this);
    return count;
}

u64 Semaphore::getWaiters() const {
    SemaphoreLock guard(*this);
    return waiters;
}

std::string Semaphore::ToString() const {
    u64 value, waiting;
    {
        SemaphoreLock guard(*this);
        value = count;
        waiting = waiters;
    }

    return fmt::format("Semaphore {{ value: {}, capacity: {}, waiters: {}, policy: {} }}", value, capacity, waiting, print_release_policy(policy));
}

const char* print_release_policy(ReleasePolicy policy) {
    switch (policy) {
    case ReleasePolicy::Permissive:
        return "permissive";
    case ReleasePolicy::Strict:
        return "strict";
    }

    UNREACHABLE();
    return "";
}
