#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include "permits/common/log.hpp"
#include "permits/semaphore.hpp"

#define SUCCESS_MESSAGE() SUCCESS("Test passed: %s", Catch::getResultCapture().getCurrentTestName().c_str())

using namespace std::chrono_literals;

static_assert(!std::is_copy_constructible_v<ScopedPermit>);
static_assert(!std::is_copy_assignable_v<ScopedPermit>);
static_assert(!std::is_move_constructible_v<ScopedPermit>);
static_assert(!std::is_move_assignable_v<ScopedPermit>);
static_assert(!std::is_default_constructible_v<ScopedPermit>);

namespace {
bool useWithEarlyReturn(Semaphore& semaphore, bool bail) {
    ScopedPermit permit(semaphore);
    if (bail) {
        return false;
    }
    return semaphore.getValue() == 0;
}

void useAndThrow(Semaphore& semaphore) {
    auto permit = semaphore.lock();
    throw std::runtime_error("work failed");
}
} // namespace

CATCH_TEST_CASE("ReleasedOnScopeExit", "[scoped_permit]") {
    Semaphore semaphore(1);
    {
        ScopedPermit permit(semaphore);
        CATCH_REQUIRE(semaphore.getValue() == 0);
    }
    CATCH_REQUIRE(semaphore.getValue() == 1);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("LockReturnsPermit", "[scoped_permit]") {
    Semaphore semaphore(2);
    {
        auto first = semaphore.lock();
        CATCH_REQUIRE(semaphore.getValue() == 1);
        {
            auto second = semaphore.lock();
            CATCH_REQUIRE(semaphore.getValue() == 0);
            CATCH_REQUIRE(!semaphore.tryAcquire());
        }
        CATCH_REQUIRE(semaphore.getValue() == 1);
    }
    CATCH_REQUIRE(semaphore.getValue() == 2);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("ReleasedOnEarlyReturn", "[scoped_permit]") {
    Semaphore semaphore(1);
    CATCH_REQUIRE(!useWithEarlyReturn(semaphore, true));
    CATCH_REQUIRE(semaphore.getValue() == 1);
    CATCH_REQUIRE(useWithEarlyReturn(semaphore, false));
    CATCH_REQUIRE(semaphore.getValue() == 1);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("ReleasedOnException", "[scoped_permit]") {
    Semaphore semaphore(1);
    CATCH_REQUIRE_THROWS_AS(useAndThrow(semaphore), std::runtime_error);
    CATCH_REQUIRE(semaphore.getValue() == 1);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("BlocksUntilAvailable", "[scoped_permit]") {
    Semaphore semaphore(1);
    std::atomic_bool entered = false;
    std::optional<std::thread> waiter;

    {
        ScopedPermit permit(semaphore);
        waiter.emplace([&] {
            ScopedPermit inner(semaphore);
            entered = true;
        });

        auto deadline = std::chrono::steady_clock::now() + 10s;
        while (semaphore.getWaiters() != 1 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        CATCH_REQUIRE(semaphore.getWaiters() == 1);
        CATCH_REQUIRE(!entered.load());
    }

    waiter->join();
    CATCH_REQUIRE(entered.load());
    CATCH_REQUIRE(semaphore.getValue() == 1);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("PermitsBoundConcurrency", "[scoped_permit]") {
    constexpr u64 capacity = 2;
    Semaphore semaphore(capacity);
    std::atomic<u64> holders = 0;
    std::atomic<u64> max_holders = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 6; t++) {
        threads.emplace_back([&] {
            for (int i = 0; i < 500; i++) {
                auto permit = semaphore.lock();
                u64 now = ++holders;
                u64 seen = max_holders;
                while (now > seen && !max_holders.compare_exchange_weak(seen, now)) {
                }
                holders--;
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    CATCH_REQUIRE(max_holders.load() <= capacity);
    CATCH_REQUIRE(semaphore.getValue() == capacity);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("PermitOnSharedSemaphore", "[scoped_permit]") {
    SharedSemaphore semaphore = make_semaphore(1);
    {
        ScopedPermit permit(*semaphore);
        CATCH_REQUIRE(semaphore->getValue() == 0);
    }
    CATCH_REQUIRE(semaphore->getValue() == 1);
    SUCCESS_MESSAGE();
}
