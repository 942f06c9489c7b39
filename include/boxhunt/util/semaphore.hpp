#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace boxhunt {

/**
 * Counting semaphore (std::counting_semaphore is C++20).
 */
class CountingSemaphore {
public:
    explicit CountingSemaphore(size_t permits) : permits_(permits) {}

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return permits_ > 0; });
        --permits_;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++permits_;
        }
        cv_.notify_one();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t permits_;
};

// Holds one permit for the guard's lifetime
class SemaphoreGuard {
public:
    explicit SemaphoreGuard(CountingSemaphore& sem) : sem_(sem) { sem_.acquire(); }
    ~SemaphoreGuard() { sem_.release(); }

    SemaphoreGuard(const SemaphoreGuard&) = delete;
    SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;

private:
    CountingSemaphore& sem_;
};

}  // namespace boxhunt
