#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <date/date.h>

// Wall clock that can be pinned, so a saved document renders reproducibly.
class VirtualClock
{
public:
    static void set(date::sys_seconds t)
    {
        value.store(std::chrono::system_clock::to_time_t(t), std::memory_order_relaxed);
        enabled.store(true, std::memory_order_relaxed);
    }

    static void disable()
    {
        enabled.store(false, std::memory_order_relaxed);
    }

    static date::sys_seconds now()
    {
        std::time_t t = enabled.load(std::memory_order_relaxed)
                      ? value.load(std::memory_order_relaxed)
                      : std::time(nullptr);
        return date::floor<std::chrono::seconds>(std::chrono::system_clock::from_time_t(t));
    }

private:
    static inline std::atomic<bool> enabled{false};
    static inline std::atomic<std::time_t> value{0};
};
