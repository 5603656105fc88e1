#pragma once
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <thread>

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do                                                                          \
    {                                                                           \
        if (!(cond))                                                            \
        {                                                                       \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void requireClose(const char *name, double a, double b, double tol)
{
    if (!(std::fabs(a - b) <= tol))
    {
        std::cerr << "[FAIL] " << name << ": " << a << " vs " << b << " (tol " << tol << ")\n";
        std::exit(1);
    }
}

// polls pred until it holds or the timeout runs out
template <typename Predicate>
static bool waitUntil(Predicate pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}
