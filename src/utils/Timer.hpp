#pragma once

#include <chrono>
#include <cstdint>
#include "Logging.hpp"

namespace vat
{

// Wall clock of a single bake pass.
class Timer
{
public:
    Timer()
    : m_StartTimePoint(std::chrono::steady_clock::now())
    {
    }

    int64_t GetElapsedMilliseconds() const
    {
        auto currentTimePoint = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(currentTimePoint - m_StartTimePoint).count();
    }

    void LogElapsed(const char* label) const
    {
        LOG_INFO("%s finished in %lld ms", label, static_cast<long long>(GetElapsedMilliseconds()));
    }

private:
    std::chrono::steady_clock::time_point m_StartTimePoint;
};

}
