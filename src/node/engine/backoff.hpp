#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace engine {

// delay(attempt) = min(base * 2^attempt, max)
struct Backoff {
    using duration = std::chrono::milliseconds;
    duration base { 500 };
    duration max { 30000 };

    duration delay(uint32_t attempt) const
    {
        auto d { base };
        for (uint32_t i = 0; i < attempt && d < max; ++i)
            d *= 2;
        return std::min(d, max);
    }
};

}
