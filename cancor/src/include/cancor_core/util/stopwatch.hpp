#pragma once
#include <chrono>

namespace cancor_core {
namespace util {

/*
 * Wall-clock timer that starts on construction.
 */
class Stopwatch
{
    using sw_clock_t = std::chrono::steady_clock;
    using tpt_t = std::chrono::time_point<sw_clock_t>;
    tpt_t _start;

public:
    Stopwatch():
        _start(sw_clock_t::now())
    {}

    void restart() { _start = sw_clock_t::now(); }

    /* seconds since construction or the last restart() */
    double elapsed() const
    {
        return std::chrono::duration<double>(sw_clock_t::now() - _start).count();
    }
};

} // namespace util
} // namespace cancor_core
