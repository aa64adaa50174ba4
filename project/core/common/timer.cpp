#include "timer.hpp"
#include "log.hpp"

ScopedTimer::ScopedTimer(const char* name)
    : name_(name), t0_(std::chrono::high_resolution_clock::now())
{
}

ScopedTimer::~ScopedTimer()
{
    logging::app()->debug("{} took {:.3f} ms", name_, elapsed_ms());
}

double ScopedTimer::elapsed_ms() const
{
    const auto t1 = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(t1 - t0_).count();
}
