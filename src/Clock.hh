// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef CLOCK_H_
#define CLOCK_H_

#include <stdint.h>

#include <chrono>

/** @brief Monotonic clock used to timestamp locally generated events */
using MonoClock = std::chrono::steady_clock;

/** @brief Wall clock */
using WallClock = std::chrono::system_clock;

/** @brief Number of nanoseconds in a second */
constexpr uint64_t kNanosecondsPerSecond = 1000000000ull;

/** @brief Convert a monotonic time point to seconds relative to a start time */
inline double sinceStart(const MonoClock::time_point &t,
                         const MonoClock::time_point &t_start)
{
    return std::chrono::duration<double>(t - t_start).count();
}

#endif /* CLOCK_H_ */
