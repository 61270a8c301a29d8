/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2018-2019 Peter A. Bigot */

/** Calibrated busy-wait delays.
 *
 * The delay is a counted software loop.  Its duration depends on the
 * core clock and on the number of cycles each iteration consumes,
 * both of which are exposed through delay::calibration so the
 * imprecision is visible to the caller.  Where accurate timing is
 * required use a hardware timer instead.
 *
 * @file */

#ifndef RP2040CXX_DELAY_HPP
#define RP2040CXX_DELAY_HPP
#pragma once

#include <rp2040cxx/core.hpp>

namespace rp2040cxx {

/** Support for busy-wait delays */
namespace delay {

/** Core clock assumed before the clock tree is configured (12 MHz
 * crystal reference, PLLs off). */
constexpr unsigned int DEFAULT_CLOCK_Hz = 12000000;

/** Empirically determined cost of one delay_iterations() pass on the
 * Cortex-M0+. */
constexpr unsigned int DEFAULT_CYCLES_PER_ITERATION = 5;

/** Conversion between loop iterations and elapsed time.
 *
 * `duration = iterations * cycles_per_iteration / clock_Hz` */
struct calibration
{
  /** The core clock frequency in Hz. */
  unsigned int clock_Hz;

  /** Processor cycles consumed by one loop iteration. */
  unsigned int cycles_per_iteration;

  /** Approximate duration of @p iterations loop passes, in
   * nanoseconds. */
  constexpr uint64_t duration_ns (uint64_t iterations) const
  {
    uint64_t cycles = iterations * cycles_per_iteration;
    return (cycles / clock_Hz) * 1000000000ULL
      + ((cycles % clock_Hz) * 1000000000ULL) / clock_Hz;
  }

  /** Number of loop passes needed for at least @p dur_us
   * microseconds. */
  constexpr uint64_t iterations_for_us (uint64_t dur_us) const
  {
    return (dur_us * clock_Hz + 1000000ULL * cycles_per_iteration - 1)
      / (1000000ULL * cycles_per_iteration);
  }
};

/** Calibration for an unconfigured RP2040 running from cold boot. */
constexpr calibration DEFAULT_CALIBRATION{DEFAULT_CLOCK_Hz, DEFAULT_CYCLES_PER_ITERATION};

/** Emit an operation the optimizer is forbidden to remove. */
inline void __attribute__((__always_inline__))
observable_nop ()
{
  __asm__ volatile ("nop" ::: "memory");
}

} // ns delay

/** Spin for a fixed number of loop iterations.
 *
 * Each iteration performs a delay::observable_nop() and advances a
 * volatile counter, so the loop cannot be elided.  There is no
 * cancellation.
 *
 * @param iterations the number of loop passes. */
void delay_iterations (unsigned int iterations);

/** Spin for approximately the specified duration.
 *
 * @param dur_us the time to delay, in microseconds
 *
 * @param cal the calibration describing the current core clock. */
void delay_us (unsigned int dur_us,
               const delay::calibration& cal = delay::DEFAULT_CALIBRATION);

} // ns rp2040cxx

#endif /* RP2040CXX_DELAY_HPP */
