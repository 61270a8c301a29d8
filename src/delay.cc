// SPDX-License-Identifier: Apache-2.0
// Copyright 2018-2019 Peter A. Bigot

#include <rp2040cxx/delay.hpp>

namespace rp2040cxx {

void
delay_iterations (unsigned int iterations)
{
  for (volatile unsigned int i = 0; i < iterations; ++i) {
    delay::observable_nop();
  }
}

void
delay_us (unsigned int dur_us,
          const delay::calibration& cal)
{
  auto iterations = cal.iterations_for_us(dur_us);
  /* Split requests that overflow the loop counter. */
  constexpr unsigned int chunk = ~0U;
  while (chunk < iterations) {
    delay_iterations(chunk);
    iterations -= chunk;
  }
  delay_iterations(static_cast<unsigned int>(iterations));
}

} // ns rp2040cxx
