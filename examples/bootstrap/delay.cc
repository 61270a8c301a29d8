// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2018-2019 Peter A. Bigot

/** Test core delay function.
 *
 * Use this with a logic analyzer on SCOPE0 to measure the actual
 * duration of each requested delay.  The ratio of measured to
 * requested duration gives the correction to apply to
 * delay::DEFAULT_CYCLES_PER_ITERATION for the running clock. */

#include <rp2040cxx/board.hpp>
#include <rp2040cxx/delay.hpp>
#include <rp2040cxx/gpio.hpp>

int
main (void)
{
  using namespace rp2040cxx;

  const unsigned int dur_us[] = {
    0, 1, 2, 5, 8, 16, 32,
    64, 100, 128, 250, 256, 500, 512, 1000, 1024,
    10'000, 100'000, 1'000'000,
  };
  auto dp = dur_us;
  auto const dpe = dp + sizeof(dur_us)/sizeof(*dur_us);

  regmap::mmio_bus mmio;
  gpio::driver gpio{mmio};
  if (0 > board::initialize(gpio)) {
    failsafe(FailSafeCode::BOARD_INIT_FAILURE);
  }

  gpio::gpio_pin scope{gpio, RP2040CXX_BOARD_PSEL_SCOPE0};
  gpio::active_signal<true> marker{scope};
  if (0 > marker.enable()) {
    failsafe(FailSafeCode::INCOMPLETE_SETUP);
  }
  if ((0 > marker.activate())
      || (0 > marker.deactivate())) {
    failsafe(FailSafeCode::INCOMPLETE_SETUP);
  }

  // Nominal 10 ms delay to differentiate the trigger from the delays.
  delay_us(10'000);

  while (dp < dpe) {
    {
      auto active = marker.make_scoped();
      delay_us(*dp);
    }
    delay_us(100);
    ++dp;
  }
  while (true) {
    delay::observable_nop();
  }
}
