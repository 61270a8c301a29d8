// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2015-2019 Peter A. Bigot

/** Blink the board LED at about 2 Hz using the busy-wait delay. */

#include <rp2040cxx/board.hpp>
#include <rp2040cxx/delay.hpp>
#include <rp2040cxx/led.hpp>

int
main (void)
{
  using namespace rp2040cxx;

  regmap::mmio_bus mmio;
  gpio::driver gpio{mmio};
  if (0 > board::initialize(gpio)) {
    failsafe(FailSafeCode::BOARD_INIT_FAILURE);
  }

  gpio::gpio_pin ledpin{gpio, RP2040CXX_BOARD_PSEL_LED0};
  led::generic_led<board::led_active_low> led0{ledpin};
  if (0 > led0.enable()) {
    failsafe(FailSafeCode::INCOMPLETE_SETUP);
  }
  while (true) {
    if (0 > led0.toggle()) {
      failsafe(FailSafeCode::EVENT_LOOP_TERMINATED);
    }
    delay_us(250000);
  }
}
