// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2015-2019 Peter A. Bigot

/** Light the board LED while BUTTON0 is pressed.
 *
 * The button is sampled every 10 ms so contact bounce is not
 * visible. */

#include <rp2040cxx/board.hpp>
#include <rp2040cxx/console/null.hpp>
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

  gpio::gpio_pin button{gpio, RP2040CXX_BOARD_PSEL_BUTTON0};
  gpio::gpio_pin ledpin{gpio, RP2040CXX_BOARD_PSEL_LED0};
  led::generic_led<board::led_active_low> led0{ledpin};

  auto pull = board::button_active_low ? gpio::pull_type::UP : gpio::pull_type::DOWN;
  if ((0 > button.configure_input(pull))
      || (0 > led0.enable())) {
    failsafe(FailSafeCode::INCOMPLETE_SETUP);
  }
  cputs("button: running");
  bool was_pressed = false;
  while (true) {
    int level = button.read();
    if (0 > level) {
      failsafe(FailSafeCode::EVENT_LOOP_TERMINATED);
    }
    bool pressed = board::button_active_low ? (gpio::LEVEL_LOW == level) : (gpio::LEVEL_HIGH == level);
    if (pressed != was_pressed) {
      cprintf("button %s\n", pressed ? "pressed" : "released");
      was_pressed = pressed;
    }
    if (0 > led0.set(pressed)) {
      failsafe(FailSafeCode::EVENT_LOOP_TERMINATED);
    }
    delay_us(10000);
  }
}
