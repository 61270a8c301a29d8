// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2018-2019 Peter A. Bigot

/** Run the blink sequence against the faked register bus.
 *
 * This shows the register traffic the GPIO driver generates for board
 * initialization, LED configuration, and a few LED transitions,
 * followed by the level read back through `GPIO_IN`. */

#include <cinttypes>

#include <rp2040cxx/board.hpp>
#include <rp2040cxx/console/cstdio.hpp>
#include <rp2040cxx/delay.hpp>
#include <rp2040cxx/faked/bus.hpp>
#include <rp2040cxx/led.hpp>

namespace {

void
dump_writes (const rp2040cxx::faked::bus& bus)
{
  for (const auto& w : bus.writes()) {
    cprintf("  [%08" PRIxPTR "] <= %08" PRIx32 "\n", w.address, w.value);
  }
}

} // ns anonymous

int
main (void)
{
  using namespace rp2040cxx;

  csetvbuf();

  faked::bus bus;
  bus.set_reset_latency(3);
  gpio::driver drv{bus, 16};

  int rc = board::initialize(drv);
  cprintf("board initialize: %d (%s)\n", rc, error_text(rc));
  dump_writes(bus);
  if (0 > rc) {
    return 1;
  }

  gpio::gpio_pin ledpin{drv, RP2040CXX_BOARD_PSEL_LED0};
  led::generic_led<board::led_active_low> led0{ledpin};

  bus.clear_log();
  rc = led0.enable();
  cprintf("LED enable: %d (%s)\n", rc, error_text(rc));
  dump_writes(bus);
  if (0 > rc) {
    return 1;
  }

  for (unsigned int i = 0; i < 4; ++i) {
    bus.clear_log();
    rc = led0.toggle();
    if (0 > rc) {
      cprintf("toggle failed: %s\n", error_text(rc));
      return 1;
    }
    delay_us(1000);
    cprintf("toggle %u: LED %s, GPIO%d reads %d\n", i,
            led0.is_on() ? "on" : "off",
            RP2040CXX_BOARD_PSEL_LED0,
            drv.read(RP2040CXX_BOARD_PSEL_LED0));
    dump_writes(bus);
  }

  rc = drv.set_high(RP2040CXX_BOARD_PSEL_BUTTON0);
  cprintf("set_high on unclaimed pin: %d (%s)\n", rc, error_text(rc));
  rc = drv.configure_output(regmap::GPIO_PSEL_COUNT);
  cprintf("configure_output(%u): %d (%s)\n", regmap::GPIO_PSEL_COUNT, rc, error_text(rc));
  return 0;
}
