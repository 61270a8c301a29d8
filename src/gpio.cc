// SPDX-License-Identifier: Apache-2.0
// Copyright 2017-2018 Peter A. Bigot

#include <rp2040cxx/gpio.hpp>

namespace rp2040cxx {
namespace gpio {

driver::driver (regmap::bus& rb,
                unsigned int wait_iterations) :
  bus_{rb},
  wait_iterations_{wait_iterations}
{
  states_.fill(pin_state::UNCLAIMED);
}

int
driver::enable_peripheral (const regmap::peripheral& periph)
{
  if (!periph.has_reset()) {
    return 0;
  }
  regmap::clear_bits(bus_, regmap::resets::RESET, periph.reset_mask());
  return regmap::wait_until(bus_, regmap::resets::RESET_DONE.address,
                            periph.reset_mask(), wait_iterations_);
}

bool
driver::peripheral_ready (const regmap::peripheral& periph)
{
  if (!periph.has_reset()) {
    return true;
  }
  return periph.reset_mask() & regmap::read(bus_, regmap::resets::RESET_DONE);
}

int
driver::configure_ (unsigned int psel,
                    uint32_t pad_set,
                    uint32_t pad_clear)
{
  using namespace regmap;

  if (!psel_valid(psel)) {
    return error_encoded(ErrorCode::INVALID_PIN);
  }
  const uint32_t required = IO_BANK0.reset_mask() | PADS_BANK0.reset_mask();
  if (required != (required & regmap::read(bus_, resets::RESET_DONE))) {
    return error_encoded(ErrorCode::PERIPHERAL_DISABLED);
  }
  /* Order: pad, function select, then (in the caller) output
   * enable. */
  set_bits(bus_, pad(psel), pad_set);
  clear_bits(bus_, pad(psel), pad_clear);
  write(bus_, gpio_ctrl(psel), io_bank0::FUNCSEL_SIO << io_bank0::FUNCSEL_Pos);
  return 0;
}

int
driver::configure_output (unsigned int psel)
{
  using namespace regmap;

  int rc = configure_(psel, pads_bank0::IE_Msk, pads_bank0::OD_Msk);
  if (0 > rc) {
    return rc;
  }
  set_bits(bus_, sio::GPIO_OE, 1U << psel);
  states_[psel] = pin_state::OUTPUT;
  return 0;
}

int
driver::configure_input (unsigned int psel,
                         pull_type pull)
{
  using namespace regmap;

  uint32_t pad_set = pads_bank0::IE_Msk;
  uint32_t pad_clear = pads_bank0::OD_Msk;
  switch (pull) {
    case pull_type::UP:
      pad_set |= pads_bank0::PUE_Msk;
      pad_clear |= pads_bank0::PDE_Msk;
      break;
    case pull_type::DOWN:
      pad_set |= pads_bank0::PDE_Msk;
      pad_clear |= pads_bank0::PUE_Msk;
      break;
    case pull_type::NONE:
      pad_clear |= pads_bank0::PUE_Msk | pads_bank0::PDE_Msk;
      break;
  }
  int rc = configure_(psel, pad_set, pad_clear);
  if (0 > rc) {
    return rc;
  }
  clear_bits(bus_, sio::GPIO_OE, 1U << psel);
  states_[psel] = pin_state::INPUT;
  return 0;
}

int
driver::require_output_ (unsigned int psel) const
{
  if (!regmap::psel_valid(psel)) {
    return error_encoded(ErrorCode::INVALID_PIN);
  }
  if (pin_state::OUTPUT != states_[psel]) {
    return error_encoded(ErrorCode::WRONG_DIRECTION);
  }
  return 0;
}

int
driver::set_high (unsigned int psel)
{
  int rc = require_output_(psel);
  if (0 == rc) {
    regmap::set_bits(bus_, regmap::sio::GPIO_OUT, 1U << psel);
  }
  return rc;
}

int
driver::set_low (unsigned int psel)
{
  int rc = require_output_(psel);
  if (0 == rc) {
    regmap::clear_bits(bus_, regmap::sio::GPIO_OUT, 1U << psel);
  }
  return rc;
}

int
driver::toggle (unsigned int psel)
{
  int rc = is_set(psel);
  if (0 > rc) {
    return rc;
  }
  return (LEVEL_HIGH == rc) ? set_low(psel) : set_high(psel);
}

int
driver::is_set (unsigned int psel)
{
  int rc = require_output_(psel);
  if (0 > rc) {
    return rc;
  }
  const uint32_t out = regmap::read(bus_, regmap::sio::GPIO_OUT);
  return ((1U << psel) & out) ? LEVEL_HIGH : LEVEL_LOW;
}

int
driver::read (unsigned int psel)
{
  if (!regmap::psel_valid(psel)) {
    return error_encoded(ErrorCode::INVALID_PIN);
  }
  if (pin_state::UNCLAIMED == states_[psel]) {
    return error_encoded(ErrorCode::WRONG_DIRECTION);
  }
  const uint32_t in = regmap::read(bus_, regmap::sio::GPIO_IN);
  return ((1U << psel) & in) ? LEVEL_HIGH : LEVEL_LOW;
}

} // namespace gpio
} // namespace rp2040cxx
