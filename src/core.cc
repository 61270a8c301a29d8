// SPDX-License-Identifier: Apache-2.0
// Copyright 2018-2019 Peter A. Bigot

#include <rp2040cxx/delay.hpp>
#include <rp2040cxx/gpio.hpp>

namespace rp2040cxx {

namespace {

/* Inspect with a debugger after a failsafe halt. */
volatile unsigned int failsafe_code_;

} // ns anonymous

const char*
error_text (int rc)
{
  switch (error_decoded(rc)) {
    case ErrorCode::NONE:
      return "success";
    case ErrorCode::INVALID_PIN:
      return "invalid pin";
    case ErrorCode::PERIPHERAL_TIMEOUT:
      return "peripheral timeout";
    case ErrorCode::WRONG_DIRECTION:
      return "wrong direction";
    case ErrorCode::PERIPHERAL_DISABLED:
      return "peripheral disabled";
  }
  return "unknown error";
}

void
failsafe (FailSafeCode code)
{
  failsafe(static_cast<unsigned int>(code));
}

void
failsafe (unsigned int code)
{
  primask mutex;
  failsafe_code_ = code;
  while (true) {
    delay::observable_nop();
  }
}

unsigned int
failsafe_code ()
{
  return failsafe_code_;
}

namespace board {

__attribute__((__weak__))
int
initialize (gpio::driver& gpio)
{
  int rc = gpio.enable_peripheral(regmap::IO_BANK0);
  if (0 <= rc) {
    rc = gpio.enable_peripheral(regmap::PADS_BANK0);
  }
  return rc;
}

} // ns board
} // ns rp2040cxx
