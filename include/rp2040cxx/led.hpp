/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Core LED functionality
 *
 * @file */

#ifndef RP2040CXX_LED_HPP
#define RP2040CXX_LED_HPP
#pragma once

#include <rp2040cxx/gpio.hpp>

namespace rp2040cxx {

/** Abstractions and constants around LED capability */
namespace led {

/** Base class supporting LEDs of different types.
 *
 * Instances of this class itself are stubs that do nothing, so
 * applications can hold an LED reference on boards that lack one
 * without error handling code. */
class led_type
{
public:
  led_type () = default;
  virtual ~led_type () = default;

  /* You can't copy, assign, or move LEDs. */
  led_type (const led_type&) = delete;
  led_type& operator= (const led_type&) = delete;
  led_type (led_type&&) = delete;
  led_type& operator= (led_type&&) = delete;

  /** Indicate whether the referenced LED exists
   *
   * This should return @c false only for stub LED instances. */
  virtual bool exists (void) const
  {
    return false;
  }

  /** Configure the GPIO associated with the LED to drive the LED.
   *
   * The LED begins in the off state.
   *
   * @return as with gpio::driver::configure_output(). */
  int enable (void)
  {
    int rc = enable_();
    if (0 <= rc) {
      rc = off();
    }
    return rc;
  }

  /** Release the GPIO associated with the LED.
   *
   * The pin is reconfigured as an input. */
  int disable (void)
  {
    return disable_();
  }

  /** Set the LED to a specific state.
   *
   * @param v If zero the LED is turned off; if positive the LED is
   * turned on; if negative the LED changes state (off to on or on to
   * off). */
  int set (int v)
  {
    if (0 < v) {
      return on();
    }
    if (0 == v) {
      return off();
    }
    return toggle();
  }

  /** Turn the LED off. */
  virtual int off (void)
  {
    return 0;
  }

  /** Turn the LED on. */
  virtual int on (void)
  {
    return 0;
  }

  /** Toggle the LED state.
   *
   * @note Subclasses need override this only if toggling can be
   * performed more efficiently than by invoking is_on() and selecting
   * between off() and on(). */
  virtual int toggle (void)
  {
    if (is_on()) {
      return off();
    }
    return on();
  }

  /** Read the LED.
   *
   * @return `true` iff the LED is active. */
  virtual bool is_on (void)
  {
    return false;
  }

protected:
  virtual int enable_ ()
  {
    return 0;
  }

  virtual int disable_ ()
  {
    return 0;
  }
};

/** A class used to manage LEDs.
 *
 * This implements the functions of led_type using a
 * gpio::generic_pin.
 *
 * @tparam active_low a bool value indicating whether the LED is lit
 * when the signal is low (@c true) or when the signal is high (@c
 * false).  The Raspberry Pi Pico LED is active high. */
template <bool active_low = false>
class generic_led : public led_type
{
public:
  /** Create an LED instance that is bound to a generic GPIO pin.
   *
   * @param pin the GPIO pin that controls the LED.  A reference to
   * this is retained by the generic_led instance. */
  explicit generic_led (gpio::generic_pin& pin) :
    pin_{pin}
  { }

  bool exists (void) const override
  {
    return pin_.valid();
  }

  int off (void) override
  {
    if constexpr (active_low) {
      return pin_.set();
    } else {
      return pin_.clear();
    }
  }

  int on (void) override
  {
    if constexpr (active_low) {
      return pin_.clear();
    } else {
      return pin_.set();
    }
  }

  int toggle (void) override
  {
    return pin_.toggle();
  }

  bool is_on (void) override
  {
    if (!pin_.valid()) {
      return false;
    }
    int rc = pin_.is_set();
    if (0 > rc) {
      return false;
    }
    return active_low != (gpio::LEVEL_HIGH == rc);
  }

private:
  gpio::generic_pin& pin_;

  int enable_ (void) override
  {
    return pin_.configure_output();
  }

  int disable_ (void) override
  {
    return pin_.configure_input();
  }
};

} // namespace led
} // namespace rp2040cxx

#endif /* RP2040CXX_LED_HPP */
