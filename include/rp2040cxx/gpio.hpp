/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Core GPIO functionality.
 *
 * @file */
#ifndef RP2040CXX_GPIO_HPP
#define RP2040CXX_GPIO_HPP
#pragma once

#include <array>

#include <rp2040cxx/regmap.hpp>

namespace rp2040cxx {

/** Abstractions and constants around GPIO capability */
namespace gpio {

/** Logic level observed at or driven onto a pin.
 *
 * The values are those returned by driver::read(). */
enum level_type : int
{
  LEVEL_LOW = 0,
  LEVEL_HIGH = 1,
};

/** Configuration state of a pin as tracked by the driver. */
enum class pin_state : uint8_t
{
  /** The driver has not configured the pin. */
  UNCLAIMED,

  /** The pin is attached to SIO with its output driver enabled. */
  OUTPUT,

  /** The pin is attached to SIO with its output driver disabled. */
  INPUT,
};

/** Pad pull resistor selection for input pins. */
enum class pull_type : uint8_t
{
  NONE,
  UP,
  DOWN,
};

/** Driver for the user bank GPIOs.
 *
 * The driver attaches pins to the single-cycle I/O block and controls
 * them through it.  It owns the configuration of every pin it has
 * configured for the lifetime of the program: no other code should
 * write the control, pad, or output-enable registers of those pins.
 * There is no pin teardown.
 *
 * All operations are synchronous.  Those that can fail return a
 * non-negative value on success and a negative @link error_encoded
 * encoded error@endlink otherwise; failures are detected before any
 * register is written.  The driver never retries.
 *
 * @note `IO_BANK0` and `PADS_BANK0` start in reset.
 * enable_peripheral() must be invoked for both (board::initialize()
 * does this) before any pin is configured. */
class driver
{
public:
  /** Construct the driver.
   *
   * @param rb the register bus through which all peripheral access
   * is performed.  A reference is retained.
   *
   * @param wait_iterations the bound passed to regmap::wait_until()
   * when waiting for a peripheral to leave reset. */
  explicit driver (regmap::bus& rb,
                   unsigned int wait_iterations = regmap::DEFAULT_WAIT_ITERATIONS);

  /* Pin ownership cannot be duplicated. */
  driver (const driver&) = delete;
  driver& operator= (const driver&) = delete;
  driver (driver&&) = delete;
  driver& operator= (driver&&) = delete;

  /** Release a peripheral from reset.
   *
   * The peripheral's bit in `RESETS.RESET` is cleared and its bit in
   * `RESETS.RESET_DONE` is polled until set.  Peripherals that are not
   * reset-controlled succeed immediately with no register access.
   *
   * @return zero on success, or ErrorCode::PERIPHERAL_TIMEOUT if
   * readiness was not observed within the driver's polling bound. */
  int enable_peripheral (const regmap::peripheral& periph);

  /** Indicate whether a peripheral has left reset.
   *
   * This reads `RESETS.RESET_DONE`. */
  bool peripheral_ready (const regmap::peripheral& periph);

  /** Configure a pin as an output.
   *
   * The pad is set to enable input and output, the pin's function is
   * set to SIO, and then its output enable is set.  The output value
   * is not changed.  Re-configuring a pin repeats the same writes.
   *
   * @return zero on success, ErrorCode::INVALID_PIN, or
   * ErrorCode::PERIPHERAL_DISABLED. */
  int configure_output (unsigned int psel);

  /** Configure a pin as an input.
   *
   * The pad is set to enable input with the requested pull, the
   * pin's function is set to SIO, and then its output enable is
   * cleared.
   *
   * @return as with configure_output(). */
  int configure_input (unsigned int psel,
                       pull_type pull = pull_type::NONE);

  /** Drive an output pin high.
   *
   * @return zero on success, ErrorCode::INVALID_PIN, or
   * ErrorCode::WRONG_DIRECTION if the pin is not configured as an
   * output. */
  int set_high (unsigned int psel);

  /** Drive an output pin low.
   *
   * @return as with set_high(). */
  int set_low (unsigned int psel);

  /** Drive an output pin to a specific state.
   *
   * @return as with set_high(). */
  int set (unsigned int psel,
           bool high)
  {
    return high ? set_high(psel) : set_low(psel);
  }

  /** Invert the drive state of an output pin.
   *
   * @return as with set_high(). */
  int toggle (unsigned int psel);

  /** Read the input signal observed at a configured pin.
   *
   * Output pins may be read back.
   *
   * @return #LEVEL_HIGH or #LEVEL_LOW, ErrorCode::INVALID_PIN, or
   * ErrorCode::WRONG_DIRECTION if the pin is unclaimed. */
  int read (unsigned int psel);

  /** Read the output latch of an output pin.
   *
   * @return as with read(), except that the pin must be configured as
   * an output. */
  int is_set (unsigned int psel);

  /** Return the configuration state of a pin.
   *
   * Invalid pins are reported as pin_state::UNCLAIMED. */
  pin_state state (unsigned int psel) const
  {
    return regmap::psel_valid(psel) ? states_[psel] : pin_state::UNCLAIMED;
  }

  /** Access the register bus used by the driver. */
  regmap::bus& bus () const
  {
    return bus_;
  }

private:
  int configure_ (unsigned int psel,
                  uint32_t pad_set,
                  uint32_t pad_clear);
  int require_output_ (unsigned int psel) const;

  regmap::bus& bus_;
  unsigned int const wait_iterations_;
  std::array<pin_state, regmap::GPIO_PSEL_COUNT> states_;
};

/** Class supporting a generic GPIO pin interface.
 *
 * The gpio_pin class requires a valid GPIO pin, making it unsuitable
 * for applications where a signal may not be connected on the board
 * (e.g. where `RESETn` is pulled high in hardware).
 *
 * This class provides a generic API for pins, and does nothing in the
 * base class.  Subclasses can be implemented that delegate to the
 * driver, or to an external GPIO extender, allowing a common API in
 * re-usable code without assumptions about hardware configuration.
 *
 * Methods return values as with the corresponding driver methods. */
class generic_pin
{
public:
  generic_pin () = default;
  virtual ~generic_pin () = default;

  /** Indicate whether the pin is functional.
   *
   * Base class returns `false`.  Subclasses should override to return
   * `true` in cases where invoking the other methods provides or
   * affects pin state. */
  virtual bool valid () const
  {
    return false;
  }

  /** Configure the pin as an output. */
  virtual int configure_output ()
  {
    return 0;
  }

  /** Configure the pin as an input. */
  virtual int configure_input (pull_type pull = pull_type::NONE)
  {
    return 0;
  }

  /** Set the pin to drive the output high. */
  virtual int set ()
  {
    return 0;
  }

  /** Set the pin to drive the output low. */
  virtual int clear ()
  {
    return 0;
  }

  /** Toggle the pin drive state. */
  virtual int toggle ()
  {
    return 0;
  }

  /** Return the input signal observed at the pin. */
  virtual int read ()
  {
    return LEVEL_LOW;
  }

  /** Return #LEVEL_HIGH iff the pin is configured to drive the output
   * high. */
  virtual int is_set ()
  {
    return LEVEL_LOW;
  }
};

/** Extension of generic_pin controlled by the GPIO driver. */
class gpio_pin : public generic_pin
{
public:
  /** Construct the instance.
   *
   * @param gpio the driver that owns the pin.  A reference is
   * retained.
   *
   * @param psel the pin to control.  This is validated by each
   * operation, not here. */
  gpio_pin (driver& gpio,
            unsigned int psel) :
    gpio_{gpio},
    psel_{psel}
  { }

  /** The pin controlled by this instance. */
  unsigned int psel () const
  {
    return psel_;
  }

  bool valid () const override
  {
    return regmap::psel_valid(psel_);
  }

  int configure_output () override
  {
    return gpio_.configure_output(psel_);
  }

  int configure_input (pull_type pull = pull_type::NONE) override
  {
    return gpio_.configure_input(psel_, pull);
  }

  int set () override
  {
    return gpio_.set_high(psel_);
  }

  int clear () override
  {
    return gpio_.set_low(psel_);
  }

  int toggle () override
  {
    return gpio_.toggle(psel_);
  }

  int read () override
  {
    return gpio_.read(psel_);
  }

  int is_set () override
  {
    return gpio_.is_set(psel_);
  }

private:
  driver& gpio_;
  unsigned int const psel_;
};

/** Wrapper supporting GPIO control of output signals by explicit or
 * scoped activation.
 *
 * This references an externally defined @ref generic_pin that must
 * remain valid for the lifespan of the signal wrapper.
 *
 * @tparam ACTIVE_HIGH if `true` the pin asserts with high voltage,
 * and deasserts with a low voltage.  If `false` (default) the pin
 * asserts with a low voltage, and deasserts with a high voltage. */
template <bool ACTIVE_HIGH = false>
class active_signal
{
public:
  static constexpr bool active_high = ACTIVE_HIGH;
  using this_type = active_signal<active_high>;

  generic_pin& pin;

  /** RAII instance used to activate the signal within a scope.
   *
   * Construct with make_scoped(). */
  struct scoped_active
  {
    ~scoped_active ()
    {
      al_.deactivate();
    }

  private:
    friend this_type;

    scoped_active (const this_type& al) :
      al_{al}
    {
      al_.activate();
    }

    const this_type& al_;
  };

  /** Construct an RAII object that activates the signal while it exists. */
  scoped_active make_scoped () const
  {
    return scoped_active{*this};
  }

  /** Construct the wrapper for the signal on a given pin.
   *
   * The signal is not driven until enable() succeeds. */
  active_signal (generic_pin& pin) :
    pin{pin}
  { }

  /** Indicate whether the signal is configured with a valid pin reference. */
  bool valid () const
  {
    return pin.valid();
  }

  /** Indicate whether the signal is currently active.
   *
   * An invalid pin, or one that cannot report its output state, is
   * never active. */
  bool active () const
  {
    if (!pin.valid()) {
      return false;
    }
    int rc = pin.is_set();
    if (0 > rc) {
      return false;
    }
    return active_high == (LEVEL_HIGH == rc);
  }

  /** Drive the associated GPIO to activate the signal. */
  int activate () const
  {
    return active_high ? pin.set() : pin.clear();
  }

  /** Drive the associated GPIO to deactivate the signal. */
  int deactivate () const
  {
    return active_high ? pin.clear() : pin.set();
  }

  /** Configure the associated GPIO to control the signal output.
   *
   * The pin is configured as an output and then deactivated.  The
   * drive state is not set before the direction because the driver
   * rejects writes to pins that are not outputs.
   *
   * @return as with driver::configure_output(). */
  int enable () const
  {
    int rc = pin.configure_output();
    if (0 <= rc) {
      rc = deactivate();
    }
    return rc;
  }

  /** Configure the associated GPIO as a non-controlling input. */
  int disable () const
  {
    return pin.configure_input();
  }
};

/** Alias type used for CSn, RESETn, and other active low output signals. */
using active_low = active_signal<false>;

} // namespace gpio
} // namespace rp2040cxx

#endif /* RP2040CXX_GPIO_HPP */
