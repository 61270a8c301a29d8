/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Simulated RP2040 register space for host-based unit tests.
 *
 * The faked bus emulates enough of `RESETS`, `IO_BANK0`, `PADS_BANK0`
 * and `SIO` to exercise the GPIO driver without hardware:
 *
 * * APB registers honor the XOR, SET, and CLR aliases: a write to an
 *   alias updates the underlying register.
 * * `RESETS.RESET` starts with all peripherals in reset.
 *   `RESETS.RESET_DONE` reflects the complement, optionally after a
 *   number of unsatisfied polls (set_reset_latency()), and never for
 *   peripherals marked stuck (set_reset_stuck()).
 * * `IO_BANK0` control and `PADS_BANK0` pad registers start at their
 *   hardware reset values.
 * * SIO `GPIO_OUT` and `GPIO_OE` honor their `_SET`, `_CLR`, and
 *   `_XOR` registers.  `GPIO_IN` reports the output latch for pins
 *   whose output is enabled, and the externally applied level
 *   (drive_input()) for other pins.
 * * Any other address behaves as plain storage that reads as zero
 *   until written.
 *
 * Every write is logged, in order, with the address the code under
 * test used, so tests may verify both values and sequencing.
 *
 * @file */

#ifndef RP2040CXX_FAKED_BUS_HPP
#define RP2040CXX_FAKED_BUS_HPP
#pragma once

#include <map>
#include <vector>

#include <rp2040cxx/regmap.hpp>

#if !(RP2040CXX_FAKED - 0)
#error faked bus requires RP2040CXX_FAKED
#endif /* RP2040CXX_FAKED */

namespace rp2040cxx {

/** Support for host-based testing */
namespace faked {

/** Simulated register bus.  See <rp2040cxx/faked/bus.hpp>. */
class bus : public regmap::bus
{
public:
  using address_type = regmap::address_type;

  /** Record of a single register write. */
  struct access_type
  {
    address_type address;
    uint32_t value;

    bool operator== (const access_type& rhs) const
    {
      return (address == rhs.address) && (value == rhs.value);
    }
  };

  /** Snapshot of resolved register contents. */
  using storage_type = std::map<address_type, uint32_t>;

  /** Construct the bus in the power-on state. */
  bus ();

  uint32_t read (address_type addr) override;

  void write (address_type addr,
              uint32_t value) override;

  /** Return to the power-on state, clearing logs and counters. */
  void reset ();

  /** Return the content of a register without counting the access.
   *
   * @p addr must be the register address, not an alias. */
  uint32_t peek (address_type addr) const;

  /** Store a value in a register without logging or alias
   * processing. */
  void poke (address_type addr,
             uint32_t value);

  /** Apply an external signal level to an input pin. */
  void drive_input (unsigned int psel,
                    bool high);

  /** Number of RESET_DONE reads that report a released peripheral as
   * not yet done before it is reported done. */
  void set_reset_latency (unsigned int polls)
  {
    reset_latency_ = polls;
  }

  /** Mark peripherals (by RESET bit mask) that never report done. */
  void set_reset_stuck (uint32_t mask)
  {
    reset_stuck_ = mask;
  }

  /** The number of reads performed at @p addr. */
  unsigned int read_count (address_type addr) const;

  /** The number of writes performed at @p addr (exactly as
   * addressed, aliases distinct). */
  unsigned int write_count (address_type addr) const;

  /** All writes, in order. */
  const std::vector<access_type>& writes () const
  {
    return writes_;
  }

  /** Discard the write log and access counters. */
  void clear_log ();

  /** Snapshot the resolved register contents. */
  const storage_type& storage () const
  {
    return regs_;
  }

private:
  uint32_t resolve_ (address_type addr) const;
  uint32_t gpio_in_ () const;

  storage_type regs_;
  std::vector<access_type> writes_;
  std::map<address_type, unsigned int> reads_;
  uint32_t inputs_ = 0;
  uint32_t reset_stuck_ = 0;
  uint32_t reset_done_ = 0;
  unsigned int reset_latency_ = 0;
  unsigned int reset_polls_ = 0;
};

} // ns faked
} // ns rp2040cxx

#endif /* RP2040CXX_FAKED_BUS_HPP */
