/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Register map for the RP2040 GPIO-related peripherals.
 *
 * This header captures the fixed physical addresses and bit layouts
 * of the reset controller (`RESETS`), the pin multiplexer
 * (`IO_BANK0`), the pad electrical controls (`PADS_BANK0`), and the
 * single-cycle I/O block (`SIO`), along with the primitive register
 * operations used by the GPIO driver.
 *
 * All register traffic goes through an instance of regmap::bus.  On
 * the device this is a regmap::mmio_bus which performs volatile
 * accesses; on the host a @link faked::bus simulated register
 * space@endlink is substituted without changing the code that uses
 * it.
 *
 * @file */

#ifndef RP2040CXX_REGMAP_HPP
#define RP2040CXX_REGMAP_HPP
#pragma once

#include <rp2040cxx/core.hpp>

namespace rp2040cxx {

/** Abstractions and constants around the RP2040 register map */
namespace regmap {

/** Type used to hold a physical register address. */
using address_type = uintptr_t;

/** Compute the absolute address of a register.
 *
 * @param base the peripheral base address
 *
 * @param offset the register offset within the peripheral
 *
 * @return `base + offset` exactly. */
constexpr address_type
address_of (address_type base,
            address_type offset)
{
  return base + offset;
}

/** Offset of the atomic XOR alias of an APB peripheral register. */
constexpr address_type XOR_ALIAS_OFFSET = 0x1000;

/** Offset of the atomic SET alias of an APB peripheral register. */
constexpr address_type SET_ALIAS_OFFSET = 0x2000;

/** Offset of the atomic CLR alias of an APB peripheral register. */
constexpr address_type CLR_ALIAS_OFFSET = 0x3000;

/** Default bound on the number of reads performed by wait_until(). */
constexpr unsigned int DEFAULT_WAIT_ITERATIONS = 100000;

/** Abstract access to a 32-bit register space.
 *
 * Implementations must perform each access exactly once and in
 * program order. */
class bus
{
public:
  virtual ~bus () = default;

  /** Read the 32-bit register at @p addr. */
  virtual uint32_t read (address_type addr) = 0;

  /** Write @p value to the 32-bit register at @p addr. */
  virtual void write (address_type addr,
                      uint32_t value) = 0;
};

/** Register bus over the device's physical address space.
 *
 * This is the only place in the library where a register address is
 * converted to a pointer.  Every access is a volatile operation so it
 * can be neither elided nor reordered with respect to other register
 * accesses.
 *
 * @warning Using an instance on the host will fault. */
class mmio_bus : public bus
{
public:
  uint32_t read (address_type addr) override
  {
    return *reinterpret_cast<volatile uint32_t*>(addr);
  }

  void write (address_type addr,
              uint32_t value) override
  {
    *reinterpret_cast<volatile uint32_t*>(addr) = value;
  }
};

/** Description of a single register.
 *
 * A register optionally exposes hardware aliases that set or clear
 * the bits written to them without disturbing other bits.  On APB
 * peripherals these are at #SET_ALIAS_OFFSET and #CLR_ALIAS_OFFSET; on
 * SIO the `_SET` and `_CLR` registers adjacent to `GPIO_OUT` and
 * `GPIO_OE` play the same role. */
struct register_type
{
  /** The absolute address of the register. */
  address_type address;

  /** Offset from #address of the set alias, or zero if none. */
  address_type set_offset;

  /** Offset from #address of the clear alias, or zero if none. */
  address_type clr_offset;

  constexpr bool has_set_alias () const
  {
    return 0 != set_offset;
  }

  constexpr bool has_clr_alias () const
  {
    return 0 != clr_offset;
  }
};

/** Capture information about an RP2040 peripheral instance.
 *
 * All instances of this class are `static constexpr` so with standard
 * optimization there is no data object taking up space and requiring
 * memory access to get the peripheral address. */
struct peripheral
{
  /** Flag value for #RESET_BIT indicating that the peripheral is not
   * controlled by the reset controller. */
  static constexpr int8_t NO_RESET = -1;

  /** Create an object referencing a peripheral instance.
   *
   * @param base initializes #BASE
   * @param reset_bit initializes #RESET_BIT
   * @param atomic_aliases initializes #ATOMIC_ALIASES */
  constexpr explicit peripheral (address_type base,
                                 int8_t reset_bit = NO_RESET,
                                 bool atomic_aliases = true) :
    BASE{base},
    RESET_BIT{reset_bit},
    ATOMIC_ALIASES{atomic_aliases}
  { }

  /** Describe the register at @p offset within the peripheral. */
  constexpr register_type reg (address_type offset) const
  {
    return {address_of(BASE, offset),
            ATOMIC_ALIASES ? SET_ALIAS_OFFSET : 0,
            ATOMIC_ALIASES ? CLR_ALIAS_OFFSET : 0};
  }

  /** `true` iff the peripheral is held in reset by the reset
   * controller until released. */
  constexpr bool has_reset () const
  {
    return 0 <= RESET_BIT;
  }

  /** The mask for the peripheral in the `RESET` and `RESET_DONE`
   * registers, or zero if it has none. */
  constexpr uint32_t reset_mask () const
  {
    return has_reset() ? (1U << RESET_BIT) : 0;
  }

  /** The address of the instance. */
  const address_type BASE;

  /** The bit controlling the peripheral in the reset controller, or
   * #NO_RESET. */
  const int8_t RESET_BIT;

  /** `true` iff the peripheral is on APB and supports the XOR, SET,
   * and CLR register aliases. */
  const bool ATOMIC_ALIASES;
};

/** The number of GPIO pins in the user bank. */
static constexpr unsigned int GPIO_PSEL_COUNT = 30;

/** Indicate whether @p psel identifies a user bank GPIO. */
constexpr bool
psel_valid (unsigned int psel)
{
  return psel < GPIO_PSEL_COUNT;
}

/** Reset controller. */
static constexpr peripheral RESETS{0x4000C000};

/** User bank pin multiplexer. */
static constexpr peripheral IO_BANK0{0x40014000, 5};

/** User bank pad controls. */
static constexpr peripheral PADS_BANK0{0x4001C000, 8};

/** Single-cycle I/O.  Not on APB, so no atomic aliases. */
static constexpr peripheral SIO{0xD0000000, peripheral::NO_RESET, false};

/** Registers of the reset controller. */
namespace resets {

constexpr address_type RESET_OFFSET = 0x000;
constexpr address_type WDSEL_OFFSET = 0x004;
constexpr address_type RESET_DONE_OFFSET = 0x008;

/** Mask covering all implemented bits of `RESET` and `RESET_DONE`. */
constexpr uint32_t RESET_ALL_Msk = 0x01ffffff;

constexpr register_type RESET = RESETS.reg(RESET_OFFSET);
constexpr register_type RESET_DONE = RESETS.reg(RESET_DONE_OFFSET);

} // ns resets

/** Registers of the user bank pin multiplexer. */
namespace io_bank0 {

constexpr unsigned int FUNCSEL_Pos = 0;
constexpr uint32_t FUNCSEL_Msk = (0x1fU << FUNCSEL_Pos);

/** Function select value attaching a pin to SIO (plain GPIO). */
constexpr unsigned int FUNCSEL_SIO = 5;

/** Function select value at reset (no function attached). */
constexpr unsigned int FUNCSEL_NULL = 31;

/** Address offset of the `GPIOn_STATUS` register. */
constexpr address_type
status_offset (unsigned int psel)
{
  return 8 * psel;
}

/** Address offset of the `GPIOn_CTRL` register. */
constexpr address_type
ctrl_offset (unsigned int psel)
{
  return 4 + 8 * psel;
}

} // ns io_bank0

/** Registers of the user bank pad controls. */
namespace pads_bank0 {

constexpr uint32_t SLEWFAST_Msk = (1U << 0);
constexpr uint32_t SCHMITT_Msk = (1U << 1);
constexpr uint32_t PDE_Msk = (1U << 2);
constexpr uint32_t PUE_Msk = (1U << 3);
constexpr unsigned int DRIVE_Pos = 4;
constexpr uint32_t DRIVE_Msk = (3U << DRIVE_Pos);
constexpr uint32_t IE_Msk = (1U << 6);
constexpr uint32_t OD_Msk = (1U << 7);

/** Pad register value at reset: input enabled, 4 mA drive, pull-down,
 * Schmitt trigger. */
constexpr uint32_t GPIO_RESET_VALUE = (IE_Msk | (1U << DRIVE_Pos) | PDE_Msk | SCHMITT_Msk);

/** Address offset of the `GPIOn` pad register. */
constexpr address_type
gpio_offset (unsigned int psel)
{
  return 4 + 4 * psel;
}

} // ns pads_bank0

/** Registers of the single-cycle I/O block. */
namespace sio {

constexpr address_type GPIO_IN_OFFSET = 0x004;
constexpr address_type GPIO_OUT_OFFSET = 0x010;
constexpr address_type GPIO_OUT_SET_OFFSET = 0x014;
constexpr address_type GPIO_OUT_CLR_OFFSET = 0x018;
constexpr address_type GPIO_OUT_XOR_OFFSET = 0x01c;
constexpr address_type GPIO_OE_OFFSET = 0x020;
constexpr address_type GPIO_OE_SET_OFFSET = 0x024;
constexpr address_type GPIO_OE_CLR_OFFSET = 0x028;
constexpr address_type GPIO_OE_XOR_OFFSET = 0x02c;

/** Input values of the user bank. Read-only. */
constexpr register_type GPIO_IN{address_of(SIO.BASE, GPIO_IN_OFFSET), 0, 0};

/** Output values of the user bank. */
constexpr register_type GPIO_OUT{address_of(SIO.BASE, GPIO_OUT_OFFSET),
                                 GPIO_OUT_SET_OFFSET - GPIO_OUT_OFFSET,
                                 GPIO_OUT_CLR_OFFSET - GPIO_OUT_OFFSET};

/** Output enables of the user bank. */
constexpr register_type GPIO_OE{address_of(SIO.BASE, GPIO_OE_OFFSET),
                                GPIO_OE_SET_OFFSET - GPIO_OE_OFFSET,
                                GPIO_OE_CLR_OFFSET - GPIO_OE_OFFSET};

} // ns sio

/** Describe the `GPIOn_CTRL` register for a pin. */
constexpr register_type
gpio_ctrl (unsigned int psel)
{
  return IO_BANK0.reg(io_bank0::ctrl_offset(psel));
}

/** Describe the `GPIOn_STATUS` register for a pin. */
constexpr register_type
gpio_status (unsigned int psel)
{
  return IO_BANK0.reg(io_bank0::status_offset(psel));
}

/** Describe the pad control register for a pin. */
constexpr register_type
pad (unsigned int psel)
{
  return PADS_BANK0.reg(pads_bank0::gpio_offset(psel));
}

/** Read a register. */
inline uint32_t
read (bus& rb,
      const register_type& reg)
{
  return rb.read(reg.address);
}

/** Write a register. */
inline void
write (bus& rb,
       const register_type& reg,
       uint32_t value)
{
  rb.write(reg.address, value);
}

/** Set bits in a register.
 *
 * If the register has a set alias @p mask is written to it and bits
 * outside @p mask are unaffected, atomically.  Otherwise a
 * read-modify-write is performed: bits outside @p mask are preserved
 * but the sequence is not atomic with respect to other code touching
 * the same register.
 *
 * @tparam mutex_type the @link rp2040cxx_mutex mutex type@endlink
 * held across the read-modify-write fallback.  Use primask if an
 * interrupt handler may touch the same register.
 *
 * @param rb the bus on which the register is accessed
 *
 * @param reg the register to modify
 *
 * @param mask the bits to set */
template <typename mutex_type = null_mutex>
void
set_bits (bus& rb,
          const register_type& reg,
          uint32_t mask)
{
  if (reg.has_set_alias()) {
    rb.write(address_of(reg.address, reg.set_offset), mask);
    return;
  }
  mutex_type mutex;
  rb.write(reg.address, rb.read(reg.address) | mask);
}

/** Clear bits in a register.
 *
 * The counterpart to set_bits(), using the clear alias or a
 * read-modify-write with `& ~mask`. */
template <typename mutex_type = null_mutex>
void
clear_bits (bus& rb,
            const register_type& reg,
            uint32_t mask)
{
  if (reg.has_clr_alias()) {
    rb.write(address_of(reg.address, reg.clr_offset), mask);
    return;
  }
  mutex_type mutex;
  rb.write(reg.address, rb.read(reg.address) & ~mask);
}

/** Poll until any bit in @p mask reads as set.
 *
 * Bare hardware has no time source guaranteed cheaper than counting,
 * so the bound is a number of reads rather than a duration.
 *
 * @param rb the bus on which the register is accessed
 *
 * @param addr the address of the register to poll
 *
 * @param mask the bits of interest
 *
 * @param max_iterations the maximum number of reads performed.
 *
 * @return zero once `read(addr) & mask` is non-zero, or
 * ErrorCode::PERIPHERAL_TIMEOUT @link error_encoded encoded@endlink
 * after exactly @p max_iterations unsatisfied reads. */
int wait_until (bus& rb,
                address_type addr,
                uint32_t mask,
                unsigned int max_iterations = DEFAULT_WAIT_ITERATIONS);

} // ns regmap
} // ns rp2040cxx

#endif /* RP2040CXX_REGMAP_HPP */
