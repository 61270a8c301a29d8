// SPDX-License-Identifier: Apache-2.0
// Copyright 2018-2019 Peter A. Bigot

#include <rp2040cxx/faked/bus.hpp>

namespace rp2040cxx {
namespace faked {

namespace {

constexpr regmap::address_type APB_BEGIN = 0x40000000;
constexpr regmap::address_type APB_END = 0x50000000;
constexpr regmap::address_type ALIAS_Msk = 0x3000;
constexpr unsigned int ALIAS_Pos = 12;

/* Valid bits of the SIO user bank registers. */
constexpr uint32_t GPIO_Msk = (1U << regmap::GPIO_PSEL_COUNT) - 1;

bool
is_apb (regmap::address_type addr)
{
  return (APB_BEGIN <= addr) && (addr < APB_END);
}

uint32_t
apply_alias (unsigned int alias,
             uint32_t current,
             uint32_t value)
{
  switch (alias) {
    default:
    case 0:
      return value;
    case 1:
      return current ^ value;
    case 2:
      return current | value;
    case 3:
      return current & ~value;
  }
}

} // ns anonymous

bus::bus ()
{
  reset();
}

void
bus::reset ()
{
  using namespace regmap;

  regs_.clear();
  writes_.clear();
  reads_.clear();
  inputs_ = 0;
  reset_stuck_ = 0;
  reset_latency_ = 0;
  reset_polls_ = 0;
  reset_done_ = 0;

  regs_[resets::RESET.address] = resets::RESET_ALL_Msk;
  regs_[resets::RESET_DONE.address] = reset_done_;
  for (unsigned int psel = 0; psel < GPIO_PSEL_COUNT; ++psel) {
    regs_[gpio_ctrl(psel).address] = io_bank0::FUNCSEL_NULL << io_bank0::FUNCSEL_Pos;
    regs_[pad(psel).address] = pads_bank0::GPIO_RESET_VALUE;
  }
  regs_[sio::GPIO_OUT.address] = 0;
  regs_[sio::GPIO_OE.address] = 0;
}

uint32_t
bus::gpio_in_ () const
{
  uint32_t ie = 0;
  for (unsigned int psel = 0; psel < regmap::GPIO_PSEL_COUNT; ++psel) {
    auto pi = regs_.find(regmap::pad(psel).address);
    if ((regs_.end() != pi)
        && (regmap::pads_bank0::IE_Msk & pi->second)) {
      ie |= (1U << psel);
    }
  }
  auto oe = resolve_(regmap::sio::GPIO_OE.address);
  auto out = resolve_(regmap::sio::GPIO_OUT.address);
  return GPIO_Msk & ie & ((out & oe) | (inputs_ & ~oe));
}

uint32_t
bus::resolve_ (address_type addr) const
{
  if (regmap::sio::GPIO_IN.address == addr) {
    return gpio_in_();
  }
  auto ri = regs_.find(addr);
  if (regs_.end() == ri) {
    return 0;
  }
  return ri->second;
}

uint32_t
bus::peek (address_type addr) const
{
  return resolve_(addr);
}

void
bus::poke (address_type addr,
           uint32_t value)
{
  regs_[addr] = value;
}

uint32_t
bus::read (address_type addr)
{
  using namespace regmap;

  ++reads_[addr];
  if (resets::RESET_DONE.address == addr) {
    uint32_t target = resets::RESET_ALL_Msk & ~resolve_(resets::RESET.address) & ~reset_stuck_;
    if (target != reset_done_) {
      if (reset_polls_ < reset_latency_) {
        ++reset_polls_;
      } else {
        reset_done_ = target;
        reset_polls_ = 0;
        regs_[addr] = reset_done_;
      }
    }
    return reset_done_;
  }
  return resolve_(addr);
}

void
bus::write (address_type addr,
            uint32_t value)
{
  using namespace regmap;

  writes_.push_back({addr, value});

  if (is_apb(addr)) {
    auto base = addr & ~ALIAS_Msk;
    unsigned int alias = (addr & ALIAS_Msk) >> ALIAS_Pos;
    if (resets::RESET_DONE.address == base) {
      return;                   // read-only
    }
    auto next = apply_alias(alias, resolve_(base), value);
    regs_[base] = next;
    if (resets::RESET.address == base) {
      reset_done_ &= ~next;
      reset_polls_ = 0;
      regs_[resets::RESET_DONE.address] = reset_done_;
    }
    return;
  }

  auto update = [this](const register_type& reg,
                       unsigned int alias,
                       uint32_t v) {
    regs_[reg.address] = GPIO_Msk & apply_alias(alias, resolve_(reg.address), v);
  };

  switch (addr - SIO.BASE) {
    case sio::GPIO_IN_OFFSET:
      break;                    // read-only
    case sio::GPIO_OUT_OFFSET:
      update(sio::GPIO_OUT, 0, value);
      break;
    case sio::GPIO_OUT_XOR_OFFSET:
      update(sio::GPIO_OUT, 1, value);
      break;
    case sio::GPIO_OUT_SET_OFFSET:
      update(sio::GPIO_OUT, 2, value);
      break;
    case sio::GPIO_OUT_CLR_OFFSET:
      update(sio::GPIO_OUT, 3, value);
      break;
    case sio::GPIO_OE_OFFSET:
      update(sio::GPIO_OE, 0, value);
      break;
    case sio::GPIO_OE_XOR_OFFSET:
      update(sio::GPIO_OE, 1, value);
      break;
    case sio::GPIO_OE_SET_OFFSET:
      update(sio::GPIO_OE, 2, value);
      break;
    case sio::GPIO_OE_CLR_OFFSET:
      update(sio::GPIO_OE, 3, value);
      break;
    default:
      regs_[addr] = value;
      break;
  }
}

void
bus::drive_input (unsigned int psel,
                  bool high)
{
  if (!regmap::psel_valid(psel)) {
    return;
  }
  if (high) {
    inputs_ |= (1U << psel);
  } else {
    inputs_ &= ~(1U << psel);
  }
}

unsigned int
bus::read_count (address_type addr) const
{
  auto ri = reads_.find(addr);
  return (reads_.end() == ri) ? 0 : ri->second;
}

unsigned int
bus::write_count (address_type addr) const
{
  unsigned int rv = 0;
  for (const auto& w : writes_) {
    if (addr == w.address) {
      ++rv;
    }
  }
  return rv;
}

void
bus::clear_log ()
{
  writes_.clear();
  reads_.clear();
}

} // ns faked
} // ns rp2040cxx
