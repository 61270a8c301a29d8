// SPDX-License-Identifier: Apache-2.0
// Copyright 2018-2019 Peter A. Bigot

#include <gtest/gtest.h>

#include <rp2040cxx/faked/bus.hpp>
#include <rp2040cxx/gpio.hpp>

namespace {

using namespace rp2040cxx;
using access_type = faked::bus::access_type;

constexpr int INVALID_PIN = error_encoded(ErrorCode::INVALID_PIN);
constexpr int WRONG_DIRECTION = error_encoded(ErrorCode::WRONG_DIRECTION);
constexpr int PERIPHERAL_TIMEOUT = error_encoded(ErrorCode::PERIPHERAL_TIMEOUT);
constexpr int PERIPHERAL_DISABLED = error_encoded(ErrorCode::PERIPHERAL_DISABLED);

class GpioDriver : public ::testing::Test
{
protected:
  faked::bus bus;
  gpio::driver drv{bus, 16};

  void SetUp () override
  {
    ASSERT_EQ(0, board::initialize(drv));
    bus.clear_log();
  }
};

TEST(GpioEnable, ReleaseFromReset)
{
  faked::bus bus;
  gpio::driver drv{bus, 16};
  const auto& done = regmap::resets::RESET_DONE;

  ASSERT_FALSE(drv.peripheral_ready(regmap::IO_BANK0));
  bus.clear_log();
  ASSERT_EQ(0, drv.enable_peripheral(regmap::IO_BANK0));
  ASSERT_EQ(1U, bus.writes().size());
  ASSERT_EQ((access_type{0x4000F000, 1U << 5}), bus.writes()[0]);
  ASSERT_EQ(1U, bus.read_count(done.address));
  ASSERT_EQ(regmap::resets::RESET_ALL_Msk & ~(1U << 5),
            bus.peek(regmap::resets::RESET.address));
  ASSERT_TRUE(drv.peripheral_ready(regmap::IO_BANK0));
  ASSERT_FALSE(drv.peripheral_ready(regmap::PADS_BANK0));

  /* Enabling again is harmless. */
  ASSERT_EQ(0, drv.enable_peripheral(regmap::IO_BANK0));
  ASSERT_TRUE(drv.peripheral_ready(regmap::IO_BANK0));
}

TEST(GpioEnable, Latency)
{
  faked::bus bus;
  gpio::driver drv{bus, 16};
  const auto& done = regmap::resets::RESET_DONE;

  bus.set_reset_latency(5);
  ASSERT_EQ(0, drv.enable_peripheral(regmap::PADS_BANK0));
  ASSERT_EQ(6U, bus.read_count(done.address));
  ASSERT_TRUE(drv.peripheral_ready(regmap::PADS_BANK0));
}

TEST(GpioEnable, Timeout)
{
  faked::bus bus;
  gpio::driver drv{bus, 10};
  const auto& done = regmap::resets::RESET_DONE;

  bus.set_reset_stuck(regmap::IO_BANK0.reset_mask());
  ASSERT_EQ(PERIPHERAL_TIMEOUT, drv.enable_peripheral(regmap::IO_BANK0));
  ASSERT_EQ(10U, bus.read_count(done.address));
  ASSERT_FALSE(drv.peripheral_ready(regmap::IO_BANK0));

  /* Board initialization propagates the failure. */
  ASSERT_EQ(PERIPHERAL_TIMEOUT, board::initialize(drv));
}

TEST(GpioEnable, NoReset)
{
  faked::bus bus;
  gpio::driver drv{bus};

  ASSERT_EQ(0, drv.enable_peripheral(regmap::SIO));
  ASSERT_TRUE(bus.writes().empty());
  ASSERT_EQ(0U, bus.read_count(regmap::resets::RESET_DONE.address));
}

TEST(GpioConfigure, RequiresEnabledBanks)
{
  faked::bus bus;
  gpio::driver drv{bus};

  ASSERT_EQ(PERIPHERAL_DISABLED, drv.configure_output(25));
  ASSERT_EQ(PERIPHERAL_DISABLED, drv.configure_input(15));
  ASSERT_TRUE(bus.writes().empty());
  ASSERT_EQ(gpio::pin_state::UNCLAIMED, drv.state(25));

  /* IO_BANK0 alone is not sufficient. */
  ASSERT_EQ(0, drv.enable_peripheral(regmap::IO_BANK0));
  bus.clear_log();
  ASSERT_EQ(PERIPHERAL_DISABLED, drv.configure_output(25));
  ASSERT_TRUE(bus.writes().empty());
}

TEST_F(GpioDriver, InvalidPin)
{
  const auto before = bus.storage();

  ASSERT_EQ(INVALID_PIN, drv.configure_output(regmap::GPIO_PSEL_COUNT));
  ASSERT_EQ(INVALID_PIN, drv.configure_input(100, gpio::pull_type::UP));
  ASSERT_EQ(INVALID_PIN, drv.set_high(30));
  ASSERT_EQ(INVALID_PIN, drv.set_low(30));
  ASSERT_EQ(INVALID_PIN, drv.toggle(30));
  ASSERT_EQ(INVALID_PIN, drv.read(30));
  ASSERT_EQ(INVALID_PIN, drv.is_set(30));
  ASSERT_EQ(gpio::pin_state::UNCLAIMED, drv.state(30));
  ASSERT_TRUE(bus.writes().empty());
  ASSERT_EQ(before, bus.storage());
}

TEST_F(GpioDriver, ConfigureOutputSequence)
{
  using namespace regmap;
  const unsigned int psel = 25;

  ASSERT_EQ(gpio::pin_state::UNCLAIMED, drv.state(psel));
  ASSERT_EQ(0, drv.configure_output(psel));
  ASSERT_EQ(gpio::pin_state::OUTPUT, drv.state(psel));

  const auto& writes = bus.writes();
  ASSERT_EQ(4U, writes.size());
  ASSERT_EQ((access_type{0x4001E068, pads_bank0::IE_Msk}), writes[0]);
  ASSERT_EQ((access_type{0x4001F068, pads_bank0::OD_Msk}), writes[1]);
  ASSERT_EQ((access_type{0x400140CC, io_bank0::FUNCSEL_SIO}), writes[2]);
  ASSERT_EQ((access_type{0xD0000024, 1U << psel}), writes[3]);

  ASSERT_EQ(io_bank0::FUNCSEL_SIO, io_bank0::FUNCSEL_Msk & bus.peek(gpio_ctrl(psel).address));
  ASSERT_EQ(1U << psel, bus.peek(sio::GPIO_OE.address));
  const uint32_t padv = bus.peek(pad(psel).address);
  ASSERT_TRUE(pads_bank0::IE_Msk & padv);
  ASSERT_FALSE(pads_bank0::OD_Msk & padv);
}

TEST_F(GpioDriver, ConfigureOutputIdempotent)
{
  ASSERT_EQ(0, drv.configure_output(3));
  const auto once = bus.storage();
  ASSERT_EQ(0, drv.configure_output(3));
  ASSERT_EQ(once, bus.storage());
  ASSERT_EQ(gpio::pin_state::OUTPUT, drv.state(3));
}

TEST_F(GpioDriver, OutputEnableIsolation)
{
  using namespace regmap;

  bus.poke(sio::GPIO_OE.address, 0x00000F00);
  ASSERT_EQ(0, drv.configure_output(2));
  ASSERT_EQ(0x00000F04U, bus.peek(sio::GPIO_OE.address));
  ASSERT_EQ(0, drv.configure_input(9));
  ASSERT_EQ(0x00000D04U, bus.peek(sio::GPIO_OE.address));
}

TEST_F(GpioDriver, ConfigureInputPulls)
{
  using namespace regmap;
  const auto updn = pads_bank0::PUE_Msk | pads_bank0::PDE_Msk;

  ASSERT_EQ(0, drv.configure_input(15, gpio::pull_type::UP));
  ASSERT_EQ(gpio::pin_state::INPUT, drv.state(15));
  ASSERT_EQ(pads_bank0::PUE_Msk, updn & bus.peek(pad(15).address));
  ASSERT_TRUE(pads_bank0::IE_Msk & bus.peek(pad(15).address));
  ASSERT_EQ((access_type{0xD0000028, 1U << 15}), bus.writes().back());

  ASSERT_EQ(0, drv.configure_input(15, gpio::pull_type::DOWN));
  ASSERT_EQ(pads_bank0::PDE_Msk, updn & bus.peek(pad(15).address));

  ASSERT_EQ(0, drv.configure_input(15));
  ASSERT_EQ(0U, updn & bus.peek(pad(15).address));
  ASSERT_EQ(io_bank0::FUNCSEL_SIO, io_bank0::FUNCSEL_Msk & bus.peek(gpio_ctrl(15).address));
}

TEST_F(GpioDriver, WrongDirectionUnclaimed)
{
  const auto before = bus.storage();

  ASSERT_EQ(WRONG_DIRECTION, drv.set_high(7));
  ASSERT_EQ(WRONG_DIRECTION, drv.set_low(7));
  ASSERT_EQ(WRONG_DIRECTION, drv.toggle(7));
  ASSERT_EQ(WRONG_DIRECTION, drv.is_set(7));
  ASSERT_EQ(WRONG_DIRECTION, drv.read(7));
  ASSERT_TRUE(bus.writes().empty());
  ASSERT_EQ(before, bus.storage());
}

TEST_F(GpioDriver, WrongDirectionInput)
{
  ASSERT_EQ(0, drv.configure_input(7));
  bus.clear_log();
  const auto before = bus.storage();

  ASSERT_EQ(WRONG_DIRECTION, drv.set_high(7));
  ASSERT_EQ(WRONG_DIRECTION, drv.set_low(7));
  ASSERT_EQ(WRONG_DIRECTION, drv.toggle(7));
  ASSERT_TRUE(bus.writes().empty());
  ASSERT_EQ(before, bus.storage());
}

TEST_F(GpioDriver, OutputToInput)
{
  ASSERT_EQ(0, drv.configure_output(4));
  ASSERT_EQ(0, drv.set_high(4));
  ASSERT_EQ(0, drv.configure_input(4));
  ASSERT_EQ(gpio::pin_state::INPUT, drv.state(4));
  ASSERT_EQ(0U, (1U << 4) & bus.peek(regmap::sio::GPIO_OE.address));
  ASSERT_EQ(WRONG_DIRECTION, drv.set_low(4));

  /* With nothing driving it the released pin reads low. */
  ASSERT_EQ(gpio::LEVEL_LOW, drv.read(4));
}

TEST_F(GpioDriver, SetWritesAliasOnly)
{
  ASSERT_EQ(0, drv.configure_output(25));
  bus.clear_log();

  ASSERT_EQ(0, drv.set_high(25));
  ASSERT_EQ(1U, bus.writes().size());
  ASSERT_EQ((access_type{0xD0000014, 1U << 25}), bus.writes()[0]);
  ASSERT_EQ(0U, bus.read_count(regmap::sio::GPIO_OUT.address));

  ASSERT_EQ(0, drv.set_low(25));
  ASSERT_EQ(2U, bus.writes().size());
  ASSERT_EQ((access_type{0xD0000018, 1U << 25}), bus.writes()[1]);
}

TEST_F(GpioDriver, RoundTrip)
{
  ASSERT_EQ(0, drv.configure_output(25));
  ASSERT_EQ(0, drv.set_high(25));
  ASSERT_EQ(gpio::LEVEL_HIGH, drv.read(25));
  ASSERT_EQ(gpio::LEVEL_HIGH, drv.is_set(25));
  ASSERT_EQ(0, drv.set_low(25));
  ASSERT_EQ(gpio::LEVEL_LOW, drv.read(25));
  ASSERT_EQ(gpio::LEVEL_LOW, drv.is_set(25));

  ASSERT_EQ(0, drv.set(25, true));
  ASSERT_EQ(gpio::LEVEL_HIGH, drv.read(25));
  ASSERT_EQ(0, drv.set(25, false));
  ASSERT_EQ(gpio::LEVEL_LOW, drv.read(25));
}

TEST_F(GpioDriver, OutputIsolation)
{
  ASSERT_EQ(0, drv.configure_output(0));
  ASSERT_EQ(0, drv.configure_output(29));
  ASSERT_EQ(0, drv.set_high(0));
  ASSERT_EQ(0, drv.set_high(29));
  ASSERT_EQ(0, drv.set_low(0));
  ASSERT_EQ(gpio::LEVEL_LOW, drv.read(0));
  ASSERT_EQ(gpio::LEVEL_HIGH, drv.read(29));
  ASSERT_EQ(1U << 29, bus.peek(regmap::sio::GPIO_OUT.address));
}

TEST_F(GpioDriver, Toggle)
{
  ASSERT_EQ(0, drv.configure_output(10));
  ASSERT_EQ(gpio::LEVEL_LOW, drv.is_set(10));
  ASSERT_EQ(0, drv.toggle(10));
  ASSERT_EQ(gpio::LEVEL_HIGH, drv.is_set(10));
  ASSERT_EQ(0, drv.toggle(10));
  ASSERT_EQ(gpio::LEVEL_LOW, drv.is_set(10));
}

TEST_F(GpioDriver, ReadInput)
{
  ASSERT_EQ(0, drv.configure_input(15, gpio::pull_type::UP));
  bus.drive_input(15, true);
  ASSERT_EQ(gpio::LEVEL_HIGH, drv.read(15));
  bus.drive_input(15, false);
  ASSERT_EQ(gpio::LEVEL_LOW, drv.read(15));

  /* Inputs do not appear on pins the driver enabled for output. */
  ASSERT_EQ(0, drv.configure_output(16));
  bus.drive_input(16, true);
  ASSERT_EQ(gpio::LEVEL_LOW, drv.read(16));
}

TEST_F(GpioDriver, ReadRequiresInputEnable)
{
  ASSERT_EQ(0, drv.configure_input(12));
  bus.drive_input(12, true);
  ASSERT_EQ(gpio::LEVEL_HIGH, drv.read(12));

  /* Something outside the driver disabled the input buffer. */
  regmap::clear_bits(bus, regmap::pad(12), regmap::pads_bank0::IE_Msk);
  ASSERT_EQ(gpio::LEVEL_LOW, drv.read(12));
}

} // ns anonymous
