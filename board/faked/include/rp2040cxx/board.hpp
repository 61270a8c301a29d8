/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Board-specific header for host-based unit tests (based on Pico)
 *
 * Assignments correspond to the Raspberry Pi Pico board header, so
 * host-run programs exercise the same pins as on the device.
 *
 * @file */

#ifndef RP2040CXX_BOARD_HPP
#define RP2040CXX_BOARD_HPP
#pragma once

namespace rp2040cxx {
namespace board {

#define RP2040CXX_BOARD_PSEL_BUTTON0 15

#define RP2040CXX_BOARD_PSEL_LED0 25

#define RP2040CXX_BOARD_PSEL_SCOPE0 2
#define RP2040CXX_BOARD_PSEL_SCOPE1 3
#define RP2040CXX_BOARD_PSEL_SCOPE2 4
#define RP2040CXX_BOARD_PSEL_SCOPE3 5

#define RP2040CXX_BOARD_PSEL_UART0_TXD 0
#define RP2040CXX_BOARD_PSEL_UART0_RXD 1

constexpr bool button_active_low = true;
constexpr bool led_active_low = false;

} // namespace board
} // namespace rp2040cxx

#endif /* RP2040CXX_BOARD_HPP */
