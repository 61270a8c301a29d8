/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2018-2019 Peter A. Bigot */

/** Board-specific header for the Raspberry Pi Pico
 *
 * Assignments follow the Pico pinout.  The only on-board GPIO load is
 * the LED on GP25.  BUTTON0 is an external push-button to ground on
 * GP15, used with the internal pull-up.
 *
 * GP  | 0        | 1         | 2        | 3        | 4
 * --: | :------- | :-------- | :------- | :------- | :--------
 *   0 | UART.TXD | UART.RXD  | SCOPE0   | SCOPE1   | SCOPE2
 *   5 | SCOPE3   |           |          |          |
 *  10 |          |           |          |          |
 *  15 | BTN0     |           |          |          |
 *  20 |          |           |          | SMPS.PS  | VBUS.DET
 *  25 | LED0     | ADC0      | ADC1     | ADC2     | VSYS/3
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
