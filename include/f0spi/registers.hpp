// Copyright 2024 - 2025 Khalil Estell and the libhal contributors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

/**
 * @file registers.hpp
 * @brief Register maps for the STM32F0 blocks used by f0spi
 *
 * Layouts and bit positions follow RM0091. Only the fields that f0spi touches
 * are named.
 *
 */
#pragma once

#include <cstddef>

#include <libhal-util/bit.hpp>

#include "units.hpp"

namespace f0spi {
/// Reset and clock control register block
struct rcc_reg_t
{
  /// Offset: 0x00 Clock control register
  u32 volatile cr;
  /// Offset: 0x04 Clock configuration register
  u32 volatile cfgr;
  /// Offset: 0x08 Clock interrupt register
  u32 volatile cir;
  /// Offset: 0x0C APB peripheral reset register 2
  u32 volatile apb2rstr;
  /// Offset: 0x10 APB peripheral reset register 1
  u32 volatile apb1rstr;
  /// Offset: 0x14 AHB peripheral clock enable register
  u32 volatile ahbenr;
  /// Offset: 0x18 APB peripheral clock enable register 2
  u32 volatile apb2enr;
  /// Offset: 0x1C APB peripheral clock enable register 1
  u32 volatile apb1enr;
  /// Offset: 0x20 RTC domain control register
  u32 volatile bdcr;
  /// Offset: 0x24 Control/status register
  u32 volatile csr;
  /// Offset: 0x28 AHB peripheral reset register
  u32 volatile ahbrstr;
  /// Offset: 0x2C Clock configuration register 2
  u32 volatile cfgr2;
  /// Offset: 0x30 Clock configuration register 3
  u32 volatile cfgr3;
  /// Offset: 0x34 Clock control register 2
  u32 volatile cr2;
};

namespace rcc {
/// Bit shared by APB2ENR (clock enable) and APB2RSTR (reset) for SPI1
static constexpr auto spi1 = hal::bit_mask::from<12>();
/// Clock enable bits in AHBENR for the GPIO ports
static constexpr auto gpioa = hal::bit_mask::from<17>();
static constexpr auto gpiob = hal::bit_mask::from<18>();
}  // namespace rcc

/// Serial peripheral interface register block
struct spi_reg_t
{
  /// Offset: 0x00 Control register 1
  u32 volatile cr1;
  /// Offset: 0x04 Control register 2
  u32 volatile cr2;
  /// Offset: 0x08 Status register
  u32 volatile sr;
  /// Offset: 0x0C Data register
  u32 volatile dr;
  /// Offset: 0x10 CRC polynomial register
  u32 volatile crcpr;
  /// Offset: 0x14 RX CRC register
  u32 volatile rxcrcr;
  /// Offset: 0x18 TX CRC register
  u32 volatile txcrcr;
  /// Offset: 0x1C I2S configuration register
  u32 volatile i2scfgr;
  /// Offset: 0x20 I2S prescaler register
  u32 volatile i2spr;
};

static_assert(offsetof(spi_reg_t, dr) == 0x0C);
static_assert(offsetof(rcc_reg_t, apb2rstr) == 0x0C);
static_assert(offsetof(rcc_reg_t, apb2enr) == 0x18);

namespace cr1 {
/// Clock phase: 1 = data captured on the second clock transition
static constexpr auto clock_phase = hal::bit_mask::from<0>();
/// Clock polarity: 1 = clock idles high
static constexpr auto clock_polarity = hal::bit_mask::from<1>();
/// Controller (master) configuration
static constexpr auto master = hal::bit_mask::from<2>();
/// Baud rate control, fPCLK / 2^(value + 1)
static constexpr auto baud_rate = hal::bit_mask::from<3, 5>();
/// Peripheral enable
static constexpr auto enable = hal::bit_mask::from<6>();
/// Frame format: 1 = LSB transmitted first
static constexpr auto lsb_first = hal::bit_mask::from<7>();
/// Internal slave select level, used when software_slave_select is set
static constexpr auto internal_slave_select = hal::bit_mask::from<8>();
/// Software slave management
static constexpr auto software_slave_select = hal::bit_mask::from<9>();
/// Receive only mode
static constexpr auto receive_only = hal::bit_mask::from<10>();
/// Bidirectional (single data line) mode
static constexpr auto bidirectional = hal::bit_mask::from<15>();
}  // namespace cr1

namespace cr2 {
/// Value of CR2 after reset: data size field set to 8-bit frames
static constexpr u32 reset_value = 0x0000'0700;
/// SS output enable
static constexpr auto slave_select_output = hal::bit_mask::from<2>();
/// RXNE threshold: 1 = RXNE rises once 8 bits are in the receive FIFO. With
/// 0 it waits for 16 bits, which a single byte exchange never delivers.
static constexpr auto rx_fifo_threshold = hal::bit_mask::from<12>();
}  // namespace cr2

namespace sr {
/// Receive buffer not empty
static constexpr auto receive_not_empty = hal::bit_mask::from<0>();
/// Transmit buffer empty
static constexpr auto transmit_empty = hal::bit_mask::from<1>();
/// CRC error
static constexpr auto crc_error = hal::bit_mask::from<4>();
/// Mode fault
static constexpr auto mode_fault = hal::bit_mask::from<5>();
/// Overrun
static constexpr auto overrun = hal::bit_mask::from<6>();
}  // namespace sr

/// General purpose I/O port register block
struct gpio_reg_t
{
  /// Offset: 0x00 Port mode register
  u32 volatile moder;
  /// Offset: 0x04 Port output type register
  u32 volatile otyper;
  /// Offset: 0x08 Port output speed register
  u32 volatile ospeedr;
  /// Offset: 0x0C Port pull-up/pull-down register
  u32 volatile pupdr;
  /// Offset: 0x10 Port input data register
  u32 volatile idr;
  /// Offset: 0x14 Port output data register
  u32 volatile odr;
  /// Offset: 0x18 Port bit set/reset register
  u32 volatile bsrr;
  /// Offset: 0x1C Port configuration lock register
  u32 volatile lckr;
  /// Offset: 0x20 Alternate function low register (pins 0 to 7) and
  /// Offset: 0x24 Alternate function high register (pins 8 to 15)
  u32 volatile afr[2];
  /// Offset: 0x28 Port bit reset register
  u32 volatile brr;
};

static_assert(offsetof(gpio_reg_t, afr) == 0x20);

namespace moder {
/// Two bit mode value for alternate function mode
static constexpr u32 alternate_function = 0b10U;
}  // namespace moder

/// Base addresses of the blocks on the STM32F042
namespace address {
static constexpr uptr rcc = 0x4002'1000;
static constexpr uptr spi1 = 0x4001'3000;
static constexpr uptr gpioa = 0x4800'0000;
static constexpr uptr gpiob = 0x4800'0400;
}  // namespace address
}  // namespace f0spi
