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

#pragma once

#include <utility>

#include "gpio.hpp"
#include "registers.hpp"
#include "units.hpp"

namespace f0spi {
/**
 * @brief Addresses of the register blocks handed out by `peripherals`
 *
 * Defaults to the STM32F042 memory map. Tests and simulators can point each
 * block at ordinary memory.
 *
 */
struct peripheral_map
{
  uptr rcc = address::rcc;
  uptr spi1 = address::spi1;
  uptr gpioa = address::gpioa;
  uptr gpiob = address::gpiob;
};

/**
 * @brief Exclusive ownership of the SPI1 peripheral
 *
 * Constructing a spi driver consumes this handle and releasing the driver
 * gives it back. There is never more than one live handle per peripheral
 * obtained through `peripherals::take()`. A moved-from handle must not be
 * used.
 *
 */
class spi1_handle
{
public:
  /// Bit in RCC APB2ENR and APB2RSTR controlling this peripheral
  static constexpr auto rcc_bit = f0spi::rcc::spi1;

  spi1_handle(spi1_handle const&) = delete;
  spi1_handle& operator=(spi1_handle const&) = delete;

  spi1_handle(spi1_handle&& p_other) noexcept
    : m_reg(std::exchange(p_other.m_reg, nullptr))
    , m_rcc(std::exchange(p_other.m_rcc, nullptr))
  {
  }

  spi1_handle& operator=(spi1_handle&& p_other) noexcept
  {
    m_reg = std::exchange(p_other.m_reg, nullptr);
    m_rcc = std::exchange(p_other.m_rcc, nullptr);
    return *this;
  }

  ~spi1_handle() = default;

  /// @return spi_reg_t& - the peripheral's register block
  [[nodiscard]] spi_reg_t& reg() const
  {
    return *m_reg;
  }

  /// @return rcc_reg_t& - the reset and clock control register block
  [[nodiscard]] rcc_reg_t& rcc() const
  {
    return *m_rcc;
  }

private:
  friend class peripherals;

  spi1_handle(spi_reg_t* p_reg, rcc_reg_t* p_rcc)
    : m_reg(p_reg)
    , m_rcc(p_rcc)
  {
  }

  spi_reg_t* m_reg;
  rcc_reg_t* m_rcc;
};

/**
 * @brief The set of hardware handles for the microcontroller
 *
 * Each physical peripheral exists exactly once. `take()` hands the whole set
 * out once per program, and each handle is move-only, so the compiler rejects
 * any attempt to give two drivers the same peripheral.
 *
 * USAGE:
 *
 *     auto device = f0spi::peripherals::take();
 *     auto port_a = std::move(device.gpioa).split();
 *
 */
class peripherals
{
public:
  f0spi::spi1_handle spi1;
  gpio::port_handle<'A'> gpioa;
  gpio::port_handle<'B'> gpiob;

  /**
   * @brief Acquire the peripherals
   *
   * @param p_map - register block addresses
   * @return peripherals - the one and only set of handles
   * @throws f0spi::operation_not_permitted - if the peripherals were already
   * taken. This is a bug in the application and is NOT recoverable.
   */
  [[nodiscard]] static peripherals take(peripheral_map const& p_map = {});

  /**
   * @brief Acquire the peripherals without checking if they were taken
   *
   * Intended for board bring-up code and tests that point the map at
   * simulated registers. Using this alongside `take()` on real hardware
   * breaks the single owner guarantee.
   *
   * @param p_map - register block addresses
   * @return peripherals - a fresh set of handles
   */
  [[nodiscard]] static peripherals steal(peripheral_map const& p_map = {});

private:
  peripherals(peripheral_map const& p_map);
};
}  // namespace f0spi
