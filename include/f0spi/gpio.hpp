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

#include <libhal-util/bit.hpp>

#include "error.hpp"
#include "registers.hpp"
#include "units.hpp"

namespace f0spi {
class peripherals;
}  // namespace f0spi

namespace f0spi::gpio {
/// Pin mode: digital input (mode after reset)
struct input
{};

/**
 * @brief Pin mode: connected to a peripheral through an alternate function
 *
 * @tparam function - alternate function index, 0 to 7
 */
template<u8 function>
struct alternate
{
  static_assert(function < 8, "STM32F0 alternate functions are AF0 to AF7");
  static constexpr u8 index = function;
};

using af0 = alternate<0>;

/**
 * @brief Program the mode and alternate function registers of a pin
 *
 * @tparam number - pin number within the port
 * @param p_reg - port register block
 * @param p_function - alternate function index
 */
template<u8 number>
void configure_alternate(gpio_reg_t& p_reg, u8 p_function)
{
  constexpr auto mode_field =
    hal::bit_mask{ .position = number * 2U, .width = 2U };
  constexpr auto function_field =
    hal::bit_mask{ .position = (number % 8U) * 4U, .width = 4U };

  hal::bit_modify(p_reg.afr[number / 8U])
    .template insert<function_field>(p_function);
  hal::bit_modify(p_reg.moder)
    .template insert<mode_field>(moder::alternate_function);
}

/**
 * @brief A single physical signal line and its current mode
 *
 * Pins are move-only tokens. A pin's mode is part of its type, so the type
 * system can reject pins that have not been configured for a peripheral. A
 * moved-from pin must not be used.
 *
 * @tparam port - port letter, 'A' or 'B'
 * @tparam number - pin number within the port, 0 to 15
 * @tparam mode_t - current pin mode
 */
template<char port, u8 number, class mode_t>
class pin
{
public:
  static_assert(number < 16, "Ports have 16 pins, 0 to 15");

  static constexpr char port_letter = port;
  static constexpr u8 pin_number = number;
  using mode = mode_t;

  pin(pin const&) = delete;
  pin& operator=(pin const&) = delete;

  pin(pin&& p_other) noexcept
    : m_reg(std::exchange(p_other.m_reg, nullptr))
  {
  }

  pin& operator=(pin&& p_other) noexcept
  {
    m_reg = std::exchange(p_other.m_reg, nullptr);
    return *this;
  }

  ~pin() = default;

  /**
   * @brief Connect this pin to a peripheral through an alternate function
   *
   * Consumes the pin and returns it re-typed in its new mode.
   *
   * @tparam function - alternate function index
   * @return pin<port, number, alternate<function>> - the configured pin
   */
  template<u8 function>
  [[nodiscard]] pin<port, number, alternate<function>> into_alternate() &&
  {
    configure_alternate<number>(*m_reg, function);
    return pin<port, number, alternate<function>>(
      std::exchange(m_reg, nullptr));
  }

  /// Shorthand for `into_alternate<0>()`
  [[nodiscard]] pin<port, number, af0> into_alternate_af0() &&
  {
    return std::move(*this).template into_alternate<0>();
  }

private:
  template<char, u8, class>
  friend class pin;

  template<char>
  friend class port_handle;

  explicit pin(gpio_reg_t* p_reg)
    : m_reg(p_reg)
  {
  }

  gpio_reg_t* m_reg;
};

template<class mode_t>
using pa5 = pin<'A', 5, mode_t>;
template<class mode_t>
using pa6 = pin<'A', 6, mode_t>;
template<class mode_t>
using pa7 = pin<'A', 7, mode_t>;
template<class mode_t>
using pb3 = pin<'B', 3, mode_t>;
template<class mode_t>
using pb4 = pin<'B', 4, mode_t>;
template<class mode_t>
using pb5 = pin<'B', 5, mode_t>;

/**
 * @brief Every pin of a port, in input mode, as handed out by `split()`
 *
 * @tparam port - port letter
 */
template<char port>
struct parts
{
  pin<port, 0, input> p0;
  pin<port, 1, input> p1;
  pin<port, 2, input> p2;
  pin<port, 3, input> p3;
  pin<port, 4, input> p4;
  pin<port, 5, input> p5;
  pin<port, 6, input> p6;
  pin<port, 7, input> p7;
  pin<port, 8, input> p8;
  pin<port, 9, input> p9;
  pin<port, 10, input> p10;
  pin<port, 11, input> p11;
  pin<port, 12, input> p12;
  pin<port, 13, input> p13;
  pin<port, 14, input> p14;
  pin<port, 15, input> p15;
};

/**
 * @brief Exclusive ownership of one GPIO port
 *
 * Obtained from `f0spi::peripherals`.
 *
 * @tparam port - port letter, 'A' or 'B'
 */
template<char port>
class port_handle
{
public:
  port_handle(port_handle const&) = delete;
  port_handle& operator=(port_handle const&) = delete;

  port_handle(port_handle&& p_other) noexcept
    : m_reg(std::exchange(p_other.m_reg, nullptr))
    , m_rcc(std::exchange(p_other.m_rcc, nullptr))
  {
  }

  port_handle& operator=(port_handle&& p_other) noexcept
  {
    m_reg = std::exchange(p_other.m_reg, nullptr);
    m_rcc = std::exchange(p_other.m_rcc, nullptr);
    return *this;
  }

  ~port_handle() = default;

  /**
   * @brief Enable the port's clock and hand out its pins
   *
   * @return parts<port> - all 16 pins of the port in input mode
   */
  [[nodiscard]] parts<port> split() &&
  {
    if constexpr (port == 'A') {
      hal::bit_modify(m_rcc->ahbenr).template set<rcc::gpioa>();
    } else if constexpr (port == 'B') {
      hal::bit_modify(m_rcc->ahbenr).template set<rcc::gpiob>();
    } else {
      static_assert(error::invalid_option<port>,
                    "Only ports A and B are mapped");
    }

    auto* reg = std::exchange(m_reg, nullptr);
    m_rcc = nullptr;

    return parts<port>{
      pin<port, 0, input>(reg),  pin<port, 1, input>(reg),
      pin<port, 2, input>(reg),  pin<port, 3, input>(reg),
      pin<port, 4, input>(reg),  pin<port, 5, input>(reg),
      pin<port, 6, input>(reg),  pin<port, 7, input>(reg),
      pin<port, 8, input>(reg),  pin<port, 9, input>(reg),
      pin<port, 10, input>(reg), pin<port, 11, input>(reg),
      pin<port, 12, input>(reg), pin<port, 13, input>(reg),
      pin<port, 14, input>(reg), pin<port, 15, input>(reg),
    };
  }

private:
  friend class f0spi::peripherals;

  port_handle(gpio_reg_t* p_reg, rcc_reg_t* p_rcc)
    : m_reg(p_reg)
    , m_rcc(p_rcc)
  {
  }

  gpio_reg_t* m_reg;
  rcc_reg_t* m_rcc;
};
}  // namespace f0spi::gpio
