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

#include <tuple>
#include <utility>

#include <f0spi/gpio.hpp>
#include <f0spi/peripherals.hpp>
#include <f0spi/registers.hpp>
#include <f0spi/units.hpp>

namespace f0spi {
/**
 * @brief Register blocks backed by ordinary memory
 *
 * Writes stick and reads return the last value written, nothing more. Status
 * flags are set by the test. Because DR is plain memory, a byte written to it
 * is the byte read back, which behaves like MOSI wired to MISO.
 *
 */
struct simulated_mcu
{
  rcc_reg_t rcc{};
  spi_reg_t spi1{};
  gpio_reg_t gpioa{};
  gpio_reg_t gpiob{};

  [[nodiscard]] peripheral_map map()
  {
    return peripheral_map{
      .rcc = reinterpret_cast<uptr>(&rcc),
      .spi1 = reinterpret_cast<uptr>(&spi1),
      .gpioa = reinterpret_cast<uptr>(&gpioa),
      .gpiob = reinterpret_cast<uptr>(&gpiob),
    };
  }

  void status(u32 p_flags)
  {
    spi1.sr = p_flags;
  }
};

template<class... fields>
constexpr u32 flags(fields... p_fields)
{
  return (p_fields.template value<u32>() | ... | 0U);
}

using port_a_pins =
  std::tuple<gpio::pa5<gpio::af0>, gpio::pa6<gpio::af0>, gpio::pa7<gpio::af0>>;
using port_b_pins =
  std::tuple<gpio::pb3<gpio::af0>, gpio::pb4<gpio::af0>, gpio::pb5<gpio::af0>>;

inline port_a_pins spi1_pins(gpio::port_handle<'A'>&& p_port)
{
  auto port = std::move(p_port).split();
  return port_a_pins{ std::move(port.p5).into_alternate_af0(),
                      std::move(port.p6).into_alternate_af0(),
                      std::move(port.p7).into_alternate_af0() };
}

inline port_b_pins spi1_pins(gpio::port_handle<'B'>&& p_port)
{
  auto port = std::move(p_port).split();
  return port_b_pins{ std::move(port.p3).into_alternate_af0(),
                      std::move(port.p4).into_alternate_af0(),
                      std::move(port.p5).into_alternate_af0() };
}
}  // namespace f0spi
