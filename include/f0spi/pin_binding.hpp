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
 * @file pin_binding.hpp
 * @brief Compile time allow-list of pin tuples per spi peripheral
 *
 */
#pragma once

#include <tuple>
#include <type_traits>

#include "gpio.hpp"
#include "peripherals.hpp"

namespace f0spi {
/**
 * @brief Declares whether a pin tuple may be bound to a spi peripheral
 *
 * The primary template rejects everything. Each legal combination is an
 * explicit specialization deriving from std::true_type. There is no structural
 * matching: a tuple with the same pins in a different order, or the right pins
 * in the wrong mode, is rejected.
 *
 * To support another pin set, add a specialization. Nothing else needs to
 * change.
 *
 * @tparam pins_t - std::tuple<clock, controller input, controller output>
 * @tparam peripheral_t - peripheral handle type
 */
template<class pins_t, class peripheral_t>
struct pin_binding : std::false_type
{};

/// SPI1 on PA5 (SCK), PA6 (MISO), PA7 (MOSI), all AF0
template<>
struct pin_binding<
  std::tuple<gpio::pa5<gpio::af0>, gpio::pa6<gpio::af0>, gpio::pa7<gpio::af0>>,
  spi1_handle> : std::true_type
{};

/// SPI1 on PB3 (SCK), PB4 (MISO), PB5 (MOSI), all AF0
template<>
struct pin_binding<
  std::tuple<gpio::pb3<gpio::af0>, gpio::pb4<gpio::af0>, gpio::pb5<gpio::af0>>,
  spi1_handle> : std::true_type
{};

/**
 * @brief Satisfied when `pins_t` has been declared legal for `peripheral_t`
 *
 * USAGE:
 *
 *     static_assert(f0spi::bound_pins<my_pins, f0spi::spi1_handle>);
 *
 */
template<class pins_t, class peripheral_t>
concept bound_pins = pin_binding<pins_t, peripheral_t>::value;
}  // namespace f0spi
