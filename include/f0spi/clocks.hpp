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

#include "units.hpp"

namespace f0spi {
/**
 * @brief Snapshot of the clock tree frequencies after clock configuration
 *
 * Produced by whatever code configures the system clocks. Drivers only read
 * it. Values are taken at face value and are not checked against the RCC
 * registers.
 *
 */
struct clocks
{
  /// System clock
  hertz sysclk = 8_MHz;
  /// AHB bus clock
  hertz hclk = 8_MHz;
  /// APB bus clock, which feeds SPI1
  hertz pclk = 8_MHz;

  bool operator==(clocks const&) const = default;
};
}  // namespace f0spi
