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

#include <f0spi/peripherals.hpp>

#include <f0spi/error.hpp>
#include <f0spi/registers.hpp>

namespace f0spi {
namespace {
// Single threaded and never reset. Set once by the first take().
bool peripherals_taken = false;

template<class reg_t>
reg_t* to_reg(uptr p_address)
{
  // NOLINTNEXTLINE(performance-no-int-to-ptr)
  return reinterpret_cast<reg_t*>(p_address);
}
}  // namespace

peripherals::peripherals(peripheral_map const& p_map)
  : spi1(to_reg<spi_reg_t>(p_map.spi1), to_reg<rcc_reg_t>(p_map.rcc))
  , gpioa(to_reg<gpio_reg_t>(p_map.gpioa), to_reg<rcc_reg_t>(p_map.rcc))
  , gpiob(to_reg<gpio_reg_t>(p_map.gpiob), to_reg<rcc_reg_t>(p_map.rcc))
{
}

peripherals peripherals::take(peripheral_map const& p_map)
{
  if (peripherals_taken) {
    safe_throw(operation_not_permitted(nullptr));
  }
  peripherals_taken = true;
  return peripherals(p_map);
}

peripherals peripherals::steal(peripheral_map const& p_map)
{
  return peripherals(p_map);
}
}  // namespace f0spi
