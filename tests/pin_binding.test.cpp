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

#include <f0spi/pin_binding.hpp>

#include <tuple>

#include <f0spi/gpio.hpp>
#include <f0spi/peripherals.hpp>
#include <f0spi/spi.hpp>

#include <boost/ut.hpp>

#include "helpers.hpp"

namespace f0spi {
namespace {
using gpio::af0;
using gpio::input;

class other_peripheral
{};

template<class pins_t>
constexpr bool accepted_by_driver = requires {
  typename spi<spi1_handle, pins_t>;
};
}  // namespace

boost::ut::suite<"pin_binding_test"> pin_binding_test = []() {
  using namespace boost::ut;

  "declared pin sets are bound"_test = []() {
    static_assert(bound_pins<port_a_pins, spi1_handle>);
    static_assert(bound_pins<port_b_pins, spi1_handle>);
    static_assert(accepted_by_driver<port_a_pins>);
    static_assert(accepted_by_driver<port_b_pins>);
  };

  "pins in the wrong order are rejected"_test = []() {
    static_assert(not bound_pins<
                  std::tuple<gpio::pa5<af0>, gpio::pa7<af0>, gpio::pa6<af0>>,
                  spi1_handle>);
    static_assert(not bound_pins<
                  std::tuple<gpio::pb5<af0>, gpio::pb4<af0>, gpio::pb3<af0>>,
                  spi1_handle>);
  };

  "pins in the wrong mode are rejected"_test = []() {
    static_assert(not bound_pins<std::tuple<gpio::pa5<input>,
                                            gpio::pa6<input>,
                                            gpio::pa7<input>>,
                                 spi1_handle>);
    static_assert(not bound_pins<std::tuple<gpio::pa5<gpio::alternate<5>>,
                                            gpio::pa6<af0>,
                                            gpio::pa7<af0>>,
                                 spi1_handle>);
  };

  "pins mixed across ports are rejected"_test = []() {
    static_assert(not bound_pins<
                  std::tuple<gpio::pa5<af0>, gpio::pb4<af0>, gpio::pa7<af0>>,
                  spi1_handle>);
    static_assert(not bound_pins<
                  std::tuple<gpio::pb3<af0>, gpio::pa6<af0>, gpio::pb5<af0>>,
                  spi1_handle>);
    static_assert(not accepted_by_driver<
                  std::tuple<gpio::pb3<af0>, gpio::pa6<af0>, gpio::pb5<af0>>>);
  };

  "pins are bound per peripheral"_test = []() {
    static_assert(not bound_pins<port_a_pins, other_peripheral>);
    static_assert(not bound_pins<std::tuple<>, spi1_handle>);
  };
};
}  // namespace f0spi
