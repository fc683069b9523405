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

#include <array>
#include <print>
#include <tuple>
#include <utility>

#include <f0spi/blocking.hpp>
#include <f0spi/clocks.hpp>
#include <f0spi/error.hpp>
#include <f0spi/peripherals.hpp>
#include <f0spi/registers.hpp>
#include <f0spi/spi.hpp>

using namespace f0spi::literals;

namespace {
// Register blocks in RAM so the package can be checked on the build machine.
// Writing DR and reading it back acts as a loopback.
f0spi::rcc_reg_t rcc{};
f0spi::spi_reg_t spi1{};
f0spi::gpio_reg_t gpioa{};
f0spi::gpio_reg_t gpiob{};

f0spi::peripheral_map simulated_map()
{
  return f0spi::peripheral_map{
    .rcc = reinterpret_cast<f0spi::uptr>(&rcc),
    .spi1 = reinterpret_cast<f0spi::uptr>(&spi1),
    .gpioa = reinterpret_cast<f0spi::uptr>(&gpioa),
    .gpiob = reinterpret_cast<f0spi::uptr>(&gpiob),
  };
}
}  // namespace

int main()
{
  int status = 0;
  constexpr f0spi::clocks clocks{ .sysclk = 48_MHz,
                                  .hclk = 48_MHz,
                                  .pclk = 48_MHz };

  try {
    auto device = f0spi::peripherals::take(simulated_map());
    auto port_a = std::move(device.gpioa).split();
    auto pins = std::tuple{ std::move(port_a.p5).into_alternate_af0(),
                            std::move(port_a.p6).into_alternate_af0(),
                            std::move(port_a.p7).into_alternate_af0() };

    f0spi::spi bus(std::move(device.spi1),
                   std::move(pins),
                   { .clock_rate = 1_MHz, .bus_mode = f0spi::mode0 },
                   clocks);

    std::println("CR1 = 0x{:04X}", f0spi::u32{ spi1.cr1 });
    std::println(
      "SCK = {} Hz",
      f0spi::prescaled_clock_rate(
        clocks.pclk, f0spi::baud_rate_divisor(clocks.pclk, 1_MHz)));

    spi1.sr = f0spi::sr::transmit_empty.value<f0spi::u32>() |
              f0spi::sr::receive_not_empty.value<f0spi::u32>();

    std::array<f0spi::byte, 4> buffer{ 0xCA, 0xFE, 0xF0, 0x0D };
    f0spi::transfer(bus, buffer);
    std::println("looped back = {::02X}", buffer);

    // Simulate a byte arriving before the previous one was read
    spi1.sr = f0spi::sr::overrun.value<f0spi::u32>();
    f0spi::write(bus, buffer);

    std::println("Overrun was not reported!");
    status = -1;
  } catch (f0spi::bus_fault const& p_fault) {
    std::println("Caught bus_fault successfully!");
    std::println("    Object address: {}", p_fault.instance());
    std::println("    Kind: {}", static_cast<int>(p_fault.kind));
  } catch (f0spi::exception const& p_error) {
    std::println("Unexpected error: {}", static_cast<int>(p_error.error_code()));
    status = -1;
  }

  return status;
}
