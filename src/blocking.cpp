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

#include <f0spi/blocking.hpp>

#include <f0spi/error.hpp>
#include <f0spi/nb.hpp>

namespace f0spi {
namespace {
void send_blocking(full_duplex& p_bus, byte p_byte)
{
  auto const outcome = nb::block([&p_bus, p_byte]() {
    return p_bus.send(p_byte);
  });
  if (outcome.has_error()) {
    safe_throw(bus_fault(outcome.error(), &p_bus));
  }
}

byte read_blocking(full_duplex& p_bus)
{
  auto const outcome = nb::block([&p_bus]() { return p_bus.read(); });
  if (outcome.has_error()) {
    safe_throw(bus_fault(outcome.error(), &p_bus));
  }
  return outcome.value();
}
}  // namespace

void write(full_duplex& p_bus, std::span<byte const> p_data_out)
{
  for (auto const& data : p_data_out) {
    send_blocking(p_bus, data);
  }
}

void transfer(full_duplex& p_bus, std::span<byte> p_data)
{
  for (auto& data : p_data) {
    send_blocking(p_bus, data);
    data = read_blocking(p_bus);
  }
}
}  // namespace f0spi
