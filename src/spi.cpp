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

#include <f0spi/spi.hpp>

#include <array>
#include <optional>

#include <libhal-util/bit.hpp>

#include <f0spi/error.hpp>
#include <f0spi/nb.hpp>
#include <f0spi/registers.hpp>

namespace f0spi {
namespace {
// Upper bound (inclusive) of the bus clock to spi clock ratio for each baud
// rate code. Ratios past the last bound use code 7.
constexpr std::array<u32, 7> ratio_upper_bound{ 2, 5, 11, 23, 47, 95, 191 };

// DR is 16 bits wide. A 16-bit access packs or unpacks two frames, so every
// access is done with a single byte to move exactly one frame.
byte volatile& data_register_byte(spi_reg_t& p_reg)
{
  return *reinterpret_cast<byte volatile*>(&p_reg.dr);
}

// Error flags take precedence over data availability, in this order
std::optional<spi_error> status_error(u32 p_status)
{
  if (hal::bit_extract<sr::overrun>(p_status)) {
    return spi_error::overrun;
  }
  if (hal::bit_extract<sr::mode_fault>(p_status)) {
    return spi_error::mode_fault;
  }
  if (hal::bit_extract<sr::crc_error>(p_status)) {
    return spi_error::crc;
  }
  return std::nullopt;
}
}  // namespace

u8 baud_rate_divisor(hertz p_bus_clock, hertz p_requested)
{
  if (p_requested == 0) {
    safe_throw(argument_out_of_domain(nullptr));
  }

  auto const ratio = p_bus_clock / p_requested;

  if (ratio == 0) {
    safe_throw(operation_not_supported(nullptr));
  }

  u8 code = 0;
  for (auto const bound : ratio_upper_bound) {
    if (ratio <= bound) {
      return code;
    }
    code++;
  }
  return code;
}

namespace detail {
void configure_controller(spi_reg_t& p_reg,
                          mode p_mode,
                          hertz p_bus_clock,
                          hertz p_clock_rate)
{
  hal::bit_modify(p_reg.cr1).clear<cr1::enable>();

  // NSS is left to the application, never driven by hardware. RXNE must rise
  // on every received byte for 8-bit frames.
  p_reg.cr2 = hal::bit_value<u32>(cr2::reset_value)
                .clear<cr2::slave_select_output>()
                .set<cr2::rx_fifo_threshold>()
                .get();

  auto const baud_rate = baud_rate_divisor(p_bus_clock, p_clock_rate);

  // Single write: the peripheral is enabled together with its configuration.
  // SSI must be high with SSM set or the controller faults straight away.
  hal::bit_value<u32> control(0U);
  if (p_mode.clock_phase == phase::capture_on_second_transition) {
    control.set<cr1::clock_phase>();
  }
  if (p_mode.clock_polarity == polarity::idle_high) {
    control.set<cr1::clock_polarity>();
  }
  p_reg.cr1 =
    control.set<cr1::master>()
      .insert<cr1::baud_rate>(baud_rate)
      .clear<cr1::lsb_first>()
      .set<cr1::software_slave_select>()
      .set<cr1::internal_slave_select>()
      .clear<cr1::receive_only>()
      .clear<cr1::bidirectional>()
      .set<cr1::enable>()
      .get();
}

full_duplex::read_result read_byte(spi_reg_t& p_reg,
                                   empty_read_policy p_on_empty_read)
{
  u32 const status = p_reg.sr;

  if (auto const error = status_error(status)) {
    return nb::fail(*error);
  }

  if (hal::bit_extract<sr::receive_not_empty>(status)) {
    byte const received = data_register_byte(p_reg);
    return received;
  }

  if (p_on_empty_read == empty_read_policy::would_block) {
    return nb::would_block;
  }
  return byte{ 0 };
}

full_duplex::send_result send_byte(spi_reg_t& p_reg, byte p_byte)
{
  u32 const status = p_reg.sr;

  if (auto const error = status_error(status)) {
    return nb::fail(*error);
  }

  if (hal::bit_extract<sr::transmit_empty>(status)) {
    data_register_byte(p_reg) = p_byte;
    return {};
  }

  return nb::would_block;
}
}  // namespace detail
}  // namespace f0spi
