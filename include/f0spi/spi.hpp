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

#include "clocks.hpp"
#include "full_duplex.hpp"
#include "pin_binding.hpp"
#include "registers.hpp"
#include "units.hpp"

namespace f0spi {
/**
 * @brief What `read()` reports when the receive buffer is empty
 *
 */
enum class empty_read_policy : u8
{
  /**
   * @brief Return the byte 0 as if it had been received
   *
   * This is the long standing behavior of this driver and what existing
   * callers that poll `read()` right after `send()` rely on. It is not true
   * non-blocking behavior: a caller cannot tell a received 0x00 from "nothing
   * received yet".
   */
  return_zero,
  /**
   * @brief Return `nb::would_block` so the caller polls again
   *
   * Matches what `send()` does when the transmit buffer is full.
   */
  would_block,
};

/**
 * @brief Settings for a spi bus
 *
 */
struct spi_settings
{
  /**
   * @brief Requested bus clock rate
   *
   * The prescaler is picked from the floored ratio of the bus clock to this
   * value, see `baud_rate_divisor()`. Use `prescaled_clock_rate()` to find the
   * rate that will actually be used.
   */
  hertz clock_rate = 100_kHz;

  /// Clock polarity and phase
  mode bus_mode = mode0;

  /// Behavior of `read()` when no byte has been received
  empty_read_policy on_empty_read = empty_read_policy::return_zero;

  /**
   * @brief Enables default comparison
   *
   */
  bool operator==(spi_settings const&) const = default;
};

/**
 * @brief Compute the CR1 baud rate code for a requested clock rate
 *
 * The code selects a prescaler of 2^(code + 1). The ratio between the bus
 * clock and the requested rate is floored and then bucketed:
 *
 *     ratio    | 1-2 | 3-5 | 6-11 | 12-23 | 24-47 | 48-95 | 96-191 | 192+
 *     code     |  0  |  1  |  2   |   3   |   4   |   5   |   6    |  7
 *     prescale |  2  |  4  |  8   |  16   |  32   |  64   |  128   | 256
 *
 * Ratios at the low edge of a bucket land at or below the requested rate.
 * Ratios at the high edge of a bucket can land above it, for example a ratio
 * of 11 uses a prescaler of 8.
 *
 * @param p_bus_clock - frequency of the clock feeding the peripheral
 * @param p_requested - requested bus clock rate
 * @return u8 - baud rate code from 0 to 7
 * @throws f0spi::argument_out_of_domain - if p_requested is 0
 * @throws f0spi::operation_not_supported - if p_requested is above
 * p_bus_clock. This is a bug in the settings and is NOT recoverable.
 */
[[nodiscard]] u8 baud_rate_divisor(hertz p_bus_clock, hertz p_requested);

/**
 * @brief Clock rate produced by a baud rate code
 *
 * @param p_bus_clock - frequency of the clock feeding the peripheral
 * @param p_code - baud rate code from 0 to 7
 * @return hertz - p_bus_clock / 2^(p_code + 1)
 */
[[nodiscard]] constexpr hertz prescaled_clock_rate(hertz p_bus_clock,
                                                   u8 p_code)
{
  return p_bus_clock >> (p_code + 1U);
}

namespace detail {
/**
 * @brief Disable, configure and re-enable a spi register block as a
 * controller
 *
 * The peripheral must already be clocked and reset.
 *
 * @param p_reg - spi register block
 * @param p_mode - clock polarity and phase
 * @param p_bus_clock - frequency of the clock feeding the peripheral
 * @param p_clock_rate - requested bus clock rate
 * @throws see `baud_rate_divisor()`
 */
void configure_controller(spi_reg_t& p_reg,
                          mode p_mode,
                          hertz p_bus_clock,
                          hertz p_clock_rate);

/// Checks the status register once and takes a byte if one was received
full_duplex::read_result read_byte(spi_reg_t& p_reg,
                                   empty_read_policy p_on_empty_read);

/// Checks the status register once and writes the byte if there is room
full_duplex::send_result send_byte(spi_reg_t& p_reg, byte p_byte);
}  // namespace detail

/**
 * @brief Full duplex spi bus controller driver
 *
 * Frames are 8 bits, MSB first. The driver is always the bus controller and
 * chip select is left to the application. The NSS pin is never driven.
 *
 * The peripheral handle and the pins are owned by the driver until
 * `release()` gives them back.
 *
 * USAGE:
 *
 *     auto device = f0spi::peripherals::take();
 *     auto port_a = std::move(device.gpioa).split();
 *     auto pins = std::tuple{ std::move(port_a.p5).into_alternate_af0(),
 *                             std::move(port_a.p6).into_alternate_af0(),
 *                             std::move(port_a.p7).into_alternate_af0() };
 *     f0spi::spi bus(std::move(device.spi1),
 *                    std::move(pins),
 *                    { .clock_rate = 1_MHz, .bus_mode = f0spi::mode0 },
 *                    clocks);
 *
 * @tparam peripheral_t - peripheral handle type
 * @tparam pins_t - tuple of pins, must be declared in `pin_binding`
 */
template<class peripheral_t, class pins_t>
  requires bound_pins<pins_t, peripheral_t>
class spi : public full_duplex
{
public:
  using settings = spi_settings;

  /**
   * @brief Power on, reset and configure the peripheral
   *
   * @param p_peripheral - handle of the peripheral to drive
   * @param p_pins - pins connected to the peripheral
   * @param p_settings - bus configuration
   * @param p_clocks - frozen clock frequencies
   * @throws f0spi::operation_not_supported - if the requested clock rate is
   * above the peripheral's bus clock.
   * @throws f0spi::argument_out_of_domain - if the requested clock rate is 0.
   */
  spi(peripheral_t&& p_peripheral,
      pins_t&& p_pins,
      spi_settings const& p_settings,
      clocks const& p_clocks)
    : m_peripheral(std::move(p_peripheral))
    , m_pins(std::move(p_pins))
    , m_on_empty_read(p_settings.on_empty_read)
  {
    rcc_reg_t& clock_control = m_peripheral.rcc();

    hal::bit_modify(clock_control.apb2enr)
      .template set<peripheral_t::rcc_bit>();

    // Pulse reset so the peripheral starts from its power on state
    hal::bit_modify(clock_control.apb2rstr)
      .template set<peripheral_t::rcc_bit>();
    hal::bit_modify(clock_control.apb2rstr)
      .template clear<peripheral_t::rcc_bit>();

    detail::configure_controller(m_peripheral.reg(),
                                 p_settings.bus_mode,
                                 p_clocks.pclk,
                                 p_settings.clock_rate);
  }

  spi(spi const&) = delete;
  spi& operator=(spi const&) = delete;
  spi(spi&&) noexcept = default;
  spi& operator=(spi&&) noexcept = default;
  ~spi() override = default;

  /**
   * @brief Give back the peripheral handle and pins
   *
   * The peripheral is left enabled and configured.
   *
   * @return std::pair<peripheral_t, pins_t> - handle and pins
   */
  [[nodiscard]] std::pair<peripheral_t, pins_t> release() &&
  {
    return { std::move(m_peripheral), std::move(m_pins) };
  }

private:
  read_result driver_read() override
  {
    return detail::read_byte(m_peripheral.reg(), m_on_empty_read);
  }

  send_result driver_send(byte p_byte) override
  {
    return detail::send_byte(m_peripheral.reg(), p_byte);
  }

  peripheral_t m_peripheral;
  pins_t m_pins;
  empty_read_policy m_on_empty_read;
};
}  // namespace f0spi
