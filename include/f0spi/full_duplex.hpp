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

#include "error.hpp"
#include "nb.hpp"
#include "units.hpp"

namespace f0spi {
/// Clock level while the bus is idle (CPOL)
enum class polarity : u8
{
  idle_low,
  idle_high,
};

/// Clock transition on which data is captured (CPHA)
enum class phase : u8
{
  capture_on_first_transition,
  capture_on_second_transition,
};

/**
 * @brief Clock polarity and phase of the bus
 *
 */
struct mode
{
  polarity clock_polarity = polarity::idle_low;
  phase clock_phase = phase::capture_on_first_transition;

  bool operator==(mode const&) const = default;
};

/// CPOL = 0, CPHA = 0
inline constexpr mode mode0{
  .clock_polarity = polarity::idle_low,
  .clock_phase = phase::capture_on_first_transition,
};
/// CPOL = 0, CPHA = 1
inline constexpr mode mode1{
  .clock_polarity = polarity::idle_low,
  .clock_phase = phase::capture_on_second_transition,
};
/// CPOL = 1, CPHA = 0
inline constexpr mode mode2{
  .clock_polarity = polarity::idle_high,
  .clock_phase = phase::capture_on_first_transition,
};
/// CPOL = 1, CPHA = 1
inline constexpr mode mode3{
  .clock_polarity = polarity::idle_high,
  .clock_phase = phase::capture_on_second_transition,
};

/**
 * @brief Non-blocking, byte oriented, full duplex serial bus
 *
 * Every byte sent clocks one byte in, so a caller that wants to receive must
 * send (filler bytes if nothing else) and read once per byte sent.
 *
 * Neither API waits. Each call checks the hardware once and returns a value,
 * `nb::would_block`, or a `spi_error`. Errors are reported on the call where
 * the condition is observed and are never retried by the implementation.
 *
 * See `f0spi::write()` and `f0spi::transfer()` for blocking operations built
 * on top of this interface.
 *
 */
class full_duplex
{
public:
  using read_result = nb::result<byte, spi_error>;
  using send_result = nb::result<void, spi_error>;

  /**
   * @brief Take the byte received by the last transfer
   *
   * @return read_result - the received byte, would_block if nothing has been
   * received yet, or the error reported by the bus.
   */
  [[nodiscard]] read_result read()
  {
    return driver_read();
  }

  /**
   * @brief Queue a byte for transmission
   *
   * @param p_byte - byte to shift out
   * @return send_result - success, would_block if the transmit buffer is
   * still full, or the error reported by the bus.
   */
  [[nodiscard]] send_result send(byte p_byte)
  {
    return driver_send(p_byte);
  }

  virtual ~full_duplex() = default;

private:
  virtual read_result driver_read() = 0;
  virtual send_result driver_send(byte p_byte) = 0;
};
}  // namespace f0spi
