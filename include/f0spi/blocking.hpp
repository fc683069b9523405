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
 * @file blocking.hpp
 * @brief Blocking multi-byte operations built on `f0spi::full_duplex`
 *
 * These work with any implementation of `full_duplex`. They busy wait on the
 * caller's thread by retrying while the bus reports `nb::would_block`, and
 * have no timeout.
 *
 */
#pragma once

#include <span>

#include "full_duplex.hpp"
#include "units.hpp"

namespace f0spi {
/**
 * @brief Send every byte of a buffer
 *
 * Bytes clocked in during the write are left in the receive buffer. Drivers
 * that report overrun will do so on the next call if they are never read.
 *
 * @param p_bus - bus to write to
 * @param p_data_out - bytes to send, in order
 * @throws f0spi::bus_fault - if the bus reports an error. Bytes before the
 * failing one have been sent.
 */
void write(full_duplex& p_bus, std::span<byte const> p_data_out);

/**
 * @brief Exchange a buffer with the device on the bus, in place
 *
 * For each position, the byte is sent and then the byte clocked in is read
 * back into the same position before the next byte is sent. Transfers are
 * never pipelined, so the receive buffer cannot overrun.
 *
 * @param p_data - bytes to send, replaced with the bytes received
 * @throws f0spi::bus_fault - if the bus reports an error. Positions before the
 * failing one hold received bytes, the rest are unchanged.
 */
void transfer(full_duplex& p_bus, std::span<byte> p_data);
}  // namespace f0spi
