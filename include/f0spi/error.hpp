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

#include <cstdint>
#include <system_error>
#include <type_traits>

#include "units.hpp"

namespace f0spi {

template<class thrown_t>
void safe_throw(thrown_t&& p_thrown_object)
{
  static_assert(
    std::is_trivially_destructible_v<std::remove_cvref_t<thrown_t>>,
    "safe_throw() only works with trivially destructible thrown types");

  throw p_thrown_object;
}

/**
 * @brief Error objects, templates, and constants.
 *
 */
namespace error {
/**
 * @brief Used for defining static_asserts that should always fail, but only if
 * the static_assert line is hit via `if constexpr` control block. Prefer to NOT
 * use this directly but to use `invalid_option` instead
 *
 * @tparam options ignored by the application but needed to create a non-trivial
 * specialization of this class which allows its usage in static_assert.
 */
template<auto... options>
struct invalid_option_t : std::false_type
{};
/**
 * @brief Helper definition to simplify the usage of invalid_option_t.
 *
 * @tparam options ignored by the application but needed to create a non-trivial
 * specialization of this class which allows its usage in static_assert.
 */
template<auto... options>
inline constexpr bool invalid_option = invalid_option_t<options...>::value;
}  // namespace error

/**
 * @brief Error conditions reported by the spi peripheral's status register
 *
 * This enumeration is open for extension. New enumerators may be added in
 * future versions without that being considered a breaking change, so code
 * that switches over this type must keep a default branch.
 */
enum class spi_error : u8
{
  /// A received byte was discarded because the previous one was not read in
  /// time. The caller is polling too slowly for the incoming data rate.
  overrun,
  /// The hardware detected another controller driving the bus or a pin
  /// configuration conflict on the chip select line.
  mode_fault,
  /// The received CRC did not match. CRC generation is never enabled by this
  /// library so this should not occur under normal use.
  crc,
};

/**
 * @brief Base exception class for all f0spi related exceptions
 *
 */
class exception
{
public:
  constexpr exception(std::errc p_error_code, void* p_instance)
    : m_instance(p_instance)
    , m_error_code(p_error_code)
  {
  }

  /**
   * @brief address of the object that threw an exception
   *
   * If the exception was thrown by a free function, this will be a nullptr.
   * The address is meant for lookup only, such as determining which driver
   * failed in order to craft a more accurate log message, or to find the
   * driver that must be re-initialized. Never cast it back into an object.
   *
   */
  [[nodiscard]] void const* instance() const
  {
    return m_instance;
  }

  /**
   * @brief Convert this exception to the closest C++ error code
   *
   * Useful when translating exceptions to error codes for a C API and for
   * logging the kind of exception that was thrown. For recovery, prefer
   * catching the derived classes.
   *
   * @return std::errc - error code represented by the exception
   */
  [[nodiscard]] std::errc error_code() const
  {
    return m_error_code;
  }

private:
  void* m_instance = nullptr;
  std::errc m_error_code{};
};

static_assert(std::is_trivially_destructible_v<exception>,
              "f0spi::exception MUST be trivially destructible.");

/**
 * @brief Raised to indicate an issue with low level I/O
 *
 * These are errors detected by hardware that are purely communication errors
 * in nature. They are usually NOT recoverable without re-initializing the
 * peripheral.
 *
 */
struct io_error : public exception
{
  /**
   * @brief Construct a new io_error exception
   *
   * @param p_instance - must point to the instance of the driver that threw
   * this exception. If this was thrown from a free function pass nullptr.
   */
  io_error(void* p_instance)
    : exception(std::errc::io_error, p_instance)
  {
  }
};

/**
 * @brief Raised by the blocking spi operations when the bus reports an error
 *
 * The `kind` field holds the exact status register condition observed. The
 * error is terminal for the transfer in progress. Recovery, such as
 * re-initializing the peripheral after a mode fault, is up to the caller.
 *
 */
struct bus_fault : public io_error
{
  /**
   * @brief Construct a new bus_fault exception
   *
   * @param p_kind - the condition reported by the peripheral
   * @param p_instance - must point to the bus that reported the error
   */
  bus_fault(spi_error p_kind, void* p_instance)
    : io_error(p_instance)
    , kind(p_kind)
  {
  }

  spi_error kind;
};

/**
 * @brief Raised exclusively when a driver cannot configure itself based on the
 * settings passed to it.
 *
 * A clock rate above what the bus clock can produce is an example. Settings
 * are normally determined at boot, so this is considered a bug and NOT
 * RECOVERABLE. Either the code or the hardware must change.
 *
 * # How to Log this?
 *
 * Compare `instance()` against the objects used within the try block and log
 * a message for the one that matches, along with the settings passed to it.
 *
 */
struct operation_not_supported : public exception
{
  /**
   * @brief Construct a new operation_not_supported exception
   *
   * @param p_instance - must point to the instance of the driver that could not
   * be configured with the configuration settings passed to it.
   */
  operation_not_supported(void* p_instance)
    : exception(std::errc::operation_not_supported, p_instance)
  {
  }
};

/**
 * @brief Raised when an operation could not be performed because it is no
 * longer permitted to use a resource.
 *
 * `peripherals::take()` raises this when the peripherals have already been
 * handed out. There is nothing to recover: the code that took them first is
 * the only owner.
 *
 */
struct operation_not_permitted : public exception
{
  operation_not_permitted(void* p_instance)
    : exception(std::errc::operation_not_permitted, p_instance)
  {
  }
};

/**
 * @brief Raised when an input passed to a function is outside the domain of the
 * function.
 */
struct argument_out_of_domain : public exception
{
  argument_out_of_domain(void* p_instance)
    : exception(std::errc::argument_out_of_domain, p_instance)
  {
  }
};

}  // namespace f0spi
