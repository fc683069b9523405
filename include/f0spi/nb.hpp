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
 * @file nb.hpp
 * @brief Result convention for non-blocking operations
 *
 * A non-blocking operation returns immediately with one of three outcomes:
 *
 * 1. It finished and produced its value.
 * 2. It could not make progress yet. Call it again later ("would block").
 * 3. It failed with an error.
 *
 * "Would block" is not an error. It is the normal outcome of polling hardware
 * that has not caught up yet.
 *
 */
#pragma once

#include <concepts>
#include <type_traits>
#include <utility>
#include <variant>

namespace f0spi::nb {
/// Tag type signaling that the operation should be tried again later
struct would_block_t
{
  explicit constexpr would_block_t() = default;
};

/// Tag value signaling that the operation should be tried again later
inline constexpr would_block_t would_block{};

/**
 * @brief Wraps an error so it is never mistaken for a value
 *
 * @tparam E - error type
 */
template<class E>
struct failure
{
  E error;
};

/**
 * @brief Create a failure from an error value
 *
 * USAGE:
 *
 *     return nb::fail(spi_error::overrun);
 *
 */
template<class E>
constexpr failure<E> fail(E p_error)
{
  return failure<E>{ .error = p_error };
}

/**
 * @brief Outcome of a non-blocking operation producing a T or failing with E
 *
 * @tparam T - type of the value produced on success
 * @tparam E - type of the error
 */
template<class T, class E>
class result
{
public:
  constexpr result(T p_value)
    : m_state(std::in_place_index<0>, std::move(p_value))
  {
  }

  constexpr result(would_block_t)
    : m_state(std::in_place_index<1>)
  {
  }

  constexpr result(failure<E> p_failure)
    : m_state(std::in_place_index<2>, p_failure.error)
  {
  }

  [[nodiscard]] constexpr bool has_value() const
  {
    return m_state.index() == 0;
  }

  [[nodiscard]] constexpr bool is_would_block() const
  {
    return m_state.index() == 1;
  }

  [[nodiscard]] constexpr bool has_error() const
  {
    return m_state.index() == 2;
  }

  /**
   * @brief Access the value
   *
   * @throws std::bad_variant_access - if `has_value()` is false
   */
  [[nodiscard]] constexpr T const& value() const
  {
    return std::get<0>(m_state);
  }

  /**
   * @brief Access the error
   *
   * @throws std::bad_variant_access - if `has_error()` is false
   */
  [[nodiscard]] constexpr E error() const
  {
    return std::get<2>(m_state);
  }

private:
  std::variant<T, would_block_t, E> m_state;
};

/**
 * @brief Outcome of a non-blocking operation that produces no value
 *
 * A default constructed result represents success.
 *
 * @tparam E - type of the error
 */
template<class E>
class result<void, E>
{
public:
  constexpr result() = default;

  constexpr result(would_block_t)
    : m_state(std::in_place_index<1>)
  {
  }

  constexpr result(failure<E> p_failure)
    : m_state(std::in_place_index<2>, p_failure.error)
  {
  }

  [[nodiscard]] constexpr bool has_value() const
  {
    return m_state.index() == 0;
  }

  [[nodiscard]] constexpr bool is_would_block() const
  {
    return m_state.index() == 1;
  }

  [[nodiscard]] constexpr bool has_error() const
  {
    return m_state.index() == 2;
  }

  /**
   * @brief Access the error
   *
   * @throws std::bad_variant_access - if `has_error()` is false
   */
  [[nodiscard]] constexpr E error() const
  {
    return std::get<2>(m_state);
  }

private:
  std::variant<std::monostate, would_block_t, E> m_state{};
};

/**
 * @brief Call a non-blocking operation until it stops returning would_block
 *
 * This busy waits on the caller's thread. There is no timeout. Callers that
 * need one must bound the operation themselves.
 *
 * @param p_operation - callable returning an `nb::result`
 * @return the first result that is not would_block
 */
template<std::invocable F>
[[nodiscard]] constexpr auto block(F&& p_operation)
{
  while (true) {
    auto outcome = p_operation();
    if (not outcome.is_would_block()) {
      return outcome;
    }
  }
}
}  // namespace f0spi::nb
