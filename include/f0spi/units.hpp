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

namespace f0spi {
/// Standard type for bytes in f0spi.
/// `std::byte` is not used because it results in more verbose code, usually a
/// lot of static_casts, without much benefit.
using byte = std::uint8_t;

// Shortened versions of the standard integers.
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using uptr = std::uintptr_t;

/// Type for frequency represented in hertz. u32 is used because sub 1-hertz
/// frequencies are never used for bus clocks and the whole number part is all
/// that the prescaler math needs. This also keeps floating point operations
/// off of targets without an FPU.
using hertz = u32;

namespace literals {
// NOLINTBEGIN(google-runtime-int): required by the literal operator signature
constexpr hertz operator""_Hz(unsigned long long p_value) noexcept
{
  return static_cast<hertz>(p_value);
}

constexpr hertz operator""_kHz(unsigned long long p_value) noexcept
{
  return static_cast<hertz>(p_value * 1'000);
}

constexpr hertz operator""_MHz(unsigned long long p_value) noexcept
{
  return static_cast<hertz>(p_value * 1'000'000);
}
// NOLINTEND(google-runtime-int)
}  // namespace literals

using namespace literals;
}  // namespace f0spi
