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

#include <f0spi/nb.hpp>

#include <f0spi/error.hpp>
#include <f0spi/units.hpp>

#include <boost/ut.hpp>

namespace f0spi {
boost::ut::suite<"nb_test"> nb_test = []() {
  using namespace boost::ut;

  "result holds exactly one outcome"_test = []() {
    nb::result<byte, spi_error> const value = byte{ 0x42 };
    nb::result<byte, spi_error> const pending = nb::would_block;
    nb::result<byte, spi_error> const failed = nb::fail(spi_error::overrun);

    expect(value.has_value() and not value.is_would_block() and
           not value.has_error());
    expect(that % 0x42 == value.value());

    expect(pending.is_would_block() and not pending.has_value() and
           not pending.has_error());

    expect(failed.has_error() and not failed.has_value() and
           not failed.is_would_block());
    expect(spi_error::overrun == failed.error());
  };

  "void result defaults to success"_test = []() {
    nb::result<void, spi_error> const done{};
    nb::result<void, spi_error> const pending = nb::would_block;
    nb::result<void, spi_error> const failed = nb::fail(spi_error::mode_fault);

    expect(done.has_value());
    expect(pending.is_would_block());
    expect(failed.has_error());
    expect(spi_error::mode_fault == failed.error());
  };

  "block retries until the operation completes"_test = []() {
    // Setup
    int calls = 0;
    auto operation = [&calls]() -> nb::result<byte, spi_error> {
      calls++;
      if (calls < 4) {
        return nb::would_block;
      }
      return byte{ 7 };
    };

    // Exercise
    auto const outcome = nb::block(operation);

    // Verify
    expect(that % 4 == calls);
    expect(outcome.has_value());
    expect(that % 7 == outcome.value());
  };

  "block returns errors without retrying them"_test = []() {
    // Setup
    int calls = 0;
    auto operation = [&calls]() -> nb::result<void, spi_error> {
      calls++;
      if (calls == 1) {
        return nb::would_block;
      }
      return nb::fail(spi_error::crc);
    };

    // Exercise
    auto const outcome = nb::block(operation);

    // Verify
    expect(that % 2 == calls);
    expect(outcome.has_error());
    expect(spi_error::crc == outcome.error());
  };
};
}  // namespace f0spi
