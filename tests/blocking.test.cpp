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

#include <algorithm>
#include <array>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <f0spi/error.hpp>
#include <f0spi/full_duplex.hpp>

#include <boost/ut.hpp>

namespace f0spi {
namespace {
/**
 * MOSI wired to MISO with a single byte shift register. Each operation
 * reports would_block a few times before it goes through, and every call is
 * recorded so the order of sends and reads can be checked.
 */
class loopback_bus : public full_duplex
{
public:
  explicit loopback_bus(int p_busy_polls = 0)
    : m_busy_polls(p_busy_polls)
  {
  }

  std::string m_calls{};
  std::vector<byte> m_sent{};
  std::optional<spi_error> m_fail_with{};
  int m_fail_after = 0;

  ~loopback_bus() override = default;

private:
  bool busy()
  {
    if (m_polls_left > 0) {
      m_polls_left--;
      return true;
    }
    m_polls_left = m_busy_polls;
    return false;
  }

  std::optional<spi_error> failure()
  {
    if (m_fail_with && m_fail_after-- <= 0) {
      return m_fail_with;
    }
    return std::nullopt;
  }

  read_result driver_read() override
  {
    if (auto const error = failure()) {
      return nb::fail(*error);
    }
    if (not m_shift_register || busy()) {
      m_calls += 'r';
      return nb::would_block;
    }
    m_calls += 'R';
    return *std::exchange(m_shift_register, std::nullopt);
  }

  send_result driver_send(byte p_byte) override
  {
    if (auto const error = failure()) {
      return nb::fail(*error);
    }
    // A byte that was not read yet still occupies the shift register
    if (m_shift_register || busy()) {
      m_calls += 's';
      return nb::would_block;
    }
    m_calls += 'S';
    m_sent.push_back(p_byte);
    m_shift_register = p_byte;
    return {};
  }

  int m_busy_polls;
  int m_polls_left = m_busy_polls;
  std::optional<byte> m_shift_register{};
};
}  // namespace

boost::ut::suite<"blocking_test"> blocking_test = []() {
  using namespace boost::ut;

  "transfer round trips through a loopback"_test = []() {
    // Setup
    loopback_bus bus(3);
    std::array<byte, 5> const expected{ 0xDE, 0xAD, 0x00, 0xBE, 0xEF };
    auto buffer = expected;

    // Exercise
    transfer(bus, buffer);

    // Verify
    expect(expected == buffer);
    expect(that % expected.size() == bus.m_sent.size());
  };

  "transfer reads each byte before sending the next"_test = []() {
    // Setup
    loopback_bus bus;
    std::array<byte, 3> buffer{ 1, 2, 3 };

    // Exercise
    transfer(bus, buffer);

    // Verify
    expect(that % std::string("SRSRSR") == bus.m_calls);
  };

  "operations are retried while they would block"_test = []() {
    // Setup
    loopback_bus bus(2);
    std::array<byte, 1> buffer{ 0x55 };

    // Exercise
    transfer(bus, buffer);

    // Verify
    expect(that % std::string("ssSrrR") == bus.m_calls);
    expect(that % 0x55 == buffer[0]);
  };

  "transfer of nothing touches nothing"_test = []() {
    loopback_bus bus;
    std::span<byte> empty{};

    transfer(bus, empty);
    write(bus, std::span<byte const>{});

    expect(bus.m_calls.empty());
  };

  "write sends every byte in order"_test = []() {
    // Setup
    class sink : public full_duplex
    {
    public:
      std::vector<byte> m_sent{};

    private:
      read_result driver_read() override
      {
        return nb::would_block;
      }
      send_result driver_send(byte p_byte) override
      {
        m_sent.push_back(p_byte);
        return {};
      }
    };
    sink bus;
    std::array<byte, 4> const payload{ 'a', 'b', 'c', 'd' };

    // Exercise
    write(bus, payload);

    // Verify
    expect(that % payload.size() == bus.m_sent.size());
    expect(std::equal(payload.begin(), payload.end(), bus.m_sent.begin()));
  };

  "errors stop the transfer and are thrown as bus_fault"_test = []() {
    // Setup
    loopback_bus bus;
    bus.m_fail_with = spi_error::overrun;
    bus.m_fail_after = 2;
    std::array<byte, 4> buffer{ 10, 20, 30, 40 };
    std::optional<spi_error> kind;

    // Exercise
    try {
      transfer(bus, buffer);
    } catch (bus_fault const& p_fault) {
      kind = p_fault.kind;
      expect(p_fault.instance() == static_cast<full_duplex*>(&bus));
    }

    // Verify
    expect(kind.has_value() and *kind == spi_error::overrun);
    expect(that % std::string("SR") == bus.m_calls);
    expect(that % 10 == buffer[0]);
    expect(that % 20 == buffer[1]);
  };

  "write surfaces errors as bus_fault"_test = []() {
    loopback_bus bus;
    bus.m_fail_with = spi_error::crc;
    std::array<byte, 1> const payload{ 0x01 };

    expect(throws<bus_fault>([&]() { write(bus, payload); }));
    expect(throws<io_error>([&]() { write(bus, payload); }));
  };
};
}  // namespace f0spi
