/**
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>

#include "scpilink/core/link/Endpoint.hpp"
#include "scpilink/core/link/exceptions.hpp"
#include "scpilink/core/link/InstrumentLink.hpp"
#include "scpilink/core/link/ScopedConnection.hpp"

#include "instrument_mock.hpp"

using namespace scpilink::link;
using namespace std::literals::chrono_literals;

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

namespace {
    Endpoint make_endpoint(const InstrumentMock& mock, std::chrono::steady_clock::duration timeout = 1s) {
        Endpoint endpoint {};
        endpoint.host = "127.0.0.1";
        endpoint.port = mock.getPort();
        endpoint.timeout = timeout;
        return endpoint;
    }

    // Answers *IDN? and echoes any other query
    std::optional<std::string> identify(std::string_view line) {
        if(line == "*IDN?") {
            return "ANRITSU,MT9085A,6200000000,1.00\n";
        }
        if(line.ends_with('?')) {
            return std::string(line) + "\n";
        }
        return std::nullopt;
    }
} // namespace

TEST_CASE("Link starts disconnected", "[core][core::link]") {
    auto mock = InstrumentMock();
    auto link = InstrumentLink(make_endpoint(mock));

    REQUIRE_FALSE(link.isConnected());
    REQUIRE(link.getState() == InstrumentLink::State::DISCONNECTED);
    REQUIRE(link.getEndpoint().port == mock.getPort());
    REQUIRE(link.getEndpoint().terminator == "\n");
}

TEST_CASE("Connect and query", "[core][core::link]") {
    auto mock = InstrumentMock(identify);
    auto link = InstrumentLink(make_endpoint(mock));

    link.connect();
    REQUIRE(link.isConnected());
    REQUIRE(link.getState() == InstrumentLink::State::CONNECTED);
    REQUIRE(mock.waitForConnection());

    // Terminator is stripped from the response
    REQUIRE(link.query("X?") == "X?");
    REQUIRE(link.query("*IDN?") == "ANRITSU,MT9085A,6200000000,1.00");

    link.disconnect();
    REQUIRE(mock.waitForClose());
}

TEST_CASE("Send transmits command with terminator", "[core][core::link]") {
    auto mock = InstrumentMock();
    auto link = InstrumentLink(make_endpoint(mock));
    link.connect();

    link.send("SENS:FREQ:STAR 2GHZ");
    link.send("*RST");

    const std::string expected = "SENS:FREQ:STAR 2GHZ\n*RST\n";
    REQUIRE(mock.waitForBytes(expected.size()));
    REQUIRE(mock.getReceived() == expected);
}

TEST_CASE("Send large command", "[core][core::link]") {
    auto mock = InstrumentMock();
    auto link = InstrumentLink(make_endpoint(mock));
    link.connect();

    // Larger than socket buffers, needs multiple writes
    const auto command = "DATA " + std::string(std::size_t(1024 * 1024), 'A');
    link.send(command);

    REQUIRE(mock.waitForBytes(command.size() + 1, 5s));
    REQUIRE(mock.getReceived() == command + "\n");
}

TEST_CASE("Custom terminator", "[core][core::link]") {
    auto mock = InstrumentMock(
        [](std::string_view line) -> std::optional<std::string> {
            if(line == "SYST:VERS?") {
                return "PART\nREST\r\n";
            }
            return std::nullopt;
        },
        "\r\n");
    auto endpoint = make_endpoint(mock);
    endpoint.terminator = "\r\n";
    auto link = InstrumentLink(endpoint);
    link.connect();

    link.send("*CLS");
    REQUIRE(mock.waitForBytes(6));
    REQUIRE(mock.getReceived() == "*CLS\r\n");

    // Only the full terminator ends the response
    REQUIRE(link.query("SYST:VERS?") == "PART\nREST");
}

TEST_CASE("Round trip", "[core][core::link]") {
    auto mock = InstrumentMock(identify);
    auto link = InstrumentLink(make_endpoint(mock));

    REQUIRE_FALSE(mock.waitForConnection(100ms));
    link.connect();
    link.send("*RST");
    REQUIRE(link.query("*IDN?") == "ANRITSU,MT9085A,6200000000,1.00");
    REQUIRE_FALSE(mock.isClosed());
    link.disconnect();

    REQUIRE(mock.waitForClose());
    REQUIRE(mock.getReceived() == "*RST\n*IDN?\n");
}

TEST_CASE("Operations require connection", "[core][core::link]") {
    auto mock = InstrumentMock(identify);
    auto link = InstrumentLink(make_endpoint(mock));

    REQUIRE_THROWS_AS(link.query("*IDN?"), NotConnectedError);
    REQUIRE_THROWS_MATCHES(link.send("*RST"),
                           NotConnectedError,
                           Catch::Matchers::Message("Cannot send command \"*RST\": link is not connected"));

    // No socket operation was performed
    REQUIRE_FALSE(mock.waitForConnection(100ms));
    REQUIRE(mock.getReceived().empty());

    // Also after disconnecting
    link.connect();
    link.disconnect();
    REQUIRE_THROWS_AS(link.query("*IDN?"), NotConnectedError);
}

TEST_CASE("Disconnect twice", "[core][core::link]") {
    auto mock = InstrumentMock();
    auto link = InstrumentLink(make_endpoint(mock));

    // Disconnect without connection is a no-op
    REQUIRE_NOTHROW(link.disconnect());

    link.connect();
    REQUIRE_NOTHROW(link.disconnect());
    REQUIRE_NOTHROW(link.disconnect());
    REQUIRE_FALSE(link.isConnected());
    REQUIRE(mock.waitForClose());
}

TEST_CASE("Connect twice", "[core][core::link]") {
    auto mock = InstrumentMock(identify);
    auto link = InstrumentLink(make_endpoint(mock));

    link.connect();
    REQUIRE_THROWS_AS(link.connect(), AlreadyConnectedError);

    // Existing connection is still usable
    REQUIRE(link.isConnected());
    REQUIRE(link.query("X?") == "X?");
}

TEST_CASE("Reconnect after disconnect", "[core][core::link]") {
    auto mock = InstrumentMock(identify);
    auto link = InstrumentLink(make_endpoint(mock));

    link.connect();
    link.send("*RST");
    link.disconnect();
    REQUIRE(mock.waitForClose());

    link.connect();
    REQUIRE(mock.waitForConnection(1s, 2));
    REQUIRE(link.query("*IDN?") == "ANRITSU,MT9085A,6200000000,1.00");
    REQUIRE(mock.getReceived() == "*RST\n*IDN?\n");
}

TEST_CASE("Connection refused", "[core][core::link]") {
    Endpoint endpoint {};
    endpoint.host = "127.0.0.1";
    endpoint.port = get_closed_port();
    endpoint.timeout = 1s;
    auto link = InstrumentLink(endpoint);

    REQUIRE_THROWS_AS(link.connect(), ConnectionError);
    REQUIRE_FALSE(link.isConnected());
}

TEST_CASE("Unresolvable host", "[core][core::link]") {
    Endpoint endpoint {};
    endpoint.host = "instrument.invalid";
    endpoint.port = MT9085_SCPI_PORT;
    auto link = InstrumentLink(endpoint);

    REQUIRE_THROWS_AS(link.connect(), ConnectionError);
    REQUIRE_FALSE(link.isConnected());
}

TEST_CASE("Query timeout", "[core][core::link]") {
    // Mock never answers
    auto mock = InstrumentMock();
    const auto timeout = 200ms;
    auto link = InstrumentLink(make_endpoint(mock, timeout));
    link.connect();

    const auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(link.query("*IDN?"), TimeoutError);
    const auto duration = std::chrono::steady_clock::now() - start;

    REQUIRE(duration >= timeout);
    REQUIRE(duration < timeout + 500ms);

    // Link stays connected after a timeout
    REQUIRE(link.isConnected());
}

TEST_CASE("Query timeout on partial response", "[core][core::link]") {
    auto mock = InstrumentMock([](std::string_view line) -> std::optional<std::string> {
        if(line == "*IDN?") {
            return "NO TERMINATOR";
        }
        return std::nullopt;
    });
    auto link = InstrumentLink(make_endpoint(mock, 200ms));
    link.connect();

    REQUIRE_THROWS_AS(link.query("*IDN?"), TimeoutError);

    // Partial response is kept and completed by the next bytes
    mock.write(" HERE\n");
    REQUIRE(link.query("*OPC?") == "NO TERMINATOR HERE");
}

TEST_CASE("Response exceeding maximum size", "[core][core::link]") {
    auto mock = InstrumentMock([](std::string_view line) -> std::optional<std::string> {
        if(line == "TRACE:DATA?") {
            return std::string(MAX_RESPONSE_SIZE, '0');
        }
        return std::nullopt;
    });
    auto link = InstrumentLink(make_endpoint(mock, 5s));
    link.connect();

    REQUIRE_THROWS_AS(link.query("TRACE:DATA?"), TransportError);
    REQUIRE(link.isConnected());

    // Over-long line is dropped and following responses are read again
    mock.write("1\n");
    REQUIRE(link.query("*OPC?") == "1");
}

TEST_CASE("Send timeout", "[core][core::link]") {
    auto mock = InstrumentMock();
    auto link = InstrumentLink(make_endpoint(mock, 200ms));
    mock.pauseReading();
    link.connect();

    // Larger than the socket buffers of both sides
    const auto command = "DATA " + std::string(std::size_t(32 * 1024 * 1024), 'A');
    REQUIRE_THROWS_AS(link.send(command), TimeoutError);
    REQUIRE(link.isConnected());
}

TEST_CASE("Pipelined responses are kept", "[core][core::link]") {
    // Two response lines arrive for a single query
    auto mock = InstrumentMock([](std::string_view line) -> std::optional<std::string> {
        if(line == "FIRST?") {
            return "ONE\nTWO\n";
        }
        return std::nullopt;
    });
    auto link = InstrumentLink(make_endpoint(mock));
    link.connect();

    REQUIRE(link.query("FIRST?") == "ONE");
    REQUIRE(link.query("SECOND?") == "TWO");
    REQUIRE(mock.waitForBytes(15));
    REQUIRE(mock.getReceived() == "FIRST?\nSECOND?\n");
}

TEST_CASE("Empty response", "[core][core::link]") {
    auto mock = InstrumentMock([](std::string_view) { return std::optional<std::string>("\n"); });
    auto link = InstrumentLink(make_endpoint(mock));
    link.connect();

    REQUIRE(link.query("EMPTY?").empty());
}

TEST_CASE("Instrument closes connection during query", "[core][core::link]") {
    auto mock = InstrumentMock();
    auto link = InstrumentLink(make_endpoint(mock));
    link.connect();
    REQUIRE(mock.waitForConnection());

    mock.closeConnection();
    REQUIRE_THROWS_AS(link.query("*IDN?"), TransportError);

    // Link has to be disconnected explicitly
    REQUIRE(link.isConnected());
    link.disconnect();
    REQUIRE_FALSE(link.isConnected());
}

TEST_CASE("Command delay", "[core][core::link]") {
    auto mock = InstrumentMock();
    auto endpoint = make_endpoint(mock);
    endpoint.command_delay = 100ms;
    auto link = InstrumentLink(endpoint);
    link.connect();

    const auto start = std::chrono::steady_clock::now();
    link.send("*RST");
    link.send("*CLS");
    REQUIRE(std::chrono::steady_clock::now() - start >= 200ms);
}

TEST_CASE("Invalid endpoint", "[core][core::link]") {
    Endpoint endpoint {};
    endpoint.host = "127.0.0.1";
    endpoint.port = MT9085_SCPI_PORT;
    REQUIRE_NOTHROW(InstrumentLink(endpoint));

    SECTION("Empty host") {
        endpoint.host.clear();
        REQUIRE_THROWS_AS(InstrumentLink(endpoint), InvalidEndpointError);
    }
    SECTION("Zero port") {
        endpoint.port = 0;
        REQUIRE_THROWS_AS(InstrumentLink(endpoint), InvalidEndpointError);
    }
    SECTION("Zero timeout") {
        endpoint.timeout = 0s;
        REQUIRE_THROWS_AS(InstrumentLink(endpoint), InvalidEndpointError);
    }
    SECTION("Empty terminator") {
        endpoint.terminator.clear();
        REQUIRE_THROWS_AS(InstrumentLink(endpoint), InvalidEndpointError);
    }
    SECTION("Negative command delay") {
        endpoint.command_delay = -1s;
        REQUIRE_THROWS_AS(InstrumentLink(endpoint), InvalidEndpointError);
    }
    SECTION("Timeout too long") {
        endpoint.timeout = MAX_DURATION + 1s;
        REQUIRE_THROWS_AS(InstrumentLink(endpoint), InvalidEndpointError);
    }
}

TEST_CASE("Scoped connection", "[core][core::link]") {
    auto mock = InstrumentMock(identify);
    auto link = InstrumentLink(make_endpoint(mock));

    {
        const ScopedConnection connection {link};
        REQUIRE(link.isConnected());
        REQUIRE(connection->query("*IDN?") == "ANRITSU,MT9085A,6200000000,1.00");
        REQUIRE_FALSE(mock.isClosed());
    }

    REQUIRE_FALSE(link.isConnected());
    REQUIRE(mock.waitForClose());
}

TEST_CASE("Scoped connection closes on exception", "[core][core::link]") {
    auto mock = InstrumentMock(identify);
    auto link = InstrumentLink(make_endpoint(mock));

    bool closed_before_catch = false;
    try {
        const ScopedConnection connection {link};
        (*connection).send("*RST");
        throw std::runtime_error("failure in scope");
    } catch(const std::runtime_error&) {
        // Instrument sees the connection closed before the error reaches the caller
        closed_before_catch = !link.isConnected() && mock.waitForClose();
    }

    REQUIRE(closed_before_catch);
    REQUIRE(mock.waitForClose());
    REQUIRE(mock.getReceived() == "*RST\n");
}

TEST_CASE("Scoped connection failing to connect", "[core][core::link]") {
    Endpoint endpoint {};
    endpoint.host = "127.0.0.1";
    endpoint.port = get_closed_port();
    auto link = InstrumentLink(endpoint);

    REQUIRE_THROWS_AS(ScopedConnection(link), ConnectionError);
    REQUIRE_FALSE(link.isConnected());
}

TEST_CASE("Link destructor closes connection", "[core][core::link]") {
    auto mock = InstrumentMock();
    {
        auto link = InstrumentLink(make_endpoint(mock));
        link.connect();
        REQUIRE(mock.waitForConnection());
    }
    REQUIRE(mock.waitForClose());
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
