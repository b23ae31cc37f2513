/**
 * SMiner - Serial Device Channel Implementation
 */

#include "SerialChannel.h"
#include "util/Log.h"
#include <algorithm>

namespace sminer {

namespace {

// Longest time a read runs without checking for close()
constexpr auto POLL_SLICE = std::chrono::milliseconds(50);

}  // namespace

SerialChannel::SerialChannel(std::string port, unsigned baudrate)
    : m_portName(std::move(port))
    , m_baudrate(baudrate)
    , m_port(m_io)
{
}

SerialChannel::~SerialChannel() {
    close();
}

void SerialChannel::open() {
    using boost::asio::serial_port_base;

    Guard lock(m_ioMutex);

    m_port.open(m_portName);
    m_port.set_option(serial_port_base::baud_rate(m_baudrate));
    m_port.set_option(serial_port_base::character_size(8));
    m_port.set_option(serial_port_base::parity(serial_port_base::parity::none));
    m_port.set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one));
    m_port.set_option(serial_port_base::flow_control(serial_port_base::flow_control::none));

    m_closed = false;
}

size_t SerialChannel::read(uint8_t* buffer, size_t len, double timeoutSeconds) {
    if (m_closed) {
        throw ChannelClosed(m_portName + " closed");
    }

    Guard lock(m_ioMutex);
    if (m_closed || !m_port.is_open()) {
        throw ChannelClosed(m_portName + " closed");
    }

    bool done = false;
    size_t received = 0;
    boost::system::error_code result;

    m_io.restart();
    m_port.async_read_some(boost::asio::buffer(buffer, len),
        [&](const boost::system::error_code& ec, std::size_t n) {
            result = ec;
            received = n;
            done = true;
        });

    auto deadline = Clock::now() + toMillis(timeoutSeconds);
    while (!done) {
        auto now = Clock::now();
        if (m_closed || now >= deadline) {
            // Abort and let the handler run before the buffer goes away
            boost::system::error_code ignored;
            m_port.cancel(ignored);
            m_io.restart();
            m_io.run();
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        m_io.run_for(std::min<std::chrono::milliseconds>(remaining, POLL_SLICE));
    }

    if (received > 0) {
        return received;
    }

    if (result == boost::asio::error::operation_aborted) {
        if (m_closed) {
            throw ChannelClosed(m_portName + " closed");
        }
        return 0;  // Timeout
    }

    if (result) {
        throw boost::system::system_error(result, "read from " + m_portName);
    }
    return 0;
}

void SerialChannel::write(const Bytes& data) {
    if (m_closed || !m_port.is_open()) {
        throw ChannelClosed(m_portName + " closed");
    }
    boost::asio::write(m_port, boost::asio::buffer(data));
}

void SerialChannel::close() {
    m_closed = true;

    Guard lock(m_ioMutex);
    if (m_port.is_open()) {
        boost::system::error_code ec;
        m_port.close(ec);
        if (ec) {
            Log::debug("Closing " + m_portName + ": " + ec.message());
        }
    }
}

double SerialChannel::transferDelay() const {
    return m_baudrate > 0 ? 40.0 / m_baudrate : 0.0;
}

std::string SerialChannel::describe() const {
    return "serial " + m_portName + " @ " + std::to_string(m_baudrate) + " baud";
}

}  // namespace sminer
