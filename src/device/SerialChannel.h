/**
 * SMiner - Serial Device Channel
 *
 * Device channel over a serial port (8N1, no flow control) using
 * boost::asio. Reads are asynchronous on a private io_context and bounded
 * by a timeout, so a concurrent close() is noticed within one poll slice.
 */

#pragma once

#include "DeviceChannel.h"
#include "util/Guards.h"
#include <boost/asio.hpp>
#include <atomic>

namespace sminer {

class SerialChannel : public DeviceChannel {
public:
    /**
     * Constructor
     *
     * @param port Device path, e.g. /dev/ttyUSB0
     * @param baudrate Line speed
     */
    SerialChannel(std::string port, unsigned baudrate);
    ~SerialChannel() override;

    void open() override;
    size_t read(uint8_t* buffer, size_t len, double timeoutSeconds) override;
    void write(const Bytes& data) override;
    void close() override;

    /**
     * Time to transfer the 40-bit job tail at the line speed
     */
    double transferDelay() const override;

    std::string describe() const override;

private:
    std::string m_portName;
    unsigned m_baudrate;

    boost::asio::io_context m_io;
    boost::asio::serial_port m_port;

    // Held for the duration of a read; close() takes it to close the port
    Mutex m_ioMutex;
    std::atomic<bool> m_closed{false};
};

}  // namespace sminer
