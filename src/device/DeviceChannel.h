/**
 * SMiner - Device Channel Interface
 *
 * Byte-oriented transport to a hashing device. The worker's dispatcher
 * opens, writes and closes it; the listener reads from it concurrently.
 */

#pragma once

#include "core/Types.h"
#include <memory>
#include <stdexcept>
#include <string>

namespace sminer {

/**
 * Raised by read()/write() once the channel has been closed
 */
class ChannelClosed : public std::runtime_error {
public:
    explicit ChannelClosed(const std::string& what = "channel closed")
        : std::runtime_error(what)
    {}
};

class DeviceChannel {
public:
    virtual ~DeviceChannel() = default;

    /**
     * Open the transport
     *
     * Throws on failure (boost::system::system_error, std::runtime_error).
     */
    virtual void open() = 0;

    /**
     * Read up to len bytes
     *
     * @param buffer Destination
     * @param len Maximum bytes to read
     * @param timeoutSeconds Maximum time to block
     * @return Bytes read, 0 on timeout
     * @throws ChannelClosed if the channel is (or becomes) closed
     */
    virtual size_t read(uint8_t* buffer, size_t len, double timeoutSeconds) = 0;

    /**
     * Write all bytes
     *
     * @throws ChannelClosed if the channel is closed
     */
    virtual void write(const Bytes& data) = 0;

    /**
     * Close the transport
     *
     * Idempotent and safe to call from another thread while a read is
     * pending; the read then fails with ChannelClosed.
     */
    virtual void close() = 0;

    /**
     * Fixed transfer latency subtracted from measured job times (seconds)
     */
    virtual double transferDelay() const = 0;

    /**
     * Human-readable name for logs
     */
    virtual std::string describe() const = 0;
};

using DeviceChannelPtr = std::shared_ptr<DeviceChannel>;

}  // namespace sminer
