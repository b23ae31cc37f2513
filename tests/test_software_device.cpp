/**
 * SMiner - Software Device Tests
 */

#include "TestSupport.h"
#include "device/SoftwareDevice.h"
#include <set>

using namespace sminer;
using namespace sminer::test;

namespace {

/**
 * Read responses until keyspace exhaustion or timeout
 */
struct Session {
    std::vector<uint8_t> tags;
    std::set<Nonce> nonces;
    bool exhausted{false};
};

Session readUntilExhausted(SoftwareDevice& device, double timeoutSeconds) {
    Session session;
    auto deadline = Clock::now() + toMillis(timeoutSeconds);

    while (!session.exhausted && Clock::now() < deadline) {
        uint8_t tag = 0;
        if (device.read(&tag, 1, 0.1) == 0) {
            continue;
        }
        session.tags.push_back(tag);

        if (tag == protocol::TAG_SOLUTION) {
            uint8_t payload[4];
            size_t got = 0;
            while (got < 4) {
                got += device.read(payload + got, 4 - got, 0.5);
            }
            session.nonces.insert(protocol::decodeNonce(payload));
        } else if (tag == protocol::TAG_EXHAUSTED) {
            session.exhausted = true;
        }
    }
    return session;
}

}  // namespace

int main() {
    Results results;

    std::cout << "=== Scanning ===" << std::endl << std::endl;
    {
        std::set<Nonce> hits = {5, 100, 1000, 4999};
        SoftwareDevice device(3, [&hits](const protocol::DeviceWork&, Nonce nonce) {
            return hits.count(nonce) > 0;
        }, 5000);

        results.check(device.getThreadCount() == 3, "thread count");
        device.open();
        device.write(validationMessage());

        Session session = readUntilExhausted(device, 5.0);
        results.check(!session.tags.empty() && session.tags.front() == protocol::TAG_ACK,
                      "job acknowledged first");
        results.check(session.nonces == hits, "every hit reported across threads");
        results.check(session.exhausted && session.tags.back() == protocol::TAG_EXHAUSTED,
                      "exhaustion reported last");

        uint8_t extra = 0;
        results.check(device.read(&extra, 1, 0.1) == 0, "device idle after exhaustion");

        // Same device, next job
        device.write(validationMessage());
        Session second = readUntilExhausted(device, 5.0);
        results.check(second.nonces == hits && second.exhausted, "device rescans for a new job");

        device.close();
    }

    std::cout << std::endl << "=== Work Decoding ===" << std::endl << std::endl;
    {
        protocol::DeviceWork seen{};
        Mutex mutex;
        SoftwareDevice device(1, [&](const protocol::DeviceWork& work, Nonce) {
            Guard lock(mutex);
            seen = work;
            return false;
        }, 10);

        device.open();
        device.write(validationMessage());
        Session session = readUntilExhausted(device, 2.0);

        ValidationJob job;
        HeaderData serialized = getworkToHeader(job.getHeader());
        Guard lock(mutex);
        results.check(session.exhausted && session.nonces.empty(), "no hits from the predicate");
        results.check(seen.midstate == job.getMidstate(), "device sees the job midstate");
        results.check(std::equal(seen.tail, seen.tail + 12, serialized.begin() + 64),
                      "device sees serialized header bytes 64..75");
    }
    {
        // Built-in double SHA-256: no difficulty-1 share among the first nonces
        SoftwareDevice device(2, nullptr, 2047);
        device.open();
        device.write(validationMessage());
        Session session = readUntilExhausted(device, 5.0);
        results.check(session.exhausted && session.nonces.empty(), "default hasher scans without false hits");
        device.close();
    }

    std::cout << std::endl << "=== Channel Behaviour ===" << std::endl << std::endl;
    {
        SoftwareDevice device(1, [](const protocol::DeviceWork&, Nonce) { return false; });
        device.open();

        uint8_t tag = 0;
        results.check(device.read(&tag, 1, 0.05) == 0, "read times out without responses");

        device.write(Bytes{1, 2, 3});
        results.check(device.read(&tag, 1, 0.1) == 0, "malformed job ignored");

        device.write(validationMessage());
        results.check(device.read(&tag, 1, 1.0) == 1 && tag == protocol::TAG_ACK, "job acknowledged");

        device.write(validationMessage());
        results.check(device.read(&tag, 1, 1.0) == 1 && tag == protocol::TAG_ACK,
                      "replacement job acknowledged while scanning");

        auto start = Clock::now();
        device.close();
        results.check(secondsBetween(start, Clock::now()) < 1.0, "close aborts a full keyspace scan");

        bool closedRead = false;
        try {
            device.read(&tag, 1, 0.05);
        } catch (const ChannelClosed&) {
            closedRead = true;
        }
        results.check(closedRead, "read after close raises ChannelClosed");

        bool closedWrite = false;
        try {
            device.write(validationMessage());
        } catch (const ChannelClosed&) {
            closedWrite = true;
        }
        results.check(closedWrite, "write after close raises ChannelClosed");

        device.close();
        results.check(device.transferDelay() == 0.0, "no transfer delay");
    }
    {
        SoftwareDevice device(1, [](const protocol::DeviceWork&, Nonce) { return false; });
        device.open();

        std::thread reader([&device]() {
            uint8_t tag = 0;
            try {
                device.read(&tag, 1, 5.0);
            } catch (const ChannelClosed&) {
                // Expected
            }
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        auto start = Clock::now();
        device.close();
        reader.join();
        results.check(secondsBetween(start, Clock::now()) < 1.0, "close releases a blocked read");
    }

    return results.finish();
}
