/**
 * SMiner - Stratum Client
 *
 * Bitcoin Stratum v1 pool connection acting as a work source. Builds one
 * job per fetch from the current block template (fresh extranonce2 each
 * time) and submits the shares workers find.
 * Supports both stratum+tcp:// and stratum+ssl:// connections
 */

#pragma once

#include "JobRegistry.h"
#include "core/WorkSource.h"
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#ifdef WITH_TLS
#include <boost/asio/ssl.hpp>
#endif
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sminer {

using json = nlohmann::json;

/**
 * Connection state
 */
enum class StratumState {
    Disconnected,
    Connecting,
    Connected,
    Subscribed,
    Authorized
};

/**
 * Pool endpoint
 */
struct PoolEndpoint {
    std::string host;
    unsigned port;
    std::string user;
    std::string pass;
    bool useTls;  // Use SSL/TLS encryption

    PoolEndpoint() : port(0), useTls(false) {}
    PoolEndpoint(const std::string& h, unsigned p, const std::string& u, const std::string& pw, bool tls = false)
        : host(h), port(p), user(u), pass(pw), useTls(tls) {}
};

/**
 * Block template from mining.notify
 */
struct StratumTemplate {
    std::string jobId;
    Bytes prevHash;                 // 32 bytes as sent by the pool
    Bytes coinbase1;
    Bytes coinbase2;
    std::vector<Hash256> merkleBranch;
    std::string versionHex;
    std::string nbitsHex;
    std::string ntimeHex;
    bool cleanJobs{false};
    TimePoint receivedTime;
    TimePoint expiry;
};

/**
 * Parse mining.notify params
 *
 * @return Template, or nullopt if the params are malformed
 */
std::optional<StratumTemplate> parseNotify(const json& params);

/**
 * Build the serialized 80-byte header of a template (nonce 0)
 *
 * @param tmpl Block template
 * @param extraNonce1 Session extranonce1
 * @param extraNonce2 Per-job extranonce2
 */
HeaderData buildStratumHeader(const StratumTemplate& tmpl, const Bytes& extraNonce1,
                              const Bytes& extraNonce2);

/**
 * Job built from a Stratum template
 */
class StratumJob : public Job {
public:
    StratumJob(WorkSource* source, const StratumTemplate& tmpl, const HeaderData& header,
               const Hash256& target, std::string extraNonce2Hex)
        : Job(source, tmpl.jobId + "/" + extraNonce2Hex, header, target, tmpl.expiry)
        , m_poolJobId(tmpl.jobId)
        , m_extraNonce2(std::move(extraNonce2Hex))
        , m_ntime(tmpl.ntimeHex)
    {}

    const std::string& getPoolJobId() const { return m_poolJobId; }
    const std::string& getExtraNonce2() const { return m_extraNonce2; }
    const std::string& getNtime() const { return m_ntime; }

private:
    std::string m_poolJobId;
    std::string m_extraNonce2;
    std::string m_ntime;
};

/**
 * Pending request for tracking responses
 */
struct PendingRequest {
    std::string method;
    std::chrono::steady_clock::time_point timestamp;
};

/**
 * Stratum Client class
 *
 * Handles pool communication via Stratum protocol with:
 * - JSON-RPC message handling
 * - Automatic reconnection with exponential backoff
 * - Connection keepalive
 * - Pool failover support
 * - Difficulty adjustment
 */
class StratumClient : public WorkSource {
public:
    StratumClient();
    ~StratumClient() override;

    /**
     * Connect to pool
     *
     * @param host Pool hostname
     * @param port Pool port
     * @param useTls Use SSL/TLS encryption
     * @return true if connection initiated
     */
    bool connect(const std::string& host, unsigned port, bool useTls = false);

    /**
     * Connect to pool from URL
     *
     * @param url Pool URL (stratum+tcp://host:port or stratum+ssl://host:port)
     * @return true if connection initiated
     */
    bool connectUrl(const std::string& url);

    /**
     * Add failover pool
     */
    void addFailover(const std::string& host, unsigned port, bool useTls = false);

    /**
     * Check if TLS is supported
     */
    static bool isTlsSupported();

    /**
     * Verify server certificates (reject invalid/self-signed)
     */
    void setTlsVerification(bool strict) { m_tlsStrictVerify = strict; }

    /**
     * Disconnect from pool and release blocked fetches
     */
    void disconnect();

    /**
     * Graceful disconnect - wait for pending share submissions
     *
     * @param timeoutMs Maximum time to wait in milliseconds
     * @return Number of pending requests that completed
     */
    unsigned gracefulDisconnect(unsigned timeoutMs = 5000);

    size_t pendingRequestCount() const;

    bool isConnected() const { return m_state >= StratumState::Connected; }
    bool isAuthorized() const { return m_state == StratumState::Authorized; }

    /**
     * Set pool credentials
     *
     * @param user Username (usually wallet.worker)
     * @param pass Password
     */
    void setCredentials(const std::string& user, const std::string& pass);

    // WorkSource
    JobPtr fetchJob(Worker& worker, double minValiditySeconds) override;
    void nonceFound(Job& job, Nonce nonce) override;
    void hashesProcessed(Job& job, double count) override;
    void jobDestroyed(Job& job) override;

    StratumState getState() const { return m_state; }
    std::string getLastError() const;
    double getDifficulty() const { return m_difficulty; }
    uint64_t getAcceptedShares() const { return m_acceptedShares; }
    uint64_t getRejectedShares() const { return m_rejectedShares; }
    uint64_t getHardwareErrors() const { return m_hardwareErrors; }
    double getHashesProcessed() const;

    void setAutoReconnect(bool enable) { m_autoReconnect = enable; }
    void setReconnectDelay(unsigned seconds) { m_reconnectDelay = seconds; }

    /**
     * Seconds a block template stays usable after it was received
     */
    void setTemplateLifetime(double seconds) { m_templateLifetime = seconds; }

    /**
     * Feed one line as if it came from the pool (tests)
     */
    void injectLine(const std::string& line) { processLine(line); }

    /**
     * Set subscription data as if the pool had answered (tests)
     */
    void setSubscription(const std::string& extraNonce1, unsigned extraNonce2Size);

private:
    void ioThread();
    void doConnect();
    void handleConnect(const boost::system::error_code& ec);
#ifdef WITH_TLS
    void handleHandshake(const boost::system::error_code& ec);
#endif
    void onConnected();
    void startRead();
    void handleRead(const boost::system::error_code& ec, size_t bytes);

    /**
     * Process received line (JSON-RPC message)
     */
    void processLine(const std::string& line);

    void handleResponse(const json& response);
    void handleNotification(const json& notification);

    /**
     * Send JSON-RPC request and track it
     *
     * @return Request ID (0 if not sent)
     */
    uint64_t sendRequest(const std::string& method, const json& params);

    void subscribe();
    void authorize();
    void handleMiningNotify(const json& params);
    void handleSetDifficulty(const json& params);

    /**
     * Submit a share for a job
     */
    void submitShare(const StratumJob& job, Nonce nonce);

    void handleReconnect();
    void scheduleKeepalive();
    void sendKeepalive(const boost::system::error_code& ec);
    void scheduleRequestTimeout();
    void cleanupTimedOutRequests(const boost::system::error_code& ec);
    void scheduleWorkTimeout();
    void handleWorkTimeout(const boost::system::error_code& ec);

    void setLastError(const std::string& error);

    // Close sockets without touching the reconnect machinery
    void closeSockets();

private:
    // ASIO objects
    boost::asio::io_context m_io;
    std::unique_ptr<boost::asio::ip::tcp::socket> m_socket;
#ifdef WITH_TLS
    std::unique_ptr<boost::asio::ssl::context> m_sslContext;
    std::unique_ptr<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>> m_sslSocket;
    bool m_useTls{false};  // Whether current connection uses TLS
#endif
    static constexpr size_t MAX_LINE_LENGTH = 64 * 1024;
    boost::asio::streambuf m_readBuffer{MAX_LINE_LENGTH};
    std::unique_ptr<boost::asio::steady_timer> m_keepaliveTimer;
    std::unique_ptr<boost::asio::steady_timer> m_reconnectTimer;
    std::unique_ptr<boost::asio::steady_timer> m_requestTimeoutTimer;
    std::unique_ptr<boost::asio::steady_timer> m_workTimeoutTimer;

    // Socket write mutex (workers submit shares from their listener threads)
    std::mutex m_sendMutex;

    // IO thread
    std::thread m_thread;
    std::atomic<bool> m_running{false};

    // Connection state
    std::atomic<StratumState> m_state{StratumState::Disconnected};

    // Pool endpoints (primary + failovers)
    std::vector<PoolEndpoint> m_pools;
    unsigned m_currentPoolIndex{0};

    // Current credentials
    std::string m_user;
    std::string m_pass;

    // Request tracking
    std::atomic<uint64_t> m_requestId{1};
    std::map<uint64_t, PendingRequest> m_pendingRequests;
    mutable std::mutex m_requestMutex;

    // Current template and session, guarded by m_workMutex
    mutable std::mutex m_workMutex;
    std::condition_variable m_workCv;
    std::optional<StratumTemplate> m_template;
    Bytes m_extraNonce1;
    unsigned m_extraNonce2Size{4};
    uint64_t m_extraNonce2Counter{0};
    double m_templateLifetime{120};

    // Outstanding jobs, canceled on clean_jobs
    JobRegistry m_registry;

    // Difficulty
    std::atomic<double> m_difficulty{1.0};

    // Statistics
    std::atomic<uint64_t> m_acceptedShares{0};
    std::atomic<uint64_t> m_rejectedShares{0};
    std::atomic<uint64_t> m_hardwareErrors{0};
    double m_hashes{0};

    // Error tracking
    mutable std::mutex m_errorMutex;
    std::string m_lastError;

    // Subscription info
    std::string m_sessionId;

    // Reconnection settings
    std::atomic<bool> m_autoReconnect{true};
    unsigned m_reconnectDelay{5};  // seconds
    unsigned m_reconnectAttempts{0};
    static constexpr unsigned MAX_RECONNECT_ATTEMPTS = 10;

    // TLS settings
    bool m_tlsStrictVerify{false};  // Default: accept any cert (pools often use self-signed)

    // Keepalive settings
    static constexpr unsigned KEEPALIVE_INTERVAL = 30;  // seconds

    // Request timeout settings
    static constexpr unsigned REQUEST_TIMEOUT = 30;  // seconds
    static constexpr unsigned REQUEST_CLEANUP_INTERVAL = 10;  // seconds

    // Work timeout settings
    static constexpr unsigned WORK_TIMEOUT = 300;  // seconds without new work triggers reconnect
    std::chrono::steady_clock::time_point m_lastWorkTime;
};

}  // namespace sminer
