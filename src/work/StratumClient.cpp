/**
 * SMiner - Stratum Client Implementation
 */

#include "StratumClient.h"
#include "Version.h"
#include "core/Worker.h"
#include "crypto/Sha256.h"
#include "util/Log.h"
#include <algorithm>
#include <cstring>
#include <regex>
#include <sstream>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace sminer {

namespace {

// Decode a hex field of an exact size
bool decodeField(const json& value, size_t size, Bytes& out) {
    if (!value.is_string()) {
        return false;
    }
    Bytes bytes;
    if (!fromHex(value.get<std::string>(), bytes) || (size != 0 && bytes.size() != size)) {
        return false;
    }
    out = std::move(bytes);
    return true;
}

// Copy a 4-byte big-endian hex field into the header, little-endian
void putWord(uint8_t* dst, const std::string& hex) {
    Bytes bytes;
    fromHex(hex, bytes);
    std::reverse_copy(bytes.begin(), bytes.end(), dst);
}

}  // namespace

std::optional<StratumTemplate> parseNotify(const json& params) {
    // [job_id, prevhash, coinb1, coinb2, merkle_branch[], version, nbits, ntime, clean_jobs]
    if (!params.is_array() || params.size() < 9) {
        return std::nullopt;
    }

    StratumTemplate tmpl;
    if (!params[0].is_string()) {
        return std::nullopt;
    }
    tmpl.jobId = params[0].get<std::string>();

    Bytes word;
    if (!decodeField(params[1], 32, tmpl.prevHash) ||
        !decodeField(params[2], 0, tmpl.coinbase1) ||
        !decodeField(params[3], 0, tmpl.coinbase2) ||
        !params[4].is_array() ||
        !decodeField(params[5], 4, word) ||
        !decodeField(params[6], 4, word) ||
        !decodeField(params[7], 4, word)) {
        return std::nullopt;
    }

    for (const auto& branch : params[4]) {
        Bytes bytes;
        if (!decodeField(branch, 32, bytes)) {
            return std::nullopt;
        }
        Hash256 hash;
        std::copy(bytes.begin(), bytes.end(), hash.begin());
        tmpl.merkleBranch.push_back(hash);
    }

    tmpl.versionHex = params[5].get<std::string>();
    tmpl.nbitsHex = params[6].get<std::string>();
    tmpl.ntimeHex = params[7].get<std::string>();
    tmpl.cleanJobs = params[8].is_boolean() && params[8].get<bool>();
    tmpl.receivedTime = Clock::now();
    tmpl.expiry = tmpl.receivedTime;
    return tmpl;
}

HeaderData buildStratumHeader(const StratumTemplate& tmpl, const Bytes& extraNonce1,
                              const Bytes& extraNonce2) {
    Bytes coinbase;
    coinbase.reserve(tmpl.coinbase1.size() + extraNonce1.size() + extraNonce2.size() +
                     tmpl.coinbase2.size());
    coinbase.insert(coinbase.end(), tmpl.coinbase1.begin(), tmpl.coinbase1.end());
    coinbase.insert(coinbase.end(), extraNonce1.begin(), extraNonce1.end());
    coinbase.insert(coinbase.end(), extraNonce2.begin(), extraNonce2.end());
    coinbase.insert(coinbase.end(), tmpl.coinbase2.begin(), tmpl.coinbase2.end());

    Hash256 root = sha256d(coinbase);
    for (const auto& branch : tmpl.merkleBranch) {
        uint8_t pair[64];
        std::memcpy(pair, root.data(), 32);
        std::memcpy(pair + 32, branch.data(), 32);
        root = sha256d(pair, sizeof(pair));
    }

    HeaderData header{};
    putWord(header.data(), tmpl.versionHex);

    // Pool sends the previous hash with every word byte-swapped
    std::memcpy(header.data() + 4, tmpl.prevHash.data(), 32);
    swapWords(header.data() + 4, 32);

    std::memcpy(header.data() + 36, root.data(), 32);
    putWord(header.data() + 68, tmpl.ntimeHex);
    putWord(header.data() + 72, tmpl.nbitsHex);
    return header;
}

StratumClient::StratumClient() = default;

StratumClient::~StratumClient() {
    disconnect();
}

bool StratumClient::connect(const std::string& host, unsigned port, bool useTls) {
    if (m_running) {
        disconnect();
    }

#ifdef WITH_TLS
    m_useTls = useTls;
#else
    if (useTls) {
        setLastError("TLS not supported (built without WITH_TLS)");
        Log::error(getLastError());
        return false;
    }
#endif

    // Set up primary pool
    if (m_pools.empty()) {
        m_pools.emplace_back(host, port, m_user, m_pass, useTls);
    } else {
        m_pools[0] = PoolEndpoint(host, port, m_user, m_pass, useTls);
    }
    m_currentPoolIndex = 0;

    m_state = StratumState::Connecting;
    m_running = true;
    m_reconnectAttempts = 0;

    m_thread = std::thread(&StratumClient::ioThread, this);
    return true;
}

bool StratumClient::isTlsSupported() {
#ifdef WITH_TLS
    return true;
#else
    return false;
#endif
}

bool StratumClient::connectUrl(const std::string& url) {
    // Parse URL: stratum+tcp://host:port or stratum+ssl://host:port
    std::regex urlRegex(R"(stratum\+(tcp|ssl)://([^:/]+):(\d+)/?)");
    std::smatch match;

    if (!std::regex_match(url, match, urlRegex)) {
        setLastError("Invalid URL format. Expected: stratum+tcp://host:port or stratum+ssl://host:port");
        return false;
    }

    std::string protocol = match[1].str();
    std::string host = match[2].str();
    unsigned port = std::stoul(match[3].str());
    bool useTls = (protocol == "ssl");

    if (useTls) {
        Log::info("Using TLS/SSL connection");
    }

    return connect(host, port, useTls);
}

void StratumClient::addFailover(const std::string& host, unsigned port, bool useTls) {
    m_pools.emplace_back(host, port, m_user, m_pass, useTls);
}

void StratumClient::disconnect() {
    bool wasRunning = m_running.exchange(false);
    m_state = StratumState::Disconnected;

    // Release workers blocked in fetchJob()
    {
        Guard lock(m_workMutex);
        m_template.reset();
        m_workCv.notify_all();
    }

    if (!wasRunning && !m_thread.joinable()) {
        return;
    }

    m_io.stop();

    if (m_thread.joinable()) {
        m_thread.join();
    }

    // IO thread is gone, timers and sockets can be dropped from here
    m_keepaliveTimer.reset();
    m_reconnectTimer.reset();
    m_requestTimeoutTimer.reset();
    m_workTimeoutTimer.reset();
    closeSockets();
    m_io.restart();

    {
        Guard lock(m_requestMutex);
        m_pendingRequests.clear();
    }

    Log::info("Disconnected from pool");
}

unsigned StratumClient::gracefulDisconnect(unsigned timeoutMs) {
    if (m_state == StratumState::Disconnected) {
        disconnect();
        return 0;
    }

    // Wait for pending share submissions to complete
    size_t initialPending = pendingRequestCount();
    if (initialPending > 0) {
        Log::info("Waiting for " + std::to_string(initialPending) + " pending share(s) to complete...");
    }

    unsigned waited = 0;
    const unsigned checkInterval = 100;  // Check every 100ms

    while (waited < timeoutMs) {
        if (pendingRequestCount() == 0) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(checkInterval));
        waited += checkInterval;
    }

    size_t remaining = pendingRequestCount();
    unsigned completed = static_cast<unsigned>(initialPending > remaining ? initialPending - remaining : 0);

    if (remaining > 0) {
        Log::warning("Timeout waiting for " + std::to_string(remaining) +
                     " pending request(s), disconnecting anyway");
    } else if (initialPending > 0) {
        Log::info("All pending requests completed");
    }

    disconnect();
    return completed;
}

size_t StratumClient::pendingRequestCount() const {
    Guard lock(m_requestMutex);
    return m_pendingRequests.size();
}

void StratumClient::setCredentials(const std::string& user, const std::string& pass) {
    m_user = user;
    m_pass = pass;

    for (auto& pool : m_pools) {
        pool.user = user;
        pool.pass = pass;
    }
}

void StratumClient::setSubscription(const std::string& extraNonce1, unsigned extraNonce2Size) {
    Bytes en1;
    if (!fromHex(extraNonce1, en1)) {
        Log::error("Invalid extranonce1: " + extraNonce1);
        return;
    }

    Guard lock(m_workMutex);
    m_extraNonce1 = std::move(en1);
    m_extraNonce2Size = extraNonce2Size;
    m_extraNonce2Counter = 0;
}

std::string StratumClient::getLastError() const {
    Guard lock(m_errorMutex);
    return m_lastError;
}

void StratumClient::setLastError(const std::string& error) {
    Guard lock(m_errorMutex);
    m_lastError = error;
}

double StratumClient::getHashesProcessed() const {
    Guard lock(m_workMutex);
    return m_hashes;
}

JobPtr StratumClient::fetchJob(Worker& worker, double minValiditySeconds) {
    UniqueGuard lock(m_workMutex);

    while (true) {
        if (worker.isShuttingDown()) {
            return nullptr;
        }

        if (m_template &&
            secondsBetween(Clock::now(), m_template->expiry) >= minValiditySeconds) {
            break;
        }

        // Short waits so a worker shutdown is noticed
        m_workCv.wait_for(lock, std::chrono::milliseconds(250));
    }

    const StratumTemplate& tmpl = *m_template;

    // Fresh extranonce2 for every job, little-endian counter
    Bytes extraNonce2(m_extraNonce2Size, 0);
    uint64_t counter = m_extraNonce2Counter++;
    for (unsigned i = 0; i < m_extraNonce2Size && i < 8; ++i) {
        extraNonce2[i] = static_cast<uint8_t>(counter >> (i * 8));
    }

    HeaderData serialized = buildStratumHeader(tmpl, m_extraNonce1, extraNonce2);

    Hash256 target;
    difficultyToTarget(m_difficulty, target);

    auto job = std::make_shared<StratumJob>(this, tmpl, headerToGetwork(serialized.data()),
                                            target, toHex(extraNonce2));

    // Registered before the template can change, so clean_jobs catches it
    m_registry.add(job, worker);
    return job;
}

void StratumClient::nonceFound(Job& job, Nonce nonce) {
    auto* stratumJob = dynamic_cast<StratumJob*>(&job);
    if (!stratumJob) {
        Log::warning("Nonce for foreign job " + job.getId() + " ignored");
        return;
    }

    Hash256 hash = hashHeader(job.getHeader(), nonce);

    if (!isDifficultyOne(hash)) {
        ++m_hardwareErrors;
        Log::warning("Hardware error: nonce " + nonceToHex(nonce) + " on " + job.getId() +
                     " does not meet difficulty 1");
        return;
    }

    if (!meetsTarget(hash, job.getTarget())) {
        Log::debug("Nonce " + nonceToHex(nonce) + " below share difficulty");
        return;
    }

    submitShare(*stratumJob, nonce);
}

void StratumClient::hashesProcessed(Job& job, double count) {
    (void)job;
    Guard lock(m_workMutex);
    m_hashes += count;
}

void StratumClient::jobDestroyed(Job& job) {
    m_registry.remove(job);
}

void StratumClient::submitShare(const StratumJob& job, Nonce nonce) {
    if (m_state != StratumState::Authorized) {
        Log::warning("Cannot submit: not authorized");
        return;
    }

    // ["worker", "job_id", "extranonce2", "ntime", "nonce"]
    json params = json::array();
    params.push_back(m_user);
    params.push_back(job.getPoolJobId());
    params.push_back(job.getExtraNonce2());
    params.push_back(job.getNtime());
    params.push_back(nonceToHex(nonce));

    uint64_t reqId = sendRequest("mining.submit", params);
    if (reqId == 0) {
        return;
    }

    Log::info("Submitting share (job=" + job.getPoolJobId() + ", en2=" + job.getExtraNonce2() +
              ", nonce=" + nonceToHex(nonce) + ")");

    Guard lock(m_requestMutex);
    m_pendingRequests[reqId] = {"mining.submit", std::chrono::steady_clock::now()};
}

void StratumClient::ioThread() {
    try {
        // Create timers
        m_keepaliveTimer = std::make_unique<asio::steady_timer>(m_io);
        m_reconnectTimer = std::make_unique<asio::steady_timer>(m_io);
        m_requestTimeoutTimer = std::make_unique<asio::steady_timer>(m_io);
        m_workTimeoutTimer = std::make_unique<asio::steady_timer>(m_io);

        m_lastWorkTime = std::chrono::steady_clock::now();

        doConnect();
        scheduleRequestTimeout();

        m_io.run();

    } catch (const std::exception& e) {
        setLastError(e.what());
        Log::error("Stratum IO error: " + std::string(e.what()));
        m_state = StratumState::Disconnected;
    }
}

void StratumClient::doConnect() {
    if (!m_running) return;

    if (m_pools.empty()) {
        setLastError("No pool configured");
        Log::error("No pool configured");
        return;
    }

    const auto& pool = m_pools[m_currentPoolIndex];

#ifdef WITH_TLS
    m_useTls = pool.useTls;
    std::string protocol = m_useTls ? "TLS" : "TCP";
    Log::info("Connecting to " + pool.host + ":" + std::to_string(pool.port) + " (" + protocol + ")...");
#else
    Log::info("Connecting to " + pool.host + ":" + std::to_string(pool.port) + "...");
#endif

    try {
        tcp::resolver resolver(m_io);
        auto endpoints = resolver.resolve(pool.host, std::to_string(pool.port));

#ifdef WITH_TLS
        if (m_useTls) {
            m_sslContext = std::make_unique<asio::ssl::context>(asio::ssl::context::tlsv12_client);
            m_sslContext->set_default_verify_paths();

            if (m_tlsStrictVerify) {
                m_sslContext->set_verify_mode(asio::ssl::verify_peer | asio::ssl::verify_fail_if_no_peer_cert);
                m_sslContext->set_verify_callback([](bool preverified, asio::ssl::verify_context& ctx) {
                    if (!preverified) {
                        int err = X509_STORE_CTX_get_error(ctx.native_handle());
                        Log::warning("TLS certificate verification failed: " +
                                     std::string(X509_verify_cert_error_string(err)));
                    }
                    return preverified;
                });
                Log::info("TLS strict verification enabled");
            } else {
                // Pools often use self-signed certificates
                m_sslContext->set_verify_mode(asio::ssl::verify_none);
                Log::debug("TLS permissive mode (accepting any certificate)");
            }

            m_sslSocket = std::make_unique<asio::ssl::stream<tcp::socket>>(m_io, *m_sslContext);

            // SNI hostname (required by some servers)
            SSL_set_tlsext_host_name(m_sslSocket->native_handle(), pool.host.c_str());

            asio::async_connect(m_sslSocket->lowest_layer(), endpoints,
                [this](const boost::system::error_code& ec, const tcp::endpoint&) {
                    handleConnect(ec);
                });
        } else
#endif
        {
            m_socket = std::make_unique<tcp::socket>(m_io);

            asio::async_connect(*m_socket, endpoints,
                [this](const boost::system::error_code& ec, const tcp::endpoint&) {
                    handleConnect(ec);
                });
        }

    } catch (const std::exception& e) {
        setLastError(e.what());
        Log::error("Connection setup failed: " + std::string(e.what()));
        handleReconnect();
    }
}

void StratumClient::handleConnect(const boost::system::error_code& ec) {
    if (!m_running) return;

    if (ec) {
        setLastError(ec.message());
        Log::error("Failed to connect to pool: " + ec.message());
        handleReconnect();
        return;
    }

#ifdef WITH_TLS
    if (m_useTls) {
        Log::info("TCP connected, starting TLS handshake...");
        m_sslSocket->async_handshake(asio::ssl::stream_base::client,
            [this](const boost::system::error_code& ec) {
                handleHandshake(ec);
            });
        return;
    }
#endif

    onConnected();
}

#ifdef WITH_TLS
void StratumClient::handleHandshake(const boost::system::error_code& ec) {
    if (!m_running) return;

    if (ec) {
        setLastError("TLS handshake failed: " + ec.message());
        Log::error("TLS handshake failed: " + ec.message());
        handleReconnect();
        return;
    }

    onConnected();
}
#endif

void StratumClient::onConnected() {
    const auto& pool = m_pools[m_currentPoolIndex];
    Log::info("Connected to " + pool.host + ":" + std::to_string(pool.port));
    m_state = StratumState::Connected;
    m_reconnectAttempts = 0;

    startRead();
    subscribe();
    scheduleKeepalive();
    scheduleWorkTimeout();
}

void StratumClient::startRead() {
    if (!m_running) return;

    // m_readBuffer is bounded by MAX_LINE_LENGTH; a longer line makes
    // async_read_until fail with not_found

#ifdef WITH_TLS
    if (m_useTls) {
        if (!m_sslSocket) return;

        asio::async_read_until(*m_sslSocket, m_readBuffer, '\n',
            [this](const boost::system::error_code& ec, size_t bytes) {
                handleRead(ec, bytes);
            });
    } else
#endif
    {
        if (!m_socket) return;

        asio::async_read_until(*m_socket, m_readBuffer, '\n',
            [this](const boost::system::error_code& ec, size_t bytes) {
                handleRead(ec, bytes);
            });
    }
}

void StratumClient::handleRead(const boost::system::error_code& ec, size_t bytes) {
    if (!m_running) return;

    if (ec) {
        if (ec != asio::error::operation_aborted) {
            std::string error = ec == asio::error::not_found
                ? "Buffer overflow: no newline within " + std::to_string(MAX_LINE_LENGTH) + " bytes"
                : ec.message();
            setLastError(error);
            Log::error("Read error: " + error);
            m_readBuffer.consume(m_readBuffer.size());
            m_state = StratumState::Disconnected;
            handleReconnect();
        }
        return;
    }
    (void)bytes;

    std::istream is(&m_readBuffer);
    std::string line;
    std::getline(is, line);

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (!line.empty()) {
        processLine(line);
    }

    if (m_running) {
        startRead();
    }
}

void StratumClient::processLine(const std::string& line) {
    Log::debug("Recv: " + line);

    try {
        json msg = json::parse(line);

        // Response: has "id" and no "method"
        if (msg.contains("id") && !msg["id"].is_null() && !msg.contains("method")) {
            handleResponse(msg);
        }
        else if (msg.contains("method")) {
            handleNotification(msg);
        }
        else {
            Log::warning("Unknown message format: " + line);
        }

    } catch (const json::exception& e) {
        Log::error("JSON error: " + std::string(e.what()));
    }
}

void StratumClient::handleResponse(const json& response) {
    uint64_t id = response["id"].get<uint64_t>();

    std::string method;
    {
        Guard lock(m_requestMutex);
        auto it = m_pendingRequests.find(id);
        if (it != m_pendingRequests.end()) {
            method = it->second.method;
            m_pendingRequests.erase(it);
        }
    }

    bool hasError = response.contains("error") && !response["error"].is_null();
    std::string errorMsg;
    if (hasError) {
        const auto& error = response["error"];
        if (error.is_array() && error.size() > 1 && error[1].is_string()) {
            errorMsg = error[1].get<std::string>();
        } else if (error.is_string()) {
            errorMsg = error.get<std::string>();
        } else if (error.is_object() && error.contains("message")) {
            errorMsg = error["message"].get<std::string>();
        } else {
            errorMsg = "Unknown error";
        }
    }

    if (method == "mining.subscribe") {
        if (hasError) {
            Log::error("Subscription failed: " + errorMsg);
            handleReconnect();
            return;
        }

        // [[["mining.set_difficulty", id], ["mining.notify", id]], extranonce1, extranonce2_size]
        const auto& result = response["result"];
        if (!result.is_array() || result.size() < 3) {
            Log::error("Malformed subscription result");
            handleReconnect();
            return;
        }

        if (result[0].is_array() && !result[0].empty()) {
            if (result[0][0].is_array()) {
                if (result[0][0].size() >= 2 && result[0][0][1].is_string()) {
                    m_sessionId = result[0][0][1].get<std::string>();
                }
            } else if (result[0].size() >= 2 && result[0][1].is_string()) {
                m_sessionId = result[0][1].get<std::string>();
            }
        }

        std::string extraNonce1 = result[1].get<std::string>();
        unsigned extraNonce2Size = result[2].get<unsigned>();
        if (extraNonce2Size == 0 || extraNonce2Size > 8) {
            Log::error("Unsupported extranonce2_size " + std::to_string(extraNonce2Size));
            handleReconnect();
            return;
        }

        setSubscription(extraNonce1, extraNonce2Size);
        Log::info("Subscribed (session=" + m_sessionId + ", extranonce1=" + extraNonce1 +
                  ", extranonce2_size=" + std::to_string(extraNonce2Size) + ")");
        m_state = StratumState::Subscribed;

        authorize();
    }
    else if (method == "mining.authorize") {
        bool authorized = !hasError;
        if (authorized && response.contains("result") && response["result"].is_boolean()) {
            authorized = response["result"].get<bool>();
        }

        if (authorized) {
            Log::info("Authorized with pool as " + m_user);
            m_state = StratumState::Authorized;
        } else {
            Log::error("Authorization failed" + (errorMsg.empty() ? "" : ": " + errorMsg));
            handleReconnect();
        }
    }
    else if (method == "mining.submit") {
        bool accepted = !hasError && response.contains("result") &&
                        response["result"].is_boolean() && response["result"].get<bool>();
        if (accepted) {
            Log::info("Share accepted!");
            m_acceptedShares++;
        } else {
            Log::warning("Share rejected" + (errorMsg.empty() ? "" : ": " + errorMsg));
            m_rejectedShares++;
        }
    }
}

void StratumClient::handleNotification(const json& notification) {
    std::string method = notification["method"].get<std::string>();
    const json params = notification.contains("params") ? notification["params"] : json::array();

    if (method == "mining.notify") {
        handleMiningNotify(params);
    }
    else if (method == "mining.set_difficulty") {
        handleSetDifficulty(params);
    }
    else if (method == "client.show_message") {
        if (params.is_array() && !params.empty() && params[0].is_string()) {
            Log::info("Pool message: " + params[0].get<std::string>());
        }
    }
    else if (method == "client.reconnect") {
        Log::info("Pool requested reconnect");
        handleReconnect();
    }
    else {
        Log::debug("Unknown notification: " + method);
    }
}

uint64_t StratumClient::sendRequest(const std::string& method, const json& params) {
#ifdef WITH_TLS
    if (m_useTls) {
        if (!m_sslSocket) return 0;
    } else
#endif
    {
        if (!m_socket) return 0;
    }

    uint64_t id = m_requestId++;

    json request = {
        {"id", id},
        {"method", method},
        {"params", params}
    };

    std::string msg = request.dump() + "\n";
    Log::debug("Send: " + msg);

    // Shares are submitted from worker listener threads
    boost::system::error_code ec;
    {
        Guard lock(m_sendMutex);
#ifdef WITH_TLS
        if (m_useTls) {
            asio::write(*m_sslSocket, asio::buffer(msg), ec);
        } else
#endif
        {
            asio::write(*m_socket, asio::buffer(msg), ec);
        }
    }

    if (ec) {
        Log::error("Send error: " + ec.message());
        return 0;
    }

    return id;
}

void StratumClient::subscribe() {
    json params = json::array();
    params.push_back(MINER_VERSION);

    uint64_t id = sendRequest("mining.subscribe", params);
    if (id == 0) return;

    Guard lock(m_requestMutex);
    m_pendingRequests[id] = {"mining.subscribe", std::chrono::steady_clock::now()};
}

void StratumClient::authorize() {
    const auto& pool = m_pools[m_currentPoolIndex];
    json params = json::array();
    params.push_back(pool.user.empty() ? m_user : pool.user);
    params.push_back(pool.pass.empty() ? m_pass : pool.pass);

    uint64_t id = sendRequest("mining.authorize", params);
    if (id == 0) return;

    Guard lock(m_requestMutex);
    m_pendingRequests[id] = {"mining.authorize", std::chrono::steady_clock::now()};
}

void StratumClient::handleMiningNotify(const json& params) {
    auto tmpl = parseNotify(params);
    if (!tmpl) {
        Log::error("Invalid mining.notify params");
        return;
    }

    tmpl->expiry = tmpl->receivedTime + toMillis(m_templateLifetime);
    std::string jobId = tmpl->jobId;
    bool clean = tmpl->cleanJobs;

    {
        Guard lock(m_workMutex);
        m_template = std::move(*tmpl);
        m_workCv.notify_all();
    }

    m_lastWorkTime = std::chrono::steady_clock::now();
    scheduleWorkTimeout();

    if (clean) {
        // New block: everything handed out so far is stale
        size_t canceled = m_registry.cancelAll(false);
        Log::info("New job (clean): " + jobId + ", " + std::to_string(canceled) + " job(s) canceled");
    } else {
        Log::info("New job: " + jobId);
    }
}

void StratumClient::handleSetDifficulty(const json& params) {
    if (!params.is_array() || params.empty() || !params[0].is_number()) {
        Log::error("Invalid set_difficulty params");
        return;
    }

    double difficulty = params[0].get<double>();
    m_difficulty = difficulty;

    std::ostringstream ss;
    ss << "Difficulty set to " << difficulty;
    Log::info(ss.str());
}

void StratumClient::handleReconnect() {
    if (!m_running || !m_autoReconnect) return;

    m_state = StratumState::Disconnected;
    closeSockets();

    {
        Guard lock(m_requestMutex);
        m_pendingRequests.clear();
    }

    m_reconnectAttempts++;

    // Try the next pool after a few failures
    if (m_reconnectAttempts >= MAX_RECONNECT_ATTEMPTS / 2 && m_pools.size() > 1) {
        m_currentPoolIndex = (m_currentPoolIndex + 1) % m_pools.size();
        Log::info("Switching to failover pool " + std::to_string(m_currentPoolIndex + 1) +
                  "/" + std::to_string(m_pools.size()));
        m_reconnectAttempts = 0;
    }

    // Exponential backoff, capped at 32x
    unsigned delay = m_reconnectDelay * (1u << std::min(m_reconnectAttempts, 5u));
    Log::info("Reconnecting in " + std::to_string(delay) + " seconds...");

    if (!m_reconnectTimer) return;
    m_reconnectTimer->expires_after(std::chrono::seconds(delay));
    m_reconnectTimer->async_wait([this](const boost::system::error_code& ec) {
        if (!ec && m_running) {
            m_state = StratumState::Connecting;
            doConnect();
        }
    });
}

void StratumClient::closeSockets() {
    boost::system::error_code ec;
#ifdef WITH_TLS
    if (m_sslSocket) {
        m_sslSocket->lowest_layer().close(ec);
        m_sslSocket.reset();
    }
    m_sslContext.reset();
#endif
    if (m_socket) {
        m_socket->close(ec);
        m_socket.reset();
    }
}

void StratumClient::scheduleKeepalive() {
    if (!m_running || !m_keepaliveTimer) return;

    m_keepaliveTimer->expires_after(std::chrono::seconds(KEEPALIVE_INTERVAL));
    m_keepaliveTimer->async_wait([this](const boost::system::error_code& ec) {
        sendKeepalive(ec);
    });
}

void StratumClient::sendKeepalive(const boost::system::error_code& ec) {
    if (ec || !m_running) return;

    // Pools that do not know mining.ping answer with an error, which is fine
    if (m_state == StratumState::Authorized) {
        sendRequest("mining.ping", json::array());
    }

    scheduleKeepalive();
}

void StratumClient::scheduleRequestTimeout() {
    if (!m_running || !m_requestTimeoutTimer) return;

    m_requestTimeoutTimer->expires_after(std::chrono::seconds(REQUEST_CLEANUP_INTERVAL));
    m_requestTimeoutTimer->async_wait([this](const boost::system::error_code& ec) {
        cleanupTimedOutRequests(ec);
    });
}

void StratumClient::cleanupTimedOutRequests(const boost::system::error_code& ec) {
    if (ec || !m_running) return;

    auto now = std::chrono::steady_clock::now();
    size_t timedOut = 0;

    {
        Guard lock(m_requestMutex);
        for (auto it = m_pendingRequests.begin(); it != m_pendingRequests.end();) {
            auto age = std::chrono::duration_cast<std::chrono::seconds>(now - it->second.timestamp).count();
            if (age < REQUEST_TIMEOUT) {
                ++it;
                continue;
            }

            Log::warning("Request " + std::to_string(it->first) + " (" + it->second.method +
                         ") timed out after " + std::to_string(age) + "s");
            if (it->second.method == "mining.submit") {
                m_rejectedShares++;
            }
            it = m_pendingRequests.erase(it);
            ++timedOut;
        }
    }

    // If too many timeouts, connection might be dead
    if (timedOut >= 3) {
        Log::error("Multiple request timeouts - connection may be stale");
        handleReconnect();
    }

    scheduleRequestTimeout();
}

void StratumClient::scheduleWorkTimeout() {
    if (!m_running || !m_workTimeoutTimer) return;

    m_workTimeoutTimer->cancel();
    m_workTimeoutTimer->expires_after(std::chrono::seconds(WORK_TIMEOUT));
    m_workTimeoutTimer->async_wait([this](const boost::system::error_code& ec) {
        handleWorkTimeout(ec);
    });
}

void StratumClient::handleWorkTimeout(const boost::system::error_code& ec) {
    if (ec || !m_running) return;

    if (m_state != StratumState::Authorized) {
        scheduleWorkTimeout();
        return;
    }

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - m_lastWorkTime).count();

    if (elapsed >= WORK_TIMEOUT) {
        Log::warning("No new work received for " + std::to_string(elapsed) +
                     " seconds, reconnecting...");
        handleReconnect();
        return;
    }

    unsigned remaining = WORK_TIMEOUT - static_cast<unsigned>(elapsed);
    m_workTimeoutTimer->expires_after(std::chrono::seconds(remaining));
    m_workTimeoutTimer->async_wait([this](const boost::system::error_code& ec) {
        handleWorkTimeout(ec);
    });
}

}  // namespace sminer
