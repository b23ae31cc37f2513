/**
 * SMiner - Main Entry Point
 *
 * SHA-256d proof-of-work worker for serial mining devices
 */

#include "MinerCLI.h"
#include "core/Worker.h"
#include "device/SerialChannel.h"
#include "device/SoftwareDevice.h"
#include "work/BenchmarkSource.h"
#include "work/StratumClient.h"
#include "util/Log.h"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

using namespace sminer;

// Global flag for graceful shutdown
static std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

DeviceChannelPtr createChannel(const WorkerSettings& settings) {
    if (settings.device == DeviceKind::Software) {
        return std::make_shared<SoftwareDevice>(settings.threads);
    }
    return std::make_shared<SerialChannel>(settings.port, settings.baudrate);
}

void logStats(const Worker& worker, const std::string& extra) {
    WorkerStats stats = worker.getStats();

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << stats.mhps << " MH/s"
       << " | interval " << stats.jobInterval << "s"
       << " | " << workerPhaseName(worker.getPhase())
       << " | nonces " << stats.noncesReported
       << " | faults " << stats.faults;
    if (!extra.empty()) {
        ss << " | " << extra;
    }

    Log::info(ss.str());
}

// Run the worker until a signal arrives, logging stats every 10 seconds
template <typename StatsFn>
void runWorker(Worker& worker, StatsFn extraStats) {
    worker.start();

    auto lastStats = std::chrono::steady_clock::now();

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration<double>(now - lastStats).count();

        if (elapsed >= 10.0) {  // Print stats every 10 seconds
            lastStats = now;
            logStats(worker, extraStats());
        }
    }

    Log::info("Shutting down...");
    worker.stop();
}

int runBenchmark(const MinerConfig& config) {
    Log::info("Starting benchmark on " + std::string(config.worker.device == DeviceKind::Software
                                                         ? "software device" : config.worker.port));

    BenchmarkSource source(config.blockInterval);
    source.start();

    Worker worker(source, config.worker, createChannel);

    runWorker(worker, [&source]() {
        return "valid " + std::to_string(source.getValidNonces()) +
               " invalid " + std::to_string(source.getInvalidNonces());
    });

    source.stop();

    std::cout << "\n=== Benchmark Results ===\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Device rate:    " << worker.getStats().mhps << " MH/s\n";
    std::cout << "Jobs issued:    " << source.getJobsIssued() << "\n";
    std::cout << "Valid nonces:   " << source.getValidNonces() << "\n";
    std::cout << "Invalid nonces: " << source.getInvalidNonces() << "\n";
    std::cout << std::endl;

    return source.getInvalidNonces() == 0 ? 0 : 2;
}

int runMining(const MinerConfig& config) {
    Log::info("Starting SMiner...");

    StratumClient stratum;

    // Configure TLS
    stratum.setTlsVerification(config.tlsStrict);

    // Connect to pool
    stratum.setCredentials(config.user, config.password);
    if (!stratum.connectUrl(config.poolUrl)) {
        Log::error("Failed to connect to pool: " + stratum.getLastError());
        return 1;
    }

    // Wait for authorization
    int timeout = 30;
    while (!stratum.isAuthorized() && timeout > 0 && g_running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        timeout--;
    }

    if (!stratum.isAuthorized()) {
        Log::error("Failed to authorize with pool");
        stratum.disconnect();
        return 1;
    }

    Worker worker(stratum, config.worker, createChannel);

    runWorker(worker, [&stratum]() {
        return "A:" + std::to_string(stratum.getAcceptedShares()) +
               " R:" + std::to_string(stratum.getRejectedShares()) +
               " HW:" + std::to_string(stratum.getHardwareErrors());
    });

    // Wait for pending share submissions with 5 second timeout
    stratum.gracefulDisconnect(5000);

    Log::info("Shutdown complete");
    return 0;
}

int main(int argc, char* argv[]) {
    // Set up signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Parse command line
    MinerConfig config = MinerCLI::parse(argc, argv);

    // Handle help/version
    if (config.showHelp) {
        MinerCLI::printHelp();
        return 0;
    }

    if (config.showVersion) {
        MinerCLI::printVersion();
        return 0;
    }

    if (!config.errors.empty()) {
        for (const auto& error : config.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        return 1;
    }

    // Configure logging
    Log::setLevel(config.logLevel);
    Log::setShowTimestamp(true);

    try {
        switch (config.mode) {
            case MiningMode::Benchmark:
                return runBenchmark(config);

            case MiningMode::Stratum:
                if (config.user.empty()) {
                    Log::error("Username required for mining. Use -u wallet.worker");
                    return 1;
                }
                return runMining(config);
        }
    } catch (const std::exception& e) {
        Log::error(std::string("Fatal: ") + e.what());
        return 1;
    }

    return 0;
}
