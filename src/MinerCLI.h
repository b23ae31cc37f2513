/**
 * SMiner - CLI Argument Parsing
 */

#pragma once

#include "core/WorkerSettings.h"
#include "util/Log.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sminer {

/**
 * Mining mode
 */
enum class MiningMode {
    Stratum,      // Take work from a pool via stratum
    Benchmark     // Local synthetic work
};

/**
 * CLI configuration
 */
struct MinerConfig {
    // Mining mode
    MiningMode mode = MiningMode::Benchmark;

    // Pool connection
    std::string poolUrl;
    std::string user;
    std::string password = "x";

    // Device and dispatch settings
    WorkerSettings worker;

    // Benchmark options
    double blockInterval = 0;   // Simulated new block every N seconds (0 = never)

    // TLS options
    bool tlsStrict = false;     // Strict certificate verification

    // Logging
    LogLevel logLevel = LogLevel::Info;

    // Config file given with --config
    std::string configFile;

    // Problems found while parsing (command line or config file)
    std::vector<std::string> errors;

    // Help
    bool showHelp = false;
    bool showVersion = false;
};

/**
 * MinerCLI class
 *
 * Parses command line arguments and the optional JSON config file.
 * Precedence: defaults, then config file, then command line.
 */
class MinerCLI {
public:
    /**
     * Parse command line arguments
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed configuration
     */
    static MinerConfig parse(int argc, char* argv[]);

    /**
     * Load a JSON config file into the configuration
     *
     * @return false if the file could not be read or had errors (see config.errors)
     */
    static bool loadConfigFile(const std::string& path, MinerConfig& config);

    /**
     * Apply a parsed JSON config document
     *
     * Every key of the wrong type adds an error naming the key; the other
     * keys are still applied.
     *
     * @return false if any key was rejected
     */
    static bool applyConfig(const nlohmann::json& doc, MinerConfig& config);

    /**
     * Parse a device kind name ("serial", "software")
     */
    static bool parseDeviceKind(const std::string& name, DeviceKind& kind);

    /**
     * Print help message
     */
    static void printHelp();

    /**
     * Print version
     */
    static void printVersion();
};

}  // namespace sminer
