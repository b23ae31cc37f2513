/**
 * SMiner - CLI Implementation
 */

#include "MinerCLI.h"
#include "Version.h"
#include "work/StratumClient.h"
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

namespace po = boost::program_options;
using json = nlohmann::json;

namespace sminer {

namespace {

void typeError(MinerConfig& config, const std::string& key, const char* expected) {
    config.errors.push_back("Config key '" + key + "' must be " + expected);
}

bool readString(const json& doc, const std::string& key, std::string& out, MinerConfig& config) {
    if (!doc.contains(key)) return true;
    if (!doc[key].is_string()) {
        typeError(config, key, "a string");
        return false;
    }
    out = doc[key].get<std::string>();
    return true;
}

bool readNumber(const json& doc, const std::string& key, double& out, MinerConfig& config) {
    if (!doc.contains(key)) return true;
    if (!doc[key].is_number()) {
        typeError(config, key, "a number");
        return false;
    }
    out = doc[key].get<double>();
    return true;
}

bool readUnsigned(const json& doc, const std::string& key, unsigned& out, MinerConfig& config) {
    if (!doc.contains(key)) return true;
    if (!doc[key].is_number_integer() || doc[key].get<int64_t>() < 0) {
        typeError(config, key, "a non-negative integer");
        return false;
    }
    out = doc[key].get<unsigned>();
    return true;
}

}  // namespace

bool MinerCLI::parseDeviceKind(const std::string& name, DeviceKind& kind) {
    if (name == "serial") { kind = DeviceKind::Serial; return true; }
    if (name == "software") { kind = DeviceKind::Software; return true; }
    return false;
}

bool MinerCLI::applyConfig(const json& doc, MinerConfig& config) {
    if (!doc.is_object()) {
        config.errors.push_back("Config file must contain a JSON object");
        return false;
    }

    size_t before = config.errors.size();
    WorkerSettings& worker = config.worker;

    readString(doc, "name", worker.name, config);
    readString(doc, "port", worker.port, config);
    readUnsigned(doc, "baudrate", worker.baudrate, config);
    readUnsigned(doc, "threads", worker.threads, config);
    readNumber(doc, "job_interval", worker.jobInterval, config);
    readNumber(doc, "validation_timeout", worker.validationTimeout, config);
    readNumber(doc, "ack_timeout", worker.ackTimeout, config);

    std::string device;
    if (readString(doc, "device", device, config) && !device.empty()) {
        if (!parseDeviceKind(device, worker.device)) {
            config.errors.push_back("Config key 'device' must be \"serial\" or \"software\"");
        }
    }

    std::string pool;
    if (readString(doc, "pool", pool, config) && !pool.empty()) {
        config.poolUrl = pool;
        config.mode = MiningMode::Stratum;
    }
    readString(doc, "user", config.user, config);
    readString(doc, "password", config.password, config);

    std::string level;
    if (readString(doc, "log_level", level, config) && !level.empty()) {
        if (!parseLogLevel(level, config.logLevel)) {
            config.errors.push_back("Config key 'log_level' has unknown level '" + level + "'");
        }
    }

    return config.errors.size() == before;
}

bool MinerCLI::loadConfigFile(const std::string& path, MinerConfig& config) {
    std::ifstream file(path);
    if (!file) {
        config.errors.push_back("Cannot open config file: " + path);
        return false;
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        config.errors.push_back("Invalid config file " + path + ": " + e.what());
        return false;
    }

    return applyConfig(doc, config);
}

MinerConfig MinerCLI::parse(int argc, char* argv[]) {
    MinerConfig config;

    po::options_description general("General options");
    general.add_options()
        ("help,h", "Show help message")
        ("version,V", "Show version")
        ("verbose,v", "Verbose output")
        ("quiet,q", "Quiet output (errors only)")
        ("config,c", po::value<std::string>(), "JSON config file")
    ;

    po::options_description mining("Mining options");
    mining.add_options()
        ("pool,P", po::value<std::string>(), "Pool URL (stratum+tcp://host:port)")
        ("user,u", po::value<std::string>(), "Pool username (wallet.worker)")
        ("password,p", po::value<std::string>(), "Pool password")
        ("tls-strict", "Enable strict TLS certificate verification")
    ;

    po::options_description device("Device options");
    device.add_options()
        ("device,d", po::value<std::string>(), "Device kind: serial, software")
        ("port", po::value<std::string>(), "Serial port of the mining device")
        ("baudrate,b", po::value<unsigned>(), "Serial baud rate")
        ("threads,t", po::value<unsigned>(), "Software device threads (0 = all cores)")
        ("name,n", po::value<std::string>(), "Worker name")
    ;

    po::options_description timing("Timing options");
    timing.add_options()
        ("job-interval,i", po::value<double>(), "Maximum seconds between jobs")
        ("ack-timeout", po::value<double>(), "Seconds to wait for a job acknowledgement")
        ("validation-timeout", po::value<double>(), "Seconds to wait for the validation job")
    ;

    po::options_description benchmark("Benchmark options");
    benchmark.add_options()
        ("benchmark,M", "Mine local benchmark work")
        ("block-interval", po::value<double>(), "Simulate a new block every N seconds")
    ;

    po::options_description all("SMiner Options");
    all.add(general).add(mining).add(device).add(timing).add(benchmark);

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, all), vm);
        po::notify(vm);

        // General options
        if (vm.count("help")) {
            config.showHelp = true;
            return config;
        }
        if (vm.count("version")) {
            config.showVersion = true;
            return config;
        }

        // Config file first, command line overrides it
        if (vm.count("config")) {
            config.configFile = vm["config"].as<std::string>();
            if (!loadConfigFile(config.configFile, config)) {
                return config;
            }
        }

        if (vm.count("verbose")) {
            config.logLevel = LogLevel::Debug;
        } else if (vm.count("quiet")) {
            config.logLevel = LogLevel::Error;
        }

        // Mode selection
        if (vm.count("benchmark")) {
            config.mode = MiningMode::Benchmark;
        } else if (vm.count("pool")) {
            config.mode = MiningMode::Stratum;
            config.poolUrl = vm["pool"].as<std::string>();
        }
        if (vm.count("user")) {
            config.user = vm["user"].as<std::string>();
        }
        if (vm.count("password")) {
            config.password = vm["password"].as<std::string>();
        }
        config.tlsStrict = vm.count("tls-strict") > 0;

        // Device selection
        WorkerSettings& worker = config.worker;
        if (vm.count("device") &&
            !parseDeviceKind(vm["device"].as<std::string>(), worker.device)) {
            config.errors.push_back("Unknown device kind: " + vm["device"].as<std::string>());
        }
        if (vm.count("port")) {
            worker.port = vm["port"].as<std::string>();
        }
        if (vm.count("baudrate")) {
            worker.baudrate = vm["baudrate"].as<unsigned>();
        }
        if (vm.count("threads")) {
            worker.threads = vm["threads"].as<unsigned>();
        }
        if (vm.count("name")) {
            worker.name = vm["name"].as<std::string>();
        }

        // Timing
        if (vm.count("job-interval")) {
            worker.jobInterval = vm["job-interval"].as<double>();
        }
        if (vm.count("ack-timeout")) {
            worker.ackTimeout = vm["ack-timeout"].as<double>();
        }
        if (vm.count("validation-timeout")) {
            worker.validationTimeout = vm["validation-timeout"].as<double>();
        }
        if (vm.count("block-interval")) {
            config.blockInterval = vm["block-interval"].as<double>();
        }

    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        config.showHelp = true;
        return config;
    }

    // Sanity checks on the merged result
    const WorkerSettings& worker = config.worker;
    if (worker.baudrate == 0) {
        config.errors.push_back("Baud rate must be positive");
    }
    if (worker.jobInterval <= 0) {
        config.errors.push_back("Job interval must be positive");
    }
    if (worker.ackTimeout <= 0 || worker.validationTimeout <= 0) {
        config.errors.push_back("Timeouts must be positive");
    }

    return config;
}

void MinerCLI::printHelp() {
    std::cout << R"(
SMiner - SHA-256d proof-of-work worker for serial mining devices

Usage: sminer [OPTIONS]

General Options:
  -h, --help                Show this help message
  -V, --version             Show version
  -v, --verbose             Verbose output
  -q, --quiet               Quiet output (errors only)
  -c, --config FILE         JSON config file (command line overrides it)

Mining Options:
  -P, --pool URL            Pool URL (stratum+tcp://host:port or stratum+ssl://host:port)
  -u, --user USER           Pool username (wallet.worker)
  -p, --password PASS       Pool password (default: x)
  --tls-strict              Verify the pool's TLS certificate

Device Options:
  -d, --device KIND         serial (default) or software
  --port PATH               Serial port (default: /dev/ttyS0)
  -b, --baudrate N          Serial baud rate (default: 115200)
  -t, --threads N           Software device threads (0 = all cores)
  -n, --name NAME           Worker name (default: sminer0)

Timing Options:
  -i, --job-interval SEC    Maximum seconds between jobs (default: 60)
  --ack-timeout SEC         Job acknowledgement timeout (default: 1)
  --validation-timeout SEC  Validation job timeout (default: 60)

Benchmark Options:
  -M, --benchmark           Mine local benchmark work (default mode)
  --block-interval SEC      Simulate a new block every SEC seconds

Config File Keys:
  port, baudrate, job_interval, device, threads, pool, user, password,
  validation_timeout, ack_timeout, log_level, name

Examples:
  sminer --port /dev/ttyUSB0 -P stratum+tcp://pool:3333 -u wallet.worker
                                           Mine with a serial device
  sminer -d software -M                    Benchmark the software device
  sminer -c sminer.json                    Use a config file

)" << std::endl;
}

void MinerCLI::printVersion() {
    std::cout << getVersionString() << std::endl;
    std::cout << "SHA-256d Serial Mining Worker" << std::endl;
    std::cout << std::endl;
    std::cout << "Build options:" << std::endl;
    std::cout << "  TLS:    " << (StratumClient::isTlsSupported() ? "enabled" : "disabled") << std::endl;
}

}  // namespace sminer
