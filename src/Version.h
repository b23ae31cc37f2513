/**
 * SMiner - Version Information
 */

#pragma once

#include <string>

namespace sminer {

// Version components
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 2;
constexpr int VERSION_PATCH = 0;

// Version string for display
constexpr const char* VERSION_STRING = "0.2.0";

// Full version with name for Stratum
constexpr const char* MINER_VERSION = "sminer/0.2.0";

// Get version with optional build info
inline std::string getVersionString() {
    std::string version = "SMiner v" + std::string(VERSION_STRING);
#ifdef WITH_TLS
    version += " +TLS";
#endif
    return version;
}

}  // namespace sminer
