/**
 * SMiner - Work Source Defaults
 */

#include "WorkSource.h"
#include "Worker.h"
#include <iomanip>
#include <sstream>

namespace sminer {

void WorkSource::reportRateChanged(Worker& worker, double hashesPerSecond) {
    std::ostringstream ss;
    ss << worker.getName() << ": " << std::fixed << std::setprecision(2)
       << hashesPerSecond / 1e6 << " MH/s";
    Log::info(ss.str());
}

void WorkSource::reportEvent(LogLevel severity, const std::string& category,
                             const std::string& message, Worker& worker) {
    (void)severity;
    Log::debug(worker.getName() + " [" + category + "] " + message);
}

void WorkSource::reportLog(Worker& worker, const std::string& message,
                           LogLevel level, unsigned flags) {
    (void)flags;
    Log::log(level, worker.getName() + ": " + message);
}

}  // namespace sminer
