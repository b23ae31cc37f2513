/**
 * SMiner - Worker Faults
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sminer {

/**
 * Fault classification
 *
 * Every fault tears down the dispatch cycle; the kind only changes how
 * the fault is logged.
 */
enum class FaultKind {
    Protocol,           // Spurious or malformed device message
    Timeout,            // No acknowledgement / validation result in time
    DeviceCorrectness,  // Device returned a wrong result
    Transport           // Channel could not be opened, read or written
};

inline const char* faultKindName(FaultKind kind) {
    switch (kind) {
        case FaultKind::Protocol:          return "protocol fault";
        case FaultKind::Timeout:           return "timeout";
        case FaultKind::DeviceCorrectness: return "device correctness fault";
        case FaultKind::Transport:         return "transport fault";
        default:                           return "fault";
    }
}

/**
 * Fault value carried between the listener and the dispatcher
 */
struct WorkerFault {
    FaultKind kind;
    std::string message;

    WorkerFault() : kind(FaultKind::Protocol) {}
    WorkerFault(FaultKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    std::string describe() const {
        return std::string(faultKindName(kind)) + ": " + message;
    }
};

/**
 * Exception raised inside the dispatcher thread
 */
class WorkerError : public std::runtime_error {
public:
    explicit WorkerError(const WorkerFault& fault)
        : std::runtime_error(fault.describe())
        , m_fault(fault)
    {}

    WorkerError(FaultKind kind, const std::string& message)
        : WorkerError(WorkerFault(kind, message))
    {}

    const WorkerFault& fault() const { return m_fault; }
    FaultKind kind() const { return m_fault.kind; }

private:
    WorkerFault m_fault;
};

}  // namespace sminer
