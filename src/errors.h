#pragma once

#include <string>
#include <stdexcept>

namespace capsulerun {

// Error taxonomy carried on failed jobs and admission rejections
enum class ErrorKind {
    VALIDATION,     // Bad input, never retried
    CAPACITY,       // Circuit open / queue full / quota, retry after backoff
    TRANSPORT,      // Sandbox or generation service unreachable or malformed
    TIMEOUT,        // Caller stopped waiting; the job itself may still finish
    EXECUTION,      // User code failed inside the sandbox
    GENERATION,     // Generation engine reported failure
    CANCELLED,      // Cancel flag observed before the job ran
    INTERNAL        // Unexpected exception inside the pipeline
};

std::string error_kind_to_string(ErrorKind kind);
ErrorKind error_kind_from_string(const std::string& name);

// Machine-readable codes returned by admission
enum class AdmissionCode {
    NONE,
    VALIDATION_ERROR,
    CIRCUIT_OPEN,
    QUEUE_FULL,
    QUOTA_EXCEEDED,
    INTERNAL_ERROR
};

std::string admission_code_to_string(AdmissionCode code);

// Raised by key-value store backends on connectivity or protocol failures
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised when a stored record cannot be decoded
class CorruptRecordError : public std::runtime_error {
public:
    CorruptRecordError(const std::string& key, const std::string& detail)
        : std::runtime_error("Corrupt record at " + key + ": " + detail), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace capsulerun
