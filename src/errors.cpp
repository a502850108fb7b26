#include "errors.h"

namespace capsulerun {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::CAPACITY:   return "capacity";
        case ErrorKind::TRANSPORT:  return "transport";
        case ErrorKind::TIMEOUT:    return "timeout";
        case ErrorKind::EXECUTION:  return "execution";
        case ErrorKind::GENERATION: return "generation";
        case ErrorKind::CANCELLED:  return "cancelled";
        case ErrorKind::INTERNAL:   return "internal";
    }
    return "internal";
}

ErrorKind error_kind_from_string(const std::string& name) {
    if (name == "validation") return ErrorKind::VALIDATION;
    if (name == "capacity")   return ErrorKind::CAPACITY;
    if (name == "transport")  return ErrorKind::TRANSPORT;
    if (name == "timeout")    return ErrorKind::TIMEOUT;
    if (name == "execution")  return ErrorKind::EXECUTION;
    if (name == "generation") return ErrorKind::GENERATION;
    if (name == "cancelled")  return ErrorKind::CANCELLED;
    return ErrorKind::INTERNAL;
}

std::string admission_code_to_string(AdmissionCode code) {
    switch (code) {
        case AdmissionCode::NONE:             return "";
        case AdmissionCode::VALIDATION_ERROR: return "VALIDATION_ERROR";
        case AdmissionCode::CIRCUIT_OPEN:     return "CIRCUIT_OPEN";
        case AdmissionCode::QUEUE_FULL:       return "QUEUE_FULL";
        case AdmissionCode::QUOTA_EXCEEDED:   return "QUOTA_EXCEEDED";
        case AdmissionCode::INTERNAL_ERROR:   return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

} // namespace capsulerun
