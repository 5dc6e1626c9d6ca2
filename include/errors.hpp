#pragma once

#include <stdexcept>
#include <string>

namespace roto {

enum class ErrorKind {
    Configuration,      // startup-fatal
    Permanent,          // retrying cannot help, dead-letter quickly
    Transient,          // retried with backoff inside the attempt
    ResourceExhausted,  // memory / device memory
    Timeout,            // job exceeded its wall-clock budget
    Processing          // attempt failed, queue redelivery decides
};

class WorkerError : public std::runtime_error {
public:
    WorkerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    bool is_permanent() const { return kind_ == ErrorKind::Permanent; }

private:
    ErrorKind kind_;
};

class ConfigError : public WorkerError {
public:
    explicit ConfigError(const std::string& message)
        : WorkerError(ErrorKind::Configuration, message) {}
};

class PermanentJobError : public WorkerError {
public:
    explicit PermanentJobError(const std::string& message)
        : WorkerError(ErrorKind::Permanent, message) {}
};

// Unknown effect id, missing object.
class NotFoundError : public PermanentJobError {
public:
    explicit NotFoundError(const std::string& message) : PermanentJobError(message) {}
};

class ValidationError : public PermanentJobError {
public:
    explicit ValidationError(const std::string& message) : PermanentJobError(message) {}
};

class CorruptMediaError : public PermanentJobError {
public:
    explicit CorruptMediaError(const std::string& message) : PermanentJobError(message) {}
};

class TransientError : public WorkerError {
public:
    explicit TransientError(const std::string& message)
        : WorkerError(ErrorKind::Transient, message) {}
};

class ResourceExhaustedError : public WorkerError {
public:
    explicit ResourceExhaustedError(const std::string& message)
        : WorkerError(ErrorKind::ResourceExhausted, message) {}
};

class JobTimeoutError : public WorkerError {
public:
    explicit JobTimeoutError(const std::string& message)
        : WorkerError(ErrorKind::Timeout, message) {}
};

// Attempt failed for a reason a later delivery may not hit.
class ProcessingError : public WorkerError {
public:
    explicit ProcessingError(const std::string& message)
        : WorkerError(ErrorKind::Processing, message) {}
};

class MediaEncodeError : public ProcessingError {
public:
    explicit MediaEncodeError(const std::string& message) : ProcessingError(message) {}
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Permanent: return "permanent";
        case ErrorKind::Transient: return "transient";
        case ErrorKind::ResourceExhausted: return "resource-exhausted";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Processing: return "processing";
    }
    return "unknown";
}

} // namespace roto
