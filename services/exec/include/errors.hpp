#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    BadRequest,
    AnalysisRejected,
    NoEligibleWorker,
    WorkerNotFound,
    DispatchConnectionError,
    DispatchTimeout,
    RemoteNonZeroExit,
    RemoteError,
    Cancelled,
    JobNotFound,
    InvalidTransition
};

const char* to_string(ErrorKind kind);
int http_status_for(ErrorKind kind);

// Raised inside the HTTP layer only; components report through return values.
class ExecError : public std::runtime_error {
public:
    ExecError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
