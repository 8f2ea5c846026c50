#include "errors.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest: return "BadRequest";
        case ErrorKind::AnalysisRejected: return "AnalysisRejected";
        case ErrorKind::NoEligibleWorker: return "NoEligibleWorker";
        case ErrorKind::WorkerNotFound: return "WorkerNotFound";
        case ErrorKind::DispatchConnectionError: return "DispatchConnectionError";
        case ErrorKind::DispatchTimeout: return "DispatchTimeout";
        case ErrorKind::RemoteNonZeroExit: return "RemoteNonZeroExit";
        case ErrorKind::RemoteError: return "RemoteError";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::JobNotFound: return "JobNotFound";
        case ErrorKind::InvalidTransition: return "InvalidTransition";
    }
    return "Unknown";
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest: return 400;
        case ErrorKind::JobNotFound:
        case ErrorKind::WorkerNotFound: return 404;
        case ErrorKind::InvalidTransition: return 409;
        case ErrorKind::AnalysisRejected: return 422;
        case ErrorKind::NoEligibleWorker: return 503;
        case ErrorKind::DispatchTimeout: return 504;
        case ErrorKind::DispatchConnectionError:
        case ErrorKind::RemoteNonZeroExit:
        case ErrorKind::RemoteError:
        case ErrorKind::Cancelled: return 502;
    }
    return 500;
}
