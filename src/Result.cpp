/**
 * Result.cpp - Result construction and error kind mapping
 */

#include "ut/Result.hpp"

namespace ut {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "None";
        case ErrorKind::Validation:       return "ValidationError";
        case ErrorKind::Unrecognized:     return "ResolutionError.Unrecognized";
        case ErrorKind::Unavailable:      return "ResolutionError.Unavailable";
        case ErrorKind::NotFound:         return "HandlerError.NotFound";
        case ErrorKind::PermissionDenied: return "HandlerError.PermissionDenied";
        case ErrorKind::InvalidArgument:  return "HandlerError.InvalidArgument";
        case ErrorKind::Timeout:          return "HandlerError.Timeout";
        case ErrorKind::Transport:        return "TransportError";
        case ErrorKind::Cancelled:        return "Cancelled";
        case ErrorKind::CommandFailed:    return "CommandFailed";
        case ErrorKind::Internal:         return "InternalError";
    }
    return "Unknown";
}

int exitStatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return 0;
        case ErrorKind::NotFound:         return 1;
        case ErrorKind::CommandFailed:    return 1;
        case ErrorKind::Validation:       return 2;
        case ErrorKind::InvalidArgument:  return 2;
        case ErrorKind::Unavailable:      return 69;
        case ErrorKind::Transport:        return 69;
        case ErrorKind::Internal:         return 70;
        case ErrorKind::Timeout:          return 124;
        case ErrorKind::PermissionDenied: return 126;
        case ErrorKind::Unrecognized:     return 127;
        case ErrorKind::Cancelled:        return 130;
    }
    return 1;
}

Result Result::success(const std::string& out) {
    Result result;
    result.stdout_text = out;
    return result;
}

Result Result::failure(ErrorKind kind, const std::string& message) {
    Result result;
    result.error = kind == ErrorKind::None ? ErrorKind::Internal : kind;
    result.exit_status = exitStatusFor(result.error);
    result.stderr_text = message.empty() ? toString(result.error) : message;
    return result;
}

Result Result::failure(ErrorKind kind, int exit_status, const std::string& out, const std::string& err) {
    Result result = failure(kind, err);
    if (exit_status != 0) {
        result.exit_status = exit_status;
    }
    result.stdout_text = out;
    return result;
}

Result Result::changeDirectory(const std::string& new_cwd) {
    Result result;
    result.cwd_change = new_cwd;
    return result;
}

Result Result::withControl(Control control) {
    Result result;
    result.control = control;
    return result;
}

} // namespace ut
