/**
 * Result.hpp - Structured command results, history entries and error kinds
 */

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace ut {

enum class ErrorKind {
    None,
    Validation,
    Unrecognized,     // resolution: reply is not a known command
    Unavailable,      // resolution: external resolver timed out or unreachable
    NotFound,
    PermissionDenied,
    InvalidArgument,
    Timeout,
    Transport,
    Cancelled,
    CommandFailed,    // spawned utility exited nonzero
    Internal
};

// Front-end requests carried by a Result; the core never renders UI itself
enum class Control {
    None,
    ClearScreen,
    Exit
};

const char* toString(ErrorKind kind);
int exitStatusFor(ErrorKind kind);

struct Result {
    std::string stdout_text;
    std::string stderr_text;
    int exit_status = 0;
    std::optional<std::string> cwd_change;
    ErrorKind error = ErrorKind::None;
    Control control = Control::None;

    bool ok() const { return exit_status == 0; }

    static Result success(const std::string& out = "");
    static Result failure(ErrorKind kind, const std::string& message);
    static Result failure(ErrorKind kind, int exit_status, const std::string& out, const std::string& err);
    static Result changeDirectory(const std::string& new_cwd);
    static Result withControl(Control control);
};

struct HistoryEntry {
    std::string raw_input;
    std::string resolved_command;
    std::chrono::system_clock::time_point timestamp;
    Result result;
};

// Base of every error the engine converts into a Result
class UtError : public std::runtime_error {
public:
    UtError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public UtError {
public:
    explicit ValidationError(const std::string& message)
        : UtError(ErrorKind::Validation, message) {}
};

class ResolutionError : public UtError {
public:
    ResolutionError(ErrorKind kind, const std::string& message)
        : UtError(kind, message) {}
};

class HandlerError : public UtError {
public:
    HandlerError(ErrorKind kind, const std::string& message)
        : UtError(kind, message) {}
};

class TransportError : public UtError {
public:
    explicit TransportError(const std::string& message)
        : UtError(ErrorKind::Transport, message) {}
};

} // namespace ut
