#pragma once

#include <stdexcept>
#include <string>

namespace trovi {

enum class ErrorCode {
    // Backend contract violations
    NotWritable,
    NotSeekable,
    AlreadyClosed,
    TooManySegments,
    ContentNotFound,
    NoAccessMethod,
    // Migration failures
    SourceReadError,
    DestinationWriteError,
    EmptySource,
    // Request validation
    UnknownBackend,
    Conflict,
    InvalidUrn,
    // Remote service failure (HTTP status or network error)
    RemoteError,
};

const char* error_code_name(ErrorCode code);

/// Base class for every error raised by the storage and migration layers.
class TroviError : public std::runtime_error {
public:
    TroviError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class NotWritable : public TroviError {
public:
    explicit NotWritable(const std::string& message)
        : TroviError(ErrorCode::NotWritable, message) {}
};

class NotSeekable : public TroviError {
public:
    explicit NotSeekable(const std::string& message)
        : TroviError(ErrorCode::NotSeekable, message) {}
};

class AlreadyClosed : public TroviError {
public:
    explicit AlreadyClosed(const std::string& message)
        : TroviError(ErrorCode::AlreadyClosed, message) {}
};

class TooManySegments : public TroviError {
public:
    explicit TooManySegments(const std::string& message)
        : TroviError(ErrorCode::TooManySegments, message) {}
};

class ContentNotFound : public TroviError {
public:
    explicit ContentNotFound(const std::string& message)
        : TroviError(ErrorCode::ContentNotFound, message) {}
};

class NoAccessMethod : public TroviError {
public:
    explicit NoAccessMethod(const std::string& message)
        : TroviError(ErrorCode::NoAccessMethod, message) {}
};

class SourceReadError : public TroviError {
public:
    explicit SourceReadError(const std::string& message)
        : TroviError(ErrorCode::SourceReadError, message) {}
};

class DestinationWriteError : public TroviError {
public:
    explicit DestinationWriteError(const std::string& message)
        : TroviError(ErrorCode::DestinationWriteError, message) {}
};

class EmptySource : public TroviError {
public:
    explicit EmptySource(const std::string& message)
        : TroviError(ErrorCode::EmptySource, message) {}
};

class UnknownBackend : public TroviError {
public:
    explicit UnknownBackend(const std::string& message)
        : TroviError(ErrorCode::UnknownBackend, message) {}
};

class Conflict : public TroviError {
public:
    explicit Conflict(const std::string& message)
        : TroviError(ErrorCode::Conflict, message) {}
};

class InvalidUrn : public TroviError {
public:
    explicit InvalidUrn(const std::string& message)
        : TroviError(ErrorCode::InvalidUrn, message) {}
};

/// A remote service answered with a non-2xx status or could not be reached.
/// status() is 0 for network-level failures.
class RemoteError : public TroviError {
public:
    RemoteError(const std::string& message, int status)
        : TroviError(ErrorCode::RemoteError, message), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

}  // namespace trovi
