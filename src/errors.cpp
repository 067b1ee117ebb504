#include "trovi/core/errors.hpp"

namespace trovi {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotWritable: return "NotWritable";
        case ErrorCode::NotSeekable: return "NotSeekable";
        case ErrorCode::AlreadyClosed: return "AlreadyClosed";
        case ErrorCode::TooManySegments: return "TooManySegments";
        case ErrorCode::ContentNotFound: return "ContentNotFound";
        case ErrorCode::NoAccessMethod: return "NoAccessMethod";
        case ErrorCode::SourceReadError: return "SourceReadError";
        case ErrorCode::DestinationWriteError: return "DestinationWriteError";
        case ErrorCode::EmptySource: return "EmptySource";
        case ErrorCode::UnknownBackend: return "UnknownBackend";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::InvalidUrn: return "InvalidUrn";
        case ErrorCode::RemoteError: return "RemoteError";
    }
    return "Unknown";
}

}  // namespace trovi
