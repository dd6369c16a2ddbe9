#include "agentlink/status.hpp"

namespace agentlink {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                 return "None";
        case ErrorCode::ClientNotInitialized: return "ClientNotInitialized";
        case ErrorCode::MalformedMemo:        return "MalformedMemo";
        case ErrorCode::TopicCreationFailed:  return "TopicCreationFailed";
        case ErrorCode::SubmissionFailed:     return "SubmissionFailed";
        case ErrorCode::NotReady:             return "NotReady";
        case ErrorCode::InvalidArgument:      return "InvalidArgument";
        case ErrorCode::Internal:             return "Internal";
        default:                              return "Unknown";
    }
}

std::string Status::to_string() const {
    if (ok()) return "OK";
    if (message.empty()) return error_code_name(code);
    return std::string(error_code_name(code)) + ": " + message;
}

} // namespace agentlink
