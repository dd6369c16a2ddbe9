#pragma once

#include <string>
#include <stdexcept>

namespace agentlink {

enum class ErrorCode {
    None,
    ClientNotInitialized,   // no ledger credentials / client configured
    MalformedMemo,          // memo failed to decode or encode
    TopicCreationFailed,    // ledger rejected a topic creation
    SubmissionFailed,       // ledger rejected a message submission
    NotReady,               // agent topics not initialized yet
    InvalidArgument,
    Internal
};

const char* error_code_name(ErrorCode code);

struct Status {
    ErrorCode code = ErrorCode::None;
    std::string message;

    bool ok() const { return code == ErrorCode::None; }

    static Status success() { return Status{}; }
    static Status failure(ErrorCode code, const std::string& message) {
        return Status{code, message};
    }

    // "TopicCreationFailed: INVALID_SIGNATURE"
    std::string to_string() const;
};

// Base for the exceptions thrown by the codecs; carries the protocol error code.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace agentlink
