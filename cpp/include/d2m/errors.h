#pragma once
#include <stdexcept>
#include <string>

namespace d2m {

enum class ErrorCode {
    Ok = 0,
    IoError,
    ParseError,
    InvalidFormat,
    InvalidArgs,
    MalformedIr,
    DuplicateSource,
    NameExhausted,
    RegistrySealed,
    Cancelled,
};

const char* error_code_name(ErrorCode c);

class D2MException : public std::runtime_error {
public:
    D2MException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace d2m
