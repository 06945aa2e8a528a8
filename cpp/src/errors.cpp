#include "d2m/errors.h"

namespace d2m {

const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok:              return "ok";
        case ErrorCode::IoError:         return "io_error";
        case ErrorCode::ParseError:      return "parse_error";
        case ErrorCode::InvalidFormat:   return "invalid_format";
        case ErrorCode::InvalidArgs:     return "invalid_args";
        case ErrorCode::MalformedIr:     return "malformed_ir";
        case ErrorCode::DuplicateSource: return "duplicate_source";
        case ErrorCode::NameExhausted:   return "name_exhausted";
        case ErrorCode::RegistrySealed:  return "registry_sealed";
        case ErrorCode::Cancelled:       return "cancelled";
    }
    return "unknown";
}

} // namespace d2m
