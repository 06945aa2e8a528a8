// d2m/cpp/include/d2m/validator.h
#pragma once
#include <string>
#include <vector>

#include "d2m/ir.h"

namespace d2m {

struct ValidationResult {
    bool ok{false};
    std::vector<std::string> errors;
};

// Structural checks on extractor output. Anything reported here is malformed IR.
ValidationResult validate_blocks(const std::vector<Block>& blocks);

} // namespace d2m
