//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SizeValidator.h
// Purpose: Byte-size admission for params, results, resource content and messages
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>

#include "flymcp/JSONRPCTypes.h"
#include "flymcp/ServerConfig.h"

namespace flymcp {
namespace validation {

//==========================================================================================================
// SizeValidator
// Purpose: Measures the compact JSON encoding (or raw UTF-8 for resource text) against the limits.
// Throws:
//   errors::InvalidParamsError with invalidFields naming the checked item, e.g.
//   "parameters exceeds maximum size: 2048 bytes > 1024 bytes".
//==========================================================================================================
class SizeValidator {
public:
    explicit SizeValidator(SizeLimitsConfig limits) : limits(limits) {}

    void ValidateParameters(const JSONValue& params) const;
    void ValidateResult(const JSONValue& result) const;
    void ValidateResourceContent(const std::string& content) const;
    void ValidateMessage(const JSONValue& message) const;

    static std::size_t EncodedSize(const JSONValue& value);

private:
    void validateValueSize(const JSONValue& value, std::size_t limit, const std::string& name) const;

    SizeLimitsConfig limits;
};

} // namespace validation
} // namespace flymcp
