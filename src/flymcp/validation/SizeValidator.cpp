//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SizeValidator.cpp
// Purpose: SizeValidator implementation
//==========================================================================================================

#include <format>

#include "flymcp/errors/Errors.h"
#include "flymcp/validation/SizeValidator.h"

namespace flymcp {
namespace validation {

std::size_t SizeValidator::EncodedSize(const JSONValue& value) {
    return SerializeJSON(value).size();
}

void SizeValidator::validateValueSize(const JSONValue& value, std::size_t limit, const std::string& name) const {
    const std::size_t size = EncodedSize(value);
    if (size > limit) {
        throw errors::InvalidParamsError(
            std::format("{} exceeds maximum size: {} bytes > {} bytes", name, size, limit), {}, {name});
    }
}

void SizeValidator::ValidateParameters(const JSONValue& params) const {
    validateValueSize(params, limits.maxParameterSize, "parameters");
}

void SizeValidator::ValidateResult(const JSONValue& result) const {
    validateValueSize(result, limits.maxResultSize, "result");
}

void SizeValidator::ValidateResourceContent(const std::string& content) const {
    if (content.size() > limits.maxResourceSize) {
        throw errors::InvalidParamsError(
            std::format("Resource content exceeds maximum size: {} bytes > {} bytes", content.size(), limits.maxResourceSize),
            {}, {"content"});
    }
}

void SizeValidator::ValidateMessage(const JSONValue& message) const {
    validateValueSize(message, limits.maxMessageSize, "message");
}

} // namespace validation
} // namespace flymcp
