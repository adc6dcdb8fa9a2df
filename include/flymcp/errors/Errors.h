//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Server exception taxonomy, wire error structure and the exception -> JSON-RPC error mapping
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "flymcp/JSONRPCTypes.h"

namespace flymcp {
namespace errors {

// Categorization of the JSON-RPC and application error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpCanceled,
    McpTimeout,
    McpPermissionDenied,
    McpNotFound,
    Unknown
};

// Typed error representation sent on the wire.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

///////////////////////////////////////// Exception taxonomy ///////////////////////////////////////////

//==========================================================================================================
// ServerError
// Purpose: Base of every exception the dispatch pipeline knows how to map to a specific wire code.
//==========================================================================================================
class ServerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ToolNotFoundError : public ServerError {
public:
    explicit ToolNotFoundError(std::string tool)
        : ServerError("Tool not found: " + tool), toolName(std::move(tool)) {}
    std::string toolName;
};

class ResourceNotFoundError : public ServerError {
public:
    explicit ResourceNotFoundError(std::string resourceUri)
        : ServerError("Resource not found: " + resourceUri), uri(std::move(resourceUri)) {}
    std::string uri;
};

class PromptNotFoundError : public ServerError {
public:
    explicit PromptNotFoundError(std::string id)
        : ServerError("Prompt not found: " + id), promptId(std::move(id)) {}
    std::string promptId;
};

class MethodNotFoundError : public ServerError {
public:
    explicit MethodNotFoundError(std::string name)
        : ServerError("Method not found: " + name), method(std::move(name)) {}
    std::string method;
};

// Field path -> messages (e.g. "arguments.message" -> {"expected string"})
using FieldErrors = std::map<std::string, std::vector<std::string>>;

class ValidationError : public ServerError {
public:
    ValidationError(const std::string& message, FieldErrors errors = {})
        : ServerError(message), fieldErrors(std::move(errors)) {}
    FieldErrors fieldErrors;
};

class InvalidParamsError : public ServerError {
public:
    InvalidParamsError(const std::string& message,
                       std::vector<std::string> missing = {},
                       std::vector<std::string> invalid = {})
        : ServerError(message), missingFields(std::move(missing)), invalidFields(std::move(invalid)) {}
    std::vector<std::string> missingFields;
    std::vector<std::string> invalidFields;
};

//==========================================================================================================
// CancellationError
// Purpose: Raised when a call observes its cancellation token. The request id is known only when the
//          pipeline raises it; handler code calling ThrowIfCancelled() leaves it empty.
//==========================================================================================================
class CancellationError : public ServerError {
public:
    explicit CancellationError(std::optional<JSONRPCId> id = std::nullopt);
    std::optional<JSONRPCId> requestId;
};

class TimeoutError : public ServerError {
public:
    TimeoutError(std::chrono::milliseconds limit, std::optional<std::string> operationName = std::nullopt);
    std::chrono::milliseconds timeout;
    std::optional<std::string> operation;
};

class ConcurrencyLimitError : public ServerError {
public:
    ConcurrencyLimitError(std::string tool, std::size_t currentCount, std::size_t limitCount);
    std::string toolName;
    std::size_t current;
    std::size_t limit;
};

class PermissionDeniedError : public ServerError {
public:
    explicit PermissionDeniedError(const std::string& message, std::optional<std::string> why = std::nullopt)
        : ServerError(message), reason(std::move(why)) {}
    std::optional<std::string> reason;
};

class InternalServerError : public ServerError {
public:
    using ServerError::ServerError;
};

///////////////////////////////////////// Conversion ///////////////////////////////////////////

//==========================================================================================================
// ToWireError
// Purpose: Maps any exception to the JSON-RPC error object sent to the peer.
// Args:
//   error: The caught exception (or exception_ptr for throws not derived from std::exception).
//   requestId: When supplied, merged into data.requestId.
// Returns:
//   McpError with code/message/data per the taxonomy; unknown errors become InternalError with the
//   message "Internal server error: <what>". Never throws.
//==========================================================================================================
McpError ToWireError(const std::exception& error, const std::optional<JSONRPCId>& requestId = std::nullopt);
McpError ToWireError(std::exception_ptr error, const std::optional<JSONRPCId>& requestId = std::nullopt);

// True for the ServerError hierarchy only.
bool IsKnownError(const std::exception& error);

///////////////////////////////////////// Wire helpers ///////////////////////////////////////////

// Map a JSON-RPC/application numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::Canceled: return ErrorCategory::McpCanceled;
        case JSONRPCErrorCodes::Timeout: return ErrorCategory::McpTimeout;
        case JSONRPCErrorCodes::PermissionDenied: return ErrorCategory::McpPermissionDenied;
        case JSONRPCErrorCodes::NotFound: return ErrorCategory::McpNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace flymcp
