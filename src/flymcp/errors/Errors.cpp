//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Exception message construction and exception -> JSON-RPC error conversion
//==========================================================================================================

#include <format>

#include "flymcp/errors/Errors.h"
#include "logging/Logger.h"

namespace flymcp {
namespace errors {

namespace {
std::string cancellationMessage(const std::optional<JSONRPCId>& id) {
    if (!id.has_value()) {
        return "Operation was cancelled";
    }
    return "Request cancelled: " + IdToString(id.value());
}

std::string timeoutMessage(std::chrono::milliseconds limit, const std::optional<std::string>& operation) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(limit).count();
    if (operation.has_value()) {
        return std::format("Operation ({}) timed out after {}s", operation.value(), secs);
    }
    return std::format("Operation timed out after {}s", secs);
}

McpError makeWire(int code, const std::string& message, JSONValue data,
                  const std::optional<JSONRPCId>& requestId) {
    if (requestId.has_value()) {
        data.set("requestId", IdToJSON(requestId.value()));
    }
    McpError e;
    e.code = code;
    e.message = message;
    e.category = errorCategoryFromCode(code);
    if (data.isObject()) {
        e.data = std::move(data);
    }
    return e;
}

JSONValue fieldErrorsToJSON(const FieldErrors& fieldErrors) {
    JSONValue out{JSONValue::Object{}};
    for (const auto& [field, messages] : fieldErrors) {
        out.set(field, MakeStringArray(messages));
    }
    return out;
}
} // namespace

CancellationError::CancellationError(std::optional<JSONRPCId> id)
    : ServerError(cancellationMessage(id)), requestId(std::move(id)) {}

TimeoutError::TimeoutError(std::chrono::milliseconds limit, std::optional<std::string> operationName)
    : ServerError(timeoutMessage(limit, operationName)), timeout(limit), operation(std::move(operationName)) {}

ConcurrencyLimitError::ConcurrencyLimitError(std::string tool, std::size_t currentCount, std::size_t limitCount)
    : ServerError(std::format("Maximum concurrency reached for tool: {} (current: {}, limit: {})",
                              tool, currentCount, limitCount)),
      toolName(std::move(tool)), current(currentCount), limit(limitCount) {}

McpError ToWireError(const std::exception& error, const std::optional<JSONRPCId>& requestId) {
    JSONValue data{JSONValue::Object{}};

    if (auto* e = dynamic_cast<const ToolNotFoundError*>(&error)) {
        data.set("tool", JSONValue(e->toolName));
        return makeWire(JSONRPCErrorCodes::NotFound, e->what(), std::move(data), requestId);
    }
    if (auto* e = dynamic_cast<const ResourceNotFoundError*>(&error)) {
        data.set("uri", JSONValue(e->uri));
        return makeWire(JSONRPCErrorCodes::NotFound, e->what(), std::move(data), requestId);
    }
    if (auto* e = dynamic_cast<const PromptNotFoundError*>(&error)) {
        data.set("promptId", JSONValue(e->promptId));
        return makeWire(JSONRPCErrorCodes::NotFound, e->what(), std::move(data), requestId);
    }
    if (auto* e = dynamic_cast<const MethodNotFoundError*>(&error)) {
        data.set("method", JSONValue(e->method));
        return makeWire(JSONRPCErrorCodes::MethodNotFound, e->what(), std::move(data), requestId);
    }
    if (auto* e = dynamic_cast<const ValidationError*>(&error)) {
        if (!e->fieldErrors.empty()) {
            data.set("fieldErrors", fieldErrorsToJSON(e->fieldErrors));
        }
        return makeWire(JSONRPCErrorCodes::InvalidParams, e->what(), std::move(data), requestId);
    }
    if (auto* e = dynamic_cast<const InvalidParamsError*>(&error)) {
        if (!e->missingFields.empty()) {
            data.set("missingFields", MakeStringArray(e->missingFields));
        }
        if (!e->invalidFields.empty()) {
            data.set("invalidFields", MakeStringArray(e->invalidFields));
        }
        return makeWire(JSONRPCErrorCodes::InvalidParams, e->what(), std::move(data), requestId);
    }
    if (auto* e = dynamic_cast<const CancellationError*>(&error)) {
        // The pipeline's id wins over the one captured at throw time
        std::optional<JSONRPCId> id = requestId.has_value() ? requestId : e->requestId;
        return makeWire(JSONRPCErrorCodes::Canceled, e->what(), std::move(data), id);
    }
    if (auto* e = dynamic_cast<const TimeoutError*>(&error)) {
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(e->timeout).count();
        data.set("timeout", JSONValue(static_cast<int64_t>(secs)));
        if (e->operation.has_value()) {
            data.set("operation", JSONValue(e->operation.value()));
        }
        return makeWire(JSONRPCErrorCodes::Timeout, e->what(), std::move(data), requestId);
    }
    if (auto* e = dynamic_cast<const ConcurrencyLimitError*>(&error)) {
        data.set("tool", JSONValue(e->toolName));
        data.set("current", JSONValue(static_cast<int64_t>(e->current)));
        data.set("limit", JSONValue(static_cast<int64_t>(e->limit)));
        return makeWire(JSONRPCErrorCodes::PermissionDenied, e->what(), std::move(data), requestId);
    }
    if (auto* e = dynamic_cast<const PermissionDeniedError*>(&error)) {
        if (e->reason.has_value()) {
            data.set("reason", JSONValue(e->reason.value()));
        }
        return makeWire(JSONRPCErrorCodes::PermissionDenied, e->what(), std::move(data), requestId);
    }
    if (auto* e = dynamic_cast<const InternalServerError*>(&error)) {
        data.set("error", JSONValue(std::string(e->what())));
        return makeWire(JSONRPCErrorCodes::InternalError, e->what(), std::move(data), requestId);
    }

    const std::string what = error.what();
    data.set("error", JSONValue(what));
    return makeWire(JSONRPCErrorCodes::InternalError, "Internal server error: " + what, std::move(data), requestId);
}

McpError ToWireError(std::exception_ptr error, const std::optional<JSONRPCId>& requestId) {
    try {
        if (error) {
            std::rethrow_exception(error);
        }
    } catch (const std::exception& e) {
        return ToWireError(e, requestId);
    } catch (...) {
        LOG_ERROR("Non-standard exception escaped a handler");
        JSONValue data{JSONValue::Object{}};
        data.set("error", JSONValue("unknown exception"));
        return makeWire(JSONRPCErrorCodes::InternalError, "Internal server error: unknown exception",
                        std::move(data), requestId);
    }
    JSONValue data{JSONValue::Object{}};
    data.set("error", JSONValue("no exception"));
    return makeWire(JSONRPCErrorCodes::InternalError, "Internal server error: no exception", std::move(data), requestId);
}

bool IsKnownError(const std::exception& error) {
    return dynamic_cast<const ServerError*>(&error) != nullptr;
}

} // namespace errors
} // namespace flymcp
