//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registries.h
// Purpose: Handler interface, handler definitions and the tool/resource/prompt registries
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "flymcp/Cancellation.h"
#include "flymcp/JSONRPCTypes.h"
#include "flymcp/Progress.h"

namespace flymcp {

//==========================================================================================================
// ToolHandler
// Purpose: Executes one call. Used for tools, resources and prompts alike.
// Args:
//   params: Tool arguments, or the full request params for resources and prompts.
//   cancelToken: Cooperative cancellation signal for this call.
//   progress: Progress sink for this call (no-op when the peer sent no token).
// Returns:
//   The raw result; the server converts it to the wire shape of the method.
// Throws:
//   Anything; the server converts exceptions to wire errors.
//==========================================================================================================
class ToolHandler {
public:
    virtual ~ToolHandler() = default;
    virtual JSONValue Handle(const JSONValue& params,
                             const CancellationToken& cancelToken,
                             const ProgressNotifier& progress) = 0;
};

using ToolHandlerFn = std::function<JSONValue(const JSONValue&, const CancellationToken&, const ProgressNotifier&)>;

// Adapts a callable to ToolHandler
std::shared_ptr<ToolHandler> MakeToolHandler(ToolHandlerFn fn);

//==========================================================================================================
// HandlerDefinition
// Purpose: Registration record for a tool, resource (name is the URI) or prompt.
// Fields:
//   paramsSchema / resultSchema: Listed as inputSchema / outputSchema; enforced by the server.
//   timeout / maxConcurrency: Per-handler defaults, overridden by ServerConfig per-tool entries.
//   mimeType: Resources only.
//==========================================================================================================
struct HandlerDefinition {
    std::string name;
    std::string description;
    std::optional<JSONValue> paramsSchema;
    std::optional<JSONValue> resultSchema;
    bool readOnly = false;
    bool writesToDisk = false;
    bool requiresConfirmation = false;
    bool idempotent = false;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::size_t> maxConcurrency;
    std::optional<std::string> mimeType;
    std::shared_ptr<ToolHandler> handler;
};

//==========================================================================================================
// HandlerRegistry
// Purpose: Name-keyed store of definitions. Register before Start(); read concurrently afterwards.
//==========================================================================================================
class HandlerRegistry {
public:
    virtual ~HandlerRegistry() = default;

    // Replaces any existing definition with the same name
    void Register(HandlerDefinition definition);

    // Wire summaries ordered by name; false flags and absent optionals omitted
    JSONValue List() const;

    std::shared_ptr<const HandlerDefinition> Get(const std::string& name) const;
    bool Contains(const std::string& name) const;
    std::size_t Size() const;

    //======================================================================================================
    // Call
    // Purpose: Invokes the handler directly, without admission, limits or timeouts.
    // Throws:
    //   The registry's not-found error for unknown names; otherwise whatever the handler throws.
    //======================================================================================================
    JSONValue Call(const std::string& name, const JSONValue& params,
                   std::shared_ptr<CancellationToken> cancelToken = nullptr,
                   const ProgressNotifier& progress = ProgressNotifier()) const;

    [[noreturn]] virtual void ThrowNotFound(const std::string& name) const = 0;

protected:
    virtual JSONValue describe(const HandlerDefinition& def) const = 0;

private:
    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<const HandlerDefinition>> definitions;
};

class ToolRegistry final : public HandlerRegistry {
public:
    [[noreturn]] void ThrowNotFound(const std::string& name) const override;
protected:
    JSONValue describe(const HandlerDefinition& def) const override;
};

class ResourceRegistry final : public HandlerRegistry {
public:
    [[noreturn]] void ThrowNotFound(const std::string& uri) const override;
protected:
    JSONValue describe(const HandlerDefinition& def) const override;
};

class PromptRegistry final : public HandlerRegistry {
public:
    [[noreturn]] void ThrowNotFound(const std::string& name) const override;
protected:
    JSONValue describe(const HandlerDefinition& def) const override;
};

} // namespace flymcp
