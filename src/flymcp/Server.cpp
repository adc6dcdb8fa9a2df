//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: MCP server implementation
//==========================================================================================================
#include <atomic>
#include <chrono>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "flymcp/Cancellation.h"
#include "flymcp/ConcurrencyLimiter.h"
#include "flymcp/Progress.h"
#include "flymcp/Protocol.h"
#include "flymcp/Server.h"
#include "flymcp/TimeoutGuard.h"
#include "flymcp/errors/Errors.h"
#include "flymcp/validation/SchemaValidator.h"
#include "flymcp/validation/SizeValidator.h"

namespace flymcp {

namespace {

// Methods that go through admission and can be cancelled by the peer
bool isCallMethod(const std::string& method) {
    return method == Methods::CallTool || method == Methods::ReadResource || method == Methods::GetPrompt;
}

std::string makeCorrelationId(const std::string& name) {
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::format("req_{}_{}", name, micros);
}

std::string textOf(const JSONValue& raw) {
    if (raw.isString()) {
        return std::get<std::string>(raw.value);
    }
    return SerializeJSON(raw);
}

JSONValue makeTextItem(const std::string& text) {
    JSONValue item{JSONValue::Object{}};
    item.set("type", JSONValue("text"));
    item.set("text", JSONValue(text));
    return item;
}

JSONValue makeToolResult(const std::string& text, bool isError) {
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(makeTextItem(text)));
    JSONValue result{JSONValue::Object{}};
    result.set("content", JSONValue(std::move(content)));
    result.set("isError", JSONValue(isError));
    return result;
}

// Result schema failures are server-side defects, not bad input
void requireResultSchema(const JSONValue& value, const JSONValue& schema) {
    const auto violations = validation::ValidateAgainstSchema(value, schema);
    if (violations.empty()) {
        return;
    }
    std::string detail;
    for (const auto& v : violations) {
        if (!detail.empty()) {
            detail += "; ";
        }
        detail += v.path + ": " + v.message;
    }
    throw errors::InternalServerError("Result schema validation failed: " + detail);
}

//==========================================================================================================
// OutboundChannel
// Purpose: Route from the pipeline (and from handler threads that may outlive Stop()) to the transport.
//          Detached on Stop(); sends after that are dropped with a log line.
//==========================================================================================================
class OutboundChannel {
public:
    void Attach(ITransport* t) {
        std::lock_guard<std::mutex> lock(mutex);
        transport = t;
    }

    void Detach() {
        std::lock_guard<std::mutex> lock(mutex);
        transport = nullptr;
    }

    void SendResponse(std::unique_ptr<JSONRPCResponse> response) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!transport) {
            LOG_DEBUG("Dropping response for id {}: no transport", IdToString(response->id));
            return;
        }
        try {
            transport->SendResponse(std::move(response)).get();
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to send response: {}", e.what());
        }
    }

    void SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!transport) {
            LOG_DEBUG("Dropping notification {}: no transport", notification->method);
            return;
        }
        try {
            transport->SendNotification(std::move(notification)).get();
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to send notification: {}", e.what());
        }
    }

private:
    std::mutex mutex;
    ITransport* transport{nullptr};
};

} // namespace

// Server implementation
class Server::Impl {
public:
    Impl(Implementation info, ServerConfig cfg)
        : serverInfo(std::move(info)),
          config(std::move(cfg)),
          limiter(config.concurrency.maxConcurrency, config.concurrency.perToolLimits),
          sizeValidator(config.sizeLimits),
          outbound(std::make_shared<OutboundChannel>()) {}

    Implementation serverInfo;
    const ServerConfig config;
    ToolRegistry tools;
    ResourceRegistry resources;
    PromptRegistry prompts;
    ConcurrencyLimiter limiter;
    CancellationRegistry cancellations;
    validation::SizeValidator sizeValidator;
    std::shared_ptr<OutboundChannel> outbound;

    std::mutex lifecycleMutex;
    std::unique_ptr<ITransport> transport;
    std::unique_ptr<boost::asio::thread_pool> workers;
    std::atomic<bool> running{false};
    std::function<void(const std::string&)> errorCallback;

    void applyDefinitionLimit(const std::string& name, const std::optional<std::size_t>& maxConcurrency);
    std::shared_ptr<CancellationToken> registerToken(const JSONRPCRequest& req);

    // Reader-thread entry points
    void onRequest(std::unique_ptr<JSONRPCRequest> request);
    void handleNotification(const JSONRPCNotification& notification);

    std::unique_ptr<JSONRPCResponse> process(const JSONRPCRequest& req, const std::shared_ptr<CancellationToken>& token);
    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req, const std::shared_ptr<CancellationToken>& token);

    JSONValue handleInitialize(const JSONRPCRequest& req) const;
    JSONValue handleToolsCall(const JSONRPCRequest& req, const std::shared_ptr<CancellationToken>& token);
    JSONValue handleResourcesRead(const JSONRPCRequest& req, const std::shared_ptr<CancellationToken>& token);
    JSONValue handlePromptsGet(const JSONRPCRequest& req, const std::shared_ptr<CancellationToken>& token);

    JSONValue execute(const HandlerDefinition& def, const JSONValue& params,
                      const JSONRPCRequest& req, const std::shared_ptr<CancellationToken>& token,
                      const std::string& correlationId);

    ProgressNotifier makeProgress(const JSONRPCRequest& req) const;
    std::string logPrefix(const std::string& correlationId) const;
};

//================================ Helper method definitions =================================
void Server::Impl::applyDefinitionLimit(const std::string& name, const std::optional<std::size_t>& maxConcurrency) {
    if (!maxConcurrency) {
        return;
    }
    if (config.concurrency.perToolLimits.count(name) > 0) {
        LOG_DEBUG("Configured limit for {} overrides definition maxConcurrency {}", name, *maxConcurrency);
        return;
    }
    limiter.SetToolLimit(name, *maxConcurrency);
}

std::shared_ptr<CancellationToken> Server::Impl::registerToken(const JSONRPCRequest& req) {
    auto token = std::make_shared<CancellationToken>();
    cancellations.Register(IdToKey(req.id), token);
    return token;
}

void Server::Impl::onRequest(std::unique_ptr<JSONRPCRequest> request) {
    // Registered before queueing so a cancel read later always finds the token
    std::shared_ptr<CancellationToken> token;
    if (isCallMethod(request->method)) {
        token = registerToken(*request);
    }

    std::shared_ptr<const JSONRPCRequest> req(std::move(request));
    std::lock_guard<std::mutex> lock(lifecycleMutex);
    if (!running.load() || !workers) {
        LOG_WARN("Rejecting request {} ({}): server is stopping", IdToString(req->id), req->method);
        if (token) {
            cancellations.Remove(IdToKey(req->id), token);
        }
        outbound->SendResponse(errors::makeErrorResponse(
            req->id, errors::ToWireError(errors::InternalServerError("Server is shutting down"), req->id)));
        return;
    }
    boost::asio::post(*workers, [this, req, token]() {
        outbound->SendResponse(process(*req, token));
    });
}

void Server::Impl::handleNotification(const JSONRPCNotification& notification) {
    FUNC_SCOPE();
    if (notification.method == Methods::CancelRequest || notification.method == Methods::Cancelled) {
        const std::string key = (notification.method == Methods::CancelRequest) ? "id" : "requestId";
        std::optional<JSONRPCId> target;
        if (notification.params) {
            if (auto s = GetString(*notification.params, key)) {
                target = JSONRPCId{*s};
            } else if (auto i = GetInt(*notification.params, key)) {
                target = JSONRPCId{*i};
            }
        }
        if (!target) {
            LOG_WARN("{} without a usable {} ignored", notification.method, key);
            return;
        }
        const std::string targetKey = IdToKey(*target);
        if (cancellations.Cancel(targetKey)) {
            LOG_INFO("Cancelled request {}", targetKey);
        } else {
            LOG_DEBUG("No request in flight for {}", targetKey);
        }
        return;
    }
    if (notification.method == Methods::Initialized) {
        LOG_INFO("Client reported initialized");
        return;
    }
    LOG_DEBUG("Ignoring notification {}", notification.method);
}

std::unique_ptr<JSONRPCResponse> Server::Impl::process(const JSONRPCRequest& req,
                                                       const std::shared_ptr<CancellationToken>& token) {
    auto response = dispatchRequest(req, token);
    if (token) {
        cancellations.Remove(IdToKey(req.id), token);
    }
    return response;
}

std::unique_ptr<JSONRPCResponse> Server::Impl::dispatchRequest(const JSONRPCRequest& req,
                                                               const std::shared_ptr<CancellationToken>& token) {
    FUNC_SCOPE();
    try {
        if (req.params) {
            sizeValidator.ValidateMessage(*req.params);
        }

        JSONValue result;
        if (req.method == Methods::Initialize) {
            result = handleInitialize(req);
        } else if (req.method == Methods::Ping) {
            result = JSONValue(JSONValue::Object{});
        } else if (req.method == Methods::ListTools) {
            result = JSONValue(JSONValue::Object{});
            result.set("tools", tools.List());
        } else if (req.method == Methods::CallTool) {
            result = handleToolsCall(req, token);
        } else if (req.method == Methods::ListResources) {
            result = JSONValue(JSONValue::Object{});
            result.set("resources", resources.List());
        } else if (req.method == Methods::ReadResource) {
            result = handleResourcesRead(req, token);
        } else if (req.method == Methods::ListPrompts) {
            result = JSONValue(JSONValue::Object{});
            result.set("prompts", prompts.List());
        } else if (req.method == Methods::GetPrompt) {
            result = handlePromptsGet(req, token);
        } else {
            throw errors::MethodNotFoundError(req.method);
        }
        return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
    } catch (const std::exception& e) {
        if (errors::IsKnownError(e)) {
            LOG_WARN("Request {} ({}) failed: {}", IdToString(req.id), req.method, e.what());
        } else {
            LOG_ERROR("Request {} ({}) failed with unexpected error: {}", IdToString(req.id), req.method, e.what());
        }
        return errors::makeErrorResponse(req.id, errors::ToWireError(e, req.id));
    } catch (...) {
        LOG_ERROR("Request {} ({}) failed with a non-standard exception", IdToString(req.id), req.method);
        return errors::makeErrorResponse(req.id, errors::ToWireError(std::current_exception(), req.id));
    }
}

JSONValue Server::Impl::handleInitialize(const JSONRPCRequest& req) const {
    if (req.params) {
        if (const JSONValue* clientInfo = req.params->find("clientInfo")) {
            LOG_INFO("Initialize from client {} {}",
                     GetString(*clientInfo, "name").value_or("<unnamed>"),
                     GetString(*clientInfo, "version").value_or(""));
        }
    }

    JSONValue toolsCap{JSONValue::Object{}};
    toolsCap.set("listChanged", JSONValue(false));
    JSONValue resourcesCap{JSONValue::Object{}};
    resourcesCap.set("subscribe", JSONValue(false));
    resourcesCap.set("listChanged", JSONValue(false));
    JSONValue promptsCap{JSONValue::Object{}};
    promptsCap.set("listChanged", JSONValue(false));

    JSONValue capabilities{JSONValue::Object{}};
    capabilities.set("tools", std::move(toolsCap));
    capabilities.set("resources", std::move(resourcesCap));
    capabilities.set("prompts", std::move(promptsCap));

    JSONValue info{JSONValue::Object{}};
    info.set("name", JSONValue(serverInfo.name));
    info.set("version", JSONValue(serverInfo.version));

    JSONValue result{JSONValue::Object{}};
    result.set("protocolVersion", JSONValue(PROTOCOL_VERSION));
    result.set("capabilities", std::move(capabilities));
    result.set("serverInfo", std::move(info));
    return result;
}

JSONValue Server::Impl::handleToolsCall(const JSONRPCRequest& req, const std::shared_ptr<CancellationToken>& token) {
    const JSONValue params = req.params.value_or(JSONValue(JSONValue::Object{}));
    const auto name = GetString(params, "name");
    if (!name) {
        throw errors::InvalidParamsError("Missing required parameter: name", {"name"});
    }
    const auto def = tools.Get(*name);
    if (!def) {
        tools.ThrowNotFound(*name);
    }
    const std::string correlationId = makeCorrelationId(*name);

    const JSONValue* argsPtr = params.find("arguments");
    const JSONValue arguments = argsPtr ? *argsPtr : JSONValue(JSONValue::Object{});
    sizeValidator.ValidateParameters(arguments);
    if (def->paramsSchema) {
        validation::RequireSchema(arguments, *def->paramsSchema, "arguments");
    }

    if (def->requiresConfirmation && !GetBool(arguments, "confirm").value_or(false)) {
        LOG_INFO("{}Tool {} requires confirmation; not executed", logPrefix(correlationId), *name);
        return makeToolResult("Confirmation required for tool: " + *name, true);
    }

    const JSONValue raw = execute(*def, arguments, req, token, correlationId);
    sizeValidator.ValidateResult(raw);

    JSONValue result = makeToolResult(textOf(raw), false);
    if (def->resultSchema) {
        JSONValue structured = raw;
        if (!raw.isObject()) {
            structured = JSONValue(JSONValue::Object{});
            structured.set("result", raw);
        }
        requireResultSchema(structured, *def->resultSchema);
        result.set("structuredContent", std::move(structured));
    }
    return result;
}

JSONValue Server::Impl::handleResourcesRead(const JSONRPCRequest& req, const std::shared_ptr<CancellationToken>& token) {
    const JSONValue params = req.params.value_or(JSONValue(JSONValue::Object{}));
    const auto uri = GetString(params, "uri");
    if (!uri) {
        throw errors::InvalidParamsError("Missing required parameter: uri", {"uri"});
    }
    const auto def = resources.Get(*uri);
    if (!def) {
        resources.ThrowNotFound(*uri);
    }
    const std::string correlationId = makeCorrelationId(*uri);

    sizeValidator.ValidateParameters(params);
    if (def->paramsSchema) {
        validation::RequireSchema(params, *def->paramsSchema, "params");
    }

    const JSONValue raw = execute(*def, params, req, token, correlationId);
    if (raw.isObject()) {
        // Handler produced the full { contents: [...] } shape itself
        sizeValidator.ValidateResult(raw);
        return raw;
    }

    const std::string text = textOf(raw);
    sizeValidator.ValidateResourceContent(text);

    JSONValue item{JSONValue::Object{}};
    item.set("uri", JSONValue(*uri));
    if (def->mimeType) {
        item.set("mimeType", JSONValue(*def->mimeType));
    }
    item.set("text", JSONValue(text));

    JSONValue::Array contents;
    contents.push_back(std::make_shared<JSONValue>(std::move(item)));
    JSONValue result{JSONValue::Object{}};
    result.set("contents", JSONValue(std::move(contents)));
    return result;
}

JSONValue Server::Impl::handlePromptsGet(const JSONRPCRequest& req, const std::shared_ptr<CancellationToken>& token) {
    const JSONValue params = req.params.value_or(JSONValue(JSONValue::Object{}));
    const auto name = GetString(params, "name");
    if (!name) {
        throw errors::InvalidParamsError("Missing required parameter: name", {"name"});
    }
    const auto def = prompts.Get(*name);
    if (!def) {
        prompts.ThrowNotFound(*name);
    }
    const std::string correlationId = makeCorrelationId(*name);

    sizeValidator.ValidateParameters(params);
    if (def->paramsSchema) {
        const JSONValue* argsPtr = params.find("arguments");
        validation::RequireSchema(argsPtr ? *argsPtr : JSONValue(JSONValue::Object{}), *def->paramsSchema, "arguments");
    }

    const JSONValue raw = execute(*def, params, req, token, correlationId);
    sizeValidator.ValidateResult(raw);
    if (raw.isObject()) {
        return raw;
    }

    JSONValue message{JSONValue::Object{}};
    message.set("role", JSONValue("user"));
    message.set("content", makeTextItem(textOf(raw)));

    JSONValue::Array messages;
    messages.push_back(std::make_shared<JSONValue>(std::move(message)));
    JSONValue result{JSONValue::Object{}};
    result.set("description", JSONValue(def->description));
    result.set("messages", JSONValue(std::move(messages)));
    return result;
}

//==========================================================================================================
// execute
// Purpose: Admission, slot, deadline and cancellation for one handler invocation.
// Throws:
//   ConcurrencyLimitError, CancellationError (with the request id), TimeoutError, or the handler's error.
//==========================================================================================================
JSONValue Server::Impl::execute(const HandlerDefinition& def, const JSONValue& params,
                                const JSONRPCRequest& req, const std::shared_ptr<CancellationToken>& token,
                                const std::string& correlationId) {
    const std::shared_ptr<CancellationToken> callToken = token ? token : std::make_shared<CancellationToken>();

    limiter.EnsureCanStart(def.name);
    if (callToken->IsCancelled()) {
        throw errors::CancellationError(req.id);
    }

    const auto timeout = config.TimeoutFor(def.name, def.timeout.value_or(config.timeouts.defaultTimeout));
    const auto handler = def.handler;
    const ProgressNotifier progress = makeProgress(req);
    const std::string prefix = logPrefix(correlationId);

    LOG_INFO("{}{} {} started (timeout {} ms)", prefix, req.method, def.name, timeout.count());
    const auto started = std::chrono::steady_clock::now();

    JSONValue raw;
    try {
        raw = limiter.Execute(def.name, [&]() {
            return WithTimeout<JSONValue>(
                [handler, params, callToken, progress]() {
                    return handler->Handle(params, *callToken, progress);
                },
                timeout, def.name, callToken);
        });
    } catch (const errors::TimeoutError&) {
        LOG_WARN("{}{} {} timed out", prefix, req.method, def.name);
        throw;
    } catch (const errors::ConcurrencyLimitError&) {
        throw;
    } catch (const std::exception&) {
        if (callToken->IsCancelled()) {
            throw errors::CancellationError(req.id);
        }
        throw;
    }

    if (callToken->IsCancelled()) {
        throw errors::CancellationError(req.id);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    LOG_INFO("{}{} {} completed in {} ms", prefix, req.method, def.name, elapsed.count());
    return raw;
}

ProgressNotifier Server::Impl::makeProgress(const JSONRPCRequest& req) const {
    auto channel = outbound;
    return ProgressNotifier(ProgressNotifier::TokenFromParams(req.params),
                            [channel](std::unique_ptr<JSONRPCNotification> notification) {
                                channel->SendNotification(std::move(notification));
                            });
}

std::string Server::Impl::logPrefix(const std::string& correlationId) const {
    if (!config.logging.includeCorrelationIds) {
        return std::string();
    }
    return "[" + correlationId + "] ";
}

//================================ Server =================================
Server::Server(Implementation serverInfo, ServerConfig config)
    : pImpl(std::make_unique<Impl>(std::move(serverInfo), std::move(config))) {
    FUNC_SCOPE();
}

Server::~Server() {
    FUNC_SCOPE();
    if (pImpl && pImpl->running.load()) {
        try {
            Stop().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Server stop during destruction failed: {}", e.what());
        }
    }
}

void Server::RegisterTool(HandlerDefinition definition) {
    FUNC_SCOPE();
    const std::string name = definition.name;
    const auto maxConcurrency = definition.maxConcurrency;
    pImpl->tools.Register(std::move(definition));
    pImpl->applyDefinitionLimit(name, maxConcurrency);
    LOG_DEBUG("Registered tool {}", name);
}

void Server::RegisterResource(HandlerDefinition definition) {
    FUNC_SCOPE();
    const std::string uri = definition.name;
    const auto maxConcurrency = definition.maxConcurrency;
    pImpl->resources.Register(std::move(definition));
    pImpl->applyDefinitionLimit(uri, maxConcurrency);
    LOG_DEBUG("Registered resource {}", uri);
}

void Server::RegisterPrompt(HandlerDefinition definition) {
    FUNC_SCOPE();
    const std::string name = definition.name;
    const auto maxConcurrency = definition.maxConcurrency;
    pImpl->prompts.Register(std::move(definition));
    pImpl->applyDefinitionLimit(name, maxConcurrency);
    LOG_DEBUG("Registered prompt {}", name);
}

std::future<void> Server::Start(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    std::promise<void> failed;
    if (!transport) {
        failed.set_exception(std::make_exception_ptr(std::invalid_argument("Server::Start requires a transport")));
        return failed.get_future();
    }

    Impl* self = pImpl.get();
    {
        std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
        if (pImpl->running.load()) {
            failed.set_exception(std::make_exception_ptr(std::logic_error("Server already running")));
            return failed.get_future();
        }
        pImpl->transport = std::move(transport);
        pImpl->workers = std::make_unique<boost::asio::thread_pool>(pImpl->config.EffectiveDispatchThreads());

        // Wire transport handlers for server-side processing
        pImpl->transport->SetNotificationHandler([self](std::unique_ptr<JSONRPCNotification> n) {
            if (!n) return;
            try { self->handleNotification(*n); }
            catch (const std::exception& e) { LOG_ERROR("Server notification handler exception: {}", e.what()); }
        });

        pImpl->transport->SetErrorHandler([self](const std::string& err) {
            LOG_WARN("Transport error: {}", err);
            if (self->errorCallback) {
                try { self->errorCallback(err); }
                catch (const std::exception& e) { LOG_ERROR("Server error callback exception: {}", e.what()); }
            }
        });

        pImpl->transport->SetRequestHandler([self](std::unique_ptr<JSONRPCRequest> req) {
            if (!req) return;
            self->onRequest(std::move(req));
        });

        pImpl->outbound->Attach(pImpl->transport.get());
        pImpl->running.store(true);
    }

    LOG_INFO("Server {} {} starting with {} dispatch threads (max concurrency {})",
             pImpl->serverInfo.name, pImpl->serverInfo.version,
             pImpl->config.EffectiveDispatchThreads(), pImpl->config.concurrency.maxConcurrency);
    return pImpl->transport->Start();
}

std::future<void> Server::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();

    std::unique_ptr<ITransport> transport;
    std::unique_ptr<boost::asio::thread_pool> workers;
    {
        std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
        if (!pImpl->running.exchange(false)) {
            done.set_value();
            return fut;
        }
        transport = std::move(pImpl->transport);
        workers = std::move(pImpl->workers);
    }

    const std::size_t cancelled = pImpl->cancellations.CancelAll();
    if (cancelled > 0) {
        LOG_INFO("Stopping: cancelled {} in-flight request(s)", cancelled);
    }
    if (workers) {
        workers->join();
    }
    if (transport) {
        try {
            transport->Close().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Transport close failed: {}", e.what());
        }
    }
    pImpl->outbound->Detach();
    LOG_INFO("Server stopped");

    done.set_value();
    return fut;
}

bool Server::IsRunning() const {
    return pImpl->running.load();
}

void Server::SetErrorCallback(std::function<void(const std::string&)> callback) {
    FUNC_SCOPE();
    pImpl->errorCallback = std::move(callback);
}

std::unique_ptr<JSONRPCResponse> Server::HandleRequest(const JSONRPCRequest& request) {
    FUNC_SCOPE();
    std::shared_ptr<CancellationToken> token;
    if (isCallMethod(request.method)) {
        token = pImpl->registerToken(request);
    }
    return pImpl->process(request, token);
}

void Server::HandleNotification(const JSONRPCNotification& notification) {
    pImpl->handleNotification(notification);
}

const ServerConfig& Server::GetConfig() const { return pImpl->config; }
const ToolRegistry& Server::Tools() const { return pImpl->tools; }
const ResourceRegistry& Server::Resources() const { return pImpl->resources; }
const PromptRegistry& Server::Prompts() const { return pImpl->prompts; }

std::size_t Server::ActiveCalls() const {
    return pImpl->limiter.CurrentGlobal();
}

std::size_t Server::PendingRequests() const {
    return pImpl->cancellations.Size();
}

} // namespace flymcp
