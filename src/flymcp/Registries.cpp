//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registries.cpp
// Purpose: Registry storage, listing shapes and direct invocation
//==========================================================================================================

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "flymcp/Registries.h"
#include "flymcp/errors/Errors.h"
#include "logging/Logger.h"

namespace flymcp {

namespace {
class FunctionToolHandler : public ToolHandler {
public:
    explicit FunctionToolHandler(ToolHandlerFn f) : fn(std::move(f)) {}
    JSONValue Handle(const JSONValue& params, const CancellationToken& cancelToken,
                     const ProgressNotifier& progress) override {
        return fn(params, cancelToken, progress);
    }
private:
    ToolHandlerFn fn;
};

// prompts/list argument descriptors { name, description?, required } from an object schema,
// ordered by name
JSONValue promptArguments(const JSONValue& schema) {
    std::set<std::string> required;
    if (const JSONValue* req = schema.find("required"); req != nullptr && req->isArray()) {
        for (const auto& item : std::get<JSONValue::Array>(req->value)) {
            if (item && item->isString()) {
                required.insert(std::get<std::string>(item->value));
            }
        }
    }

    std::vector<std::string> names;
    const JSONValue* props = schema.find("properties");
    if (props != nullptr && props->isObject()) {
        for (const auto& [name, _] : std::get<JSONValue::Object>(props->value)) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());

    JSONValue::Array out;
    for (const auto& name : names) {
        JSONValue arg{JSONValue::Object{}};
        arg.set("name", JSONValue(name));
        const auto& prop = std::get<JSONValue::Object>(props->value).at(name);
        if (prop) {
            if (auto description = GetString(*prop, "description")) {
                arg.set("description", JSONValue(*description));
            }
        }
        arg.set("required", JSONValue(required.count(name) > 0));
        out.push_back(std::make_shared<JSONValue>(std::move(arg)));
    }
    return JSONValue(std::move(out));
}
} // namespace

std::shared_ptr<ToolHandler> MakeToolHandler(ToolHandlerFn fn) {
    return std::make_shared<FunctionToolHandler>(std::move(fn));
}

void HandlerRegistry::Register(HandlerDefinition definition) {
    if (!definition.handler) {
        throw std::invalid_argument("Handler definition '" + definition.name + "' has no handler");
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto name = definition.name;
    if (definitions.count(name) > 0) {
        LOG_DEBUG("Replacing registered handler {}", name);
    }
    definitions[name] = std::make_shared<const HandlerDefinition>(std::move(definition));
}

JSONValue HandlerRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex);
    JSONValue::Array out;
    out.reserve(definitions.size());
    for (const auto& [name, def] : definitions) {
        out.push_back(std::make_shared<JSONValue>(describe(*def)));
    }
    return JSONValue{std::move(out)};
}

std::shared_ptr<const HandlerDefinition> HandlerRegistry::Get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = definitions.find(name);
    return (it == definitions.end()) ? nullptr : it->second;
}

bool HandlerRegistry::Contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return definitions.count(name) > 0;
}

std::size_t HandlerRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return definitions.size();
}

JSONValue HandlerRegistry::Call(const std::string& name, const JSONValue& params,
                                std::shared_ptr<CancellationToken> cancelToken,
                                const ProgressNotifier& progress) const {
    auto def = Get(name);
    if (!def) {
        ThrowNotFound(name);
    }
    if (!cancelToken) {
        cancelToken = std::make_shared<CancellationToken>();
    }
    return def->handler->Handle(params, *cancelToken, progress);
}

void ToolRegistry::ThrowNotFound(const std::string& name) const {
    throw errors::ToolNotFoundError(name);
}

JSONValue ToolRegistry::describe(const HandlerDefinition& def) const {
    JSONValue entry{JSONValue::Object{}};
    entry.set("name", JSONValue(def.name));
    entry.set("description", JSONValue(def.description));
    entry.set("inputSchema", def.paramsSchema.value_or(JSONValue{JSONValue::Object{{"type", std::make_shared<JSONValue>("object")}}}));
    if (def.resultSchema.has_value()) {
        entry.set("outputSchema", def.resultSchema.value());
    }
    if (def.readOnly) entry.set("readOnly", JSONValue(true));
    if (def.writesToDisk) entry.set("writesToDisk", JSONValue(true));
    if (def.requiresConfirmation) entry.set("requiresConfirmation", JSONValue(true));
    if (def.idempotent) entry.set("idempotent", JSONValue(true));
    return entry;
}

void ResourceRegistry::ThrowNotFound(const std::string& uri) const {
    throw errors::ResourceNotFoundError(uri);
}

JSONValue ResourceRegistry::describe(const HandlerDefinition& def) const {
    JSONValue entry{JSONValue::Object{}};
    entry.set("uri", JSONValue(def.name));
    entry.set("name", JSONValue(def.name));
    entry.set("description", JSONValue(def.description));
    if (def.mimeType.has_value()) {
        entry.set("mimeType", JSONValue(def.mimeType.value()));
    }
    return entry;
}

void PromptRegistry::ThrowNotFound(const std::string& name) const {
    throw errors::PromptNotFoundError(name);
}

JSONValue PromptRegistry::describe(const HandlerDefinition& def) const {
    JSONValue entry{JSONValue::Object{}};
    entry.set("name", JSONValue(def.name));
    entry.set("description", JSONValue(def.description));
    if (def.paramsSchema.has_value()) {
        entry.set("arguments", promptArguments(def.paramsSchema.value()));
    }
    return entry;
}

} // namespace flymcp
