//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConcurrencyLimiter.cpp
// Purpose: ConcurrencyLimiter counters and admission
//==========================================================================================================

#include "flymcp/ConcurrencyLimiter.h"
#include "flymcp/errors/Errors.h"
#include "logging/Logger.h"

namespace flymcp {

ConcurrencyLimiter::ConcurrencyLimiter(std::size_t maxGlobalCalls,
                                       std::unordered_map<std::string, std::size_t> perToolLimits)
    : maxGlobal(maxGlobalCalls), toolLimits(std::move(perToolLimits)) {}

bool ConcurrencyLimiter::CanStart(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex);
    return canStartLocked(tool);
}

void ConcurrencyLimiter::Start(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex);
    startLocked(tool);
}

void ConcurrencyLimiter::Complete(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = currentPerTool.find(tool);
    if (it == currentPerTool.end()) {
        LOG_WARN("Complete() for tool {} without a matching Start()", tool);
        return;
    }
    if (--(it->second) == 0) {
        currentPerTool.erase(it);
    }
    if (currentGlobal > 0) {
        --currentGlobal;
    }
}

std::size_t ConcurrencyLimiter::CurrentGlobal() const {
    std::lock_guard<std::mutex> lock(mutex);
    return currentGlobal;
}

std::size_t ConcurrencyLimiter::CurrentFor(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = currentPerTool.find(tool);
    return (it == currentPerTool.end()) ? 0 : it->second;
}

std::size_t ConcurrencyLimiter::LimitFor(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex);
    return limitForLocked(tool);
}

void ConcurrencyLimiter::EnsureCanStart(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex);
    throwIfFullLocked(tool);
}

void ConcurrencyLimiter::SetToolLimit(const std::string& tool, std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex);
    toolLimits[tool] = limit;
}

bool ConcurrencyLimiter::canStartLocked(const std::string& tool) const {
    if (currentGlobal >= maxGlobal) {
        return false;
    }
    auto it = currentPerTool.find(tool);
    const std::size_t current = (it == currentPerTool.end()) ? 0 : it->second;
    return current < limitForLocked(tool);
}

void ConcurrencyLimiter::throwIfFullLocked(const std::string& tool) const {
    if (canStartLocked(tool)) {
        return;
    }
    if (currentGlobal >= maxGlobal) {
        throw errors::ConcurrencyLimitError(tool, currentGlobal, maxGlobal);
    }
    auto it = currentPerTool.find(tool);
    const std::size_t current = (it == currentPerTool.end()) ? 0 : it->second;
    throw errors::ConcurrencyLimitError(tool, current, limitForLocked(tool));
}

std::size_t ConcurrencyLimiter::limitForLocked(const std::string& tool) const {
    auto it = toolLimits.find(tool);
    return (it == toolLimits.end()) ? maxGlobal : it->second;
}

void ConcurrencyLimiter::startLocked(const std::string& tool) {
    ++currentPerTool[tool];
    ++currentGlobal;
}

ConcurrencyLimiter::Slot::Slot(ConcurrencyLimiter& limiter, const std::string& toolName)
    : owner(limiter), tool(toolName) {
    std::lock_guard<std::mutex> lock(owner.mutex);
    owner.throwIfFullLocked(tool);
    owner.startLocked(tool);
}

ConcurrencyLimiter::Slot::~Slot() {
    owner.Complete(tool);
}

} // namespace flymcp
