//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConcurrencyLimiter.h
// Purpose: Global and per-tool admission control for concurrently executing calls
//==========================================================================================================

#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace flymcp {

//==========================================================================================================
// ConcurrencyLimiter
// Purpose: Counts running calls overall and per tool and refuses a call when either bound is reached.
// Notes:
//   - The effective bound for a tool is its per-tool limit when one is set, else maxGlobal; the global
//     count is always bounded by maxGlobal as well.
//   - currentGlobal equals the sum of the per-tool counts whenever no call is between Start/Complete.
//==========================================================================================================
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(std::size_t maxGlobal,
                                std::unordered_map<std::string, std::size_t> perToolLimits = {});

    bool CanStart(const std::string& tool) const;

    // Throws errors::ConcurrencyLimitError when CanStart(tool) is false; never changes state
    void EnsureCanStart(const std::string& tool) const;

    // Unconditionally records a start; pair with Complete()
    void Start(const std::string& tool);

    // Records completion; per-tool entries that reach zero are erased
    void Complete(const std::string& tool);

    std::size_t CurrentGlobal() const;
    std::size_t CurrentFor(const std::string& tool) const;
    std::size_t LimitFor(const std::string& tool) const;
    std::size_t MaxGlobal() const { return maxGlobal; }

    void SetToolLimit(const std::string& tool, std::size_t limit);

    //======================================================================================================
    // Execute
    // Purpose: Admits and runs body, holding one slot for its whole duration.
    // Args:
    //   tool: Name the slot is charged to.
    //   body: Callable invoked with no arguments.
    // Returns:
    //   Whatever body returns.
    // Throws:
    //   errors::ConcurrencyLimitError when no slot is available (no state change); anything body throws
    //   (slot released first).
    //======================================================================================================
    template <typename Body>
    auto Execute(const std::string& tool, Body&& body) -> decltype(body()) {
        Slot slot(*this, tool);
        return std::forward<Body>(body)();
    }

private:
    // RAII slot; the constructor checks and starts under one lock
    class Slot {
    public:
        Slot(ConcurrencyLimiter& owner, const std::string& tool);
        ~Slot();
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
    private:
        ConcurrencyLimiter& owner;
        std::string tool;
    };

    bool canStartLocked(const std::string& tool) const;
    void throwIfFullLocked(const std::string& tool) const;
    std::size_t limitForLocked(const std::string& tool) const;
    void startLocked(const std::string& tool);

    mutable std::mutex mutex;
    std::size_t maxGlobal;
    std::size_t currentGlobal{0};
    std::unordered_map<std::string, std::size_t> currentPerTool;
    std::unordered_map<std::string, std::size_t> toolLimits;
};

} // namespace flymcp
