//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EchoTool.h
// Purpose: Demo "echo" tool served by flymcp_server
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>

#include "flymcp/Registries.h"

namespace flymcp {
namespace tools {

//==========================================================================================================
// MakeEchoTool
// Purpose: Builds the "echo" definition: returns arguments.message unchanged after an optional delay.
// Args:
//   maxConcurrency: Optional per-tool limit carried on the definition.
// Notes:
//   - arguments: { message: string (required), delayMs: integer }.
//   - During the delay the handler polls its token every few milliseconds and reports progress at
//     0% and 100% when the peer asked for progress.
//==========================================================================================================
HandlerDefinition MakeEchoTool(std::optional<std::size_t> maxConcurrency = std::nullopt);

} // namespace tools
} // namespace flymcp
