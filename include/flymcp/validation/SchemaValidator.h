//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Structural JSON-schema subset used to admit tool params and results
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "flymcp/JSONRPCTypes.h"

namespace flymcp {
namespace validation {

// One failed constraint; path is "$" for the root, "$.a.b" for members, "$.a[2]" for items
struct SchemaViolation {
    std::string path;
    std::string message;
};

//==========================================================================================================
// ValidateAgainstSchema
// Purpose: Checks value against the supported keywords:
//   type (object|string|integer|number|boolean|array), properties, required,
//   additionalProperties (boolean), items.
//   Schemas without "type" or with another type accept anything.
// Returns:
//   All violations found; empty means valid.
//==========================================================================================================
std::vector<SchemaViolation> ValidateAgainstSchema(const JSONValue& value, const JSONValue& schema,
                                                   const std::string& path = "$");

//==========================================================================================================
// RequireSchema
// Purpose: Throws errors::ValidationError ("<what> failed schema validation") with violations grouped by
//          path as fieldErrors when value does not conform.
//==========================================================================================================
void RequireSchema(const JSONValue& value, const JSONValue& schema, const std::string& what);

} // namespace validation
} // namespace flymcp
