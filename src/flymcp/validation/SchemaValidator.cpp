//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: Structural JSON-schema checks
//==========================================================================================================

#include "flymcp/validation/SchemaValidator.h"
#include "flymcp/errors/Errors.h"

namespace flymcp {
namespace validation {

namespace {
const char* typeName(const JSONValue& v) {
    switch (v.value.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        case 6: return "object";
        default: return "unknown";
    }
}

void expect(bool ok, const char* expected, const JSONValue& value, const std::string& path,
            std::vector<SchemaViolation>& out) {
    if (!ok) {
        out.push_back({path, std::string("Expected ") + expected + ", got " + typeName(value)});
    }
}
} // namespace

std::vector<SchemaViolation> ValidateAgainstSchema(const JSONValue& value, const JSONValue& schema,
                                                   const std::string& path) {
    std::vector<SchemaViolation> violations;
    auto type = GetString(schema, "type");
    if (!type.has_value()) {
        return violations;
    }
    const std::string& t = type.value();

    if (t == "string") {
        expect(value.isString(), "string", value, path, violations);
    } else if (t == "integer") {
        bool ok = std::holds_alternative<int64_t>(value.value);
        if (!ok && std::holds_alternative<double>(value.value)) {
            const double d = std::get<double>(value.value);
            ok = (d == static_cast<double>(static_cast<int64_t>(d)));
        }
        expect(ok, "integer", value, path, violations);
    } else if (t == "number") {
        expect(std::holds_alternative<int64_t>(value.value) || std::holds_alternative<double>(value.value),
               "number", value, path, violations);
    } else if (t == "boolean") {
        expect(std::holds_alternative<bool>(value.value), "boolean", value, path, violations);
    } else if (t == "array") {
        if (!value.isArray()) {
            expect(false, "array", value, path, violations);
            return violations;
        }
        const JSONValue* items = schema.find("items");
        if (items != nullptr && items->isObject()) {
            const auto& arr = std::get<JSONValue::Array>(value.value);
            for (std::size_t i = 0; i < arr.size(); ++i) {
                const JSONValue element = arr[i] ? *arr[i] : JSONValue();
                auto sub = ValidateAgainstSchema(element, *items, path + "[" + std::to_string(i) + "]");
                violations.insert(violations.end(), sub.begin(), sub.end());
            }
        }
    } else if (t == "object") {
        if (!value.isObject()) {
            expect(false, "object", value, path, violations);
            return violations;
        }
        const auto& obj = std::get<JSONValue::Object>(value.value);
        if (const JSONValue* required = schema.find("required"); required != nullptr && required->isArray()) {
            for (const auto& field : std::get<JSONValue::Array>(required->value)) {
                if (field && field->isString() && obj.find(std::get<std::string>(field->value)) == obj.end()) {
                    violations.push_back({path, "Missing required field: " + std::get<std::string>(field->value)});
                }
            }
        }
        const JSONValue* props = schema.find("properties");
        const bool additionalAllowed = GetBool(schema, "additionalProperties").value_or(true);
        for (const auto& [name, member] : obj) {
            const JSONValue* propSchema = (props != nullptr) ? props->find(name) : nullptr;
            if (propSchema != nullptr) {
                const JSONValue memberValue = member ? *member : JSONValue();
                auto sub = ValidateAgainstSchema(memberValue, *propSchema, path + "." + name);
                violations.insert(violations.end(), sub.begin(), sub.end());
            } else if (!additionalAllowed) {
                violations.push_back({path, "Additional property not allowed: " + name});
            }
        }
    }
    return violations;
}

void RequireSchema(const JSONValue& value, const JSONValue& schema, const std::string& what) {
    auto violations = ValidateAgainstSchema(value, schema);
    if (violations.empty()) {
        return;
    }
    errors::FieldErrors grouped;
    for (auto& v : violations) {
        grouped[v.path].push_back(std::move(v.message));
    }
    throw errors::ValidationError(what + " failed schema validation", std::move(grouped));
}

} // namespace validation
} // namespace flymcp
