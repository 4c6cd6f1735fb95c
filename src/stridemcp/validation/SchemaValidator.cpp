//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: Structural validation of tool arguments against a declared input schema
//==========================================================================================================

#include "stridemcp/validation/SchemaValidator.h"

#include <cmath>

#include "logging/Logger.h"

namespace stridemcp {
namespace validation {

namespace {

bool matchesType(const JSONValue& v, const std::string& type) {
    if (type == "string") return std::holds_alternative<std::string>(v.value);
    if (type == "boolean") return std::holds_alternative<bool>(v.value);
    if (type == "object") return v.isObject();
    if (type == "array") return v.isArray();
    if (type == "null") return v.isNull();
    if (type == "integer") {
        if (std::holds_alternative<int64_t>(v.value)) return true;
        if (std::holds_alternative<double>(v.value)) {
            const double d = std::get<double>(v.value);
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    if (type == "number") {
        return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
    }
    // Unknown type keywords do not constrain
    return true;
}

std::optional<std::string> validateNode(const JSONValue& v, const JSONValue& schema, const std::string& path) {
    if (!schema.isObject()) {
        return std::nullopt;
    }

    if (const JSONValue* type = FindMember(schema, "type"); type && type->isString()) {
        const auto& t = std::get<std::string>(type->value);
        if (!matchesType(v, t)) {
            return path + ": expected " + t;
        }
    }

    if (const JSONValue* en = FindMember(schema, "enum"); en && en->isArray()) {
        bool found = false;
        for (const auto& candidate : std::get<JSONValue::Array>(en->value)) {
            if (candidate && *candidate == v) { found = true; break; }
        }
        if (!found) {
            std::string allowed;
            for (const auto& candidate : std::get<JSONValue::Array>(en->value)) {
                if (!candidate) continue;
                if (!allowed.empty()) allowed += ", ";
                allowed += SerializeJSON(*candidate);
            }
            return path + ": must be one of [" + allowed + "]";
        }
    }

    if (v.isArray()) {
        if (const JSONValue* items = FindMember(schema, "items"); items && items->isObject()) {
            const auto& arr = std::get<JSONValue::Array>(v.value);
            for (size_t i = 0; i < arr.size(); ++i) {
                const JSONValue element = arr[i] ? *arr[i] : JSONValue{};
                auto err = validateNode(element, *items, path + "[" + std::to_string(i) + "]");
                if (err) return err;
            }
        }
        return std::nullopt;
    }

    if (!v.isObject()) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(v.value);

    // A member explicitly set to null does not satisfy "required"
    if (const JSONValue* req = FindMember(schema, "required"); req && req->isArray()) {
        for (const auto& name : std::get<JSONValue::Array>(req->value)) {
            if (!name || !name->isString()) continue;
            const auto& key = std::get<std::string>(name->value);
            const JSONValue* member = FindMember(v, key);
            if (member == nullptr || member->isNull()) {
                return path + ": missing required property '" + key + "'";
            }
        }
    }

    const JSONValue* props = FindMember(schema, "properties");
    if (props && props->isObject()) {
        for (const auto& [key, sub] : std::get<JSONValue::Object>(props->value)) {
            if (!sub) continue;
            auto it = obj.find(key);
            if (it == obj.end() || !it->second) continue;
            auto err = validateNode(*it->second, *sub, path + "." + key);
            if (err) return err;
        }
    }

    const JSONValue* additional = FindMember(schema, "additionalProperties");
    if (additional && std::holds_alternative<bool>(additional->value) && !std::get<bool>(additional->value)) {
        for (const auto& [key, val] : obj) {
            if (props == nullptr || FindMember(*props, key) == nullptr) {
                return path + ": unexpected property '" + key + "'";
            }
        }
    }

    return std::nullopt;
}

} // namespace

std::optional<std::string> ValidateArguments(const JSONValue& args, const JSONValue& schema) {
    FUNC_SCOPE();
    return validateNode(args, schema, "arguments");
}

} // namespace validation
} // namespace stridemcp
