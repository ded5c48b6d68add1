#pragma once
#include "../memory.hpp"
#include "../tool.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <optional>

namespace memkeep {

// True if the field is present and not JSON null.
inline bool has_arg(const nlohmann::json& args, const char* field) {
    return args.is_object() && args.contains(field) && !args[field].is_null();
}

// Arguments must be absent (null) or an object.
inline std::optional<ToolResult> require_object_or_absent(const nlohmann::json& args) {
    if (!args.is_null() && !args.is_object()) {
        return ToolResult{false, "Invalid arguments: expected an object"};
    }
    return std::nullopt;
}

inline std::optional<ToolResult> require_memory(Memory* memory) {
    if (!memory) return ToolResult{false, "Memory store is not available"};
    return std::nullopt;
}

// Read an optional string field. Absent or null leaves out empty.
inline std::optional<ToolResult> read_string(const nlohmann::json& args, const char* field,
                                             std::optional<std::string>& out) {
    if (!has_arg(args, field)) return std::nullopt;
    if (!args[field].is_string()) {
        return ToolResult{false, std::string("Invalid ") + field + " argument: expected a string"};
    }
    out = args[field].get<std::string>();
    return std::nullopt;
}

// Read memory_id as an integer. Accepts JSON integers, integral floats
// and integer strings. The caller checks presence first.
inline std::optional<ToolResult> read_memory_id(const nlohmann::json& args, int64_t& out) {
    const auto& v = args["memory_id"];
    if (v.is_number_unsigned()) {
        if (v.get<uint64_t>() <= static_cast<uint64_t>(INT64_MAX)) {
            out = static_cast<int64_t>(v.get<uint64_t>());
            return std::nullopt;
        }
    } else if (v.is_number_integer()) {
        out = v.get<int64_t>();
        return std::nullopt;
    } else if (v.is_number_float()) {
        // 2^63 itself is not representable as int64
        double d = v.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
            out = static_cast<int64_t>(d);
            return std::nullopt;
        }
    } else if (v.is_string()) {
        if (auto parsed = parse_int64(v.get<std::string>())) {
            out = *parsed;
            return std::nullopt;
        }
    }
    return ToolResult{false, "Invalid memory_id argument: expected an integer"};
}

// Downgrade a store failure to an ordinary text result.
// action reads like "storing memory" or "listing memories".
inline ToolResult store_failure(const char* action, const StoreError& e) {
    std::cerr << "[store] " << store_error_kind_to_string(e.kind()) << ": " << e.what() << "\n";
    return ToolResult{true, std::string("Error ") + action + ": " + e.what()};
}

} // namespace memkeep
