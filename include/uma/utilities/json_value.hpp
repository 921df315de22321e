#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol::utilities {

using JsonObject = google::protobuf::Struct;
using JsonValue = google::protobuf::Value;
using JsonList = google::protobuf::ListValue;

/**
 * @brief Typed access to JSON documents held in protobuf's Struct DOM
 *
 * Every getter takes the error code to report when the field is missing or
 * has the wrong type, so message parsers surface PARSE_*_ERROR or
 * MISSING_REQUIRED_UMA_PARAMETERS as appropriate without re-mapping.
 *
 * Numbers are stored as doubles, exact up to 2^53. SetInt64 writes larger
 * magnitudes as decimal strings; integer getters accept those strings and
 * reject numbers with a fractional part or beyond 2^53. Serialize writes
 * integral numbers without an exponent.
 */
class Json {
public:
    [[nodiscard]] static Result<JsonObject, UmaFailure> ParseObject(
        std::string_view text,
        ErrorCode error_code);

    [[nodiscard]] static Result<std::string, UmaFailure> Serialize(const JsonObject& object);

    [[nodiscard]] static Result<std::string, UmaFailure> SerializeValue(const JsonValue& value);

    [[nodiscard]] static bool Equals(const JsonObject& a, const JsonObject& b);
    [[nodiscard]] static bool Equals(const JsonValue& a, const JsonValue& b);

    /// Null when absent. An explicit JSON null is reported as absent too.
    [[nodiscard]] static const JsonValue* Find(const JsonObject& object, std::string_view key);

    [[nodiscard]] static bool Has(const JsonObject& object, std::string_view key) {
        return Find(object, key) != nullptr;
    }

    [[nodiscard]] static Result<std::string, UmaFailure> GetString(
        const JsonObject& object, std::string_view key, ErrorCode error_code);
    [[nodiscard]] static Result<std::optional<std::string>, UmaFailure> GetOptionalString(
        const JsonObject& object, std::string_view key, ErrorCode error_code);

    [[nodiscard]] static Result<int64_t, UmaFailure> GetInt64(
        const JsonObject& object, std::string_view key, ErrorCode error_code);
    [[nodiscard]] static Result<std::optional<int64_t>, UmaFailure> GetOptionalInt64(
        const JsonObject& object, std::string_view key, ErrorCode error_code);

    [[nodiscard]] static Result<double, UmaFailure> GetDouble(
        const JsonObject& object, std::string_view key, ErrorCode error_code);

    [[nodiscard]] static Result<bool, UmaFailure> GetBool(
        const JsonObject& object, std::string_view key, ErrorCode error_code);
    [[nodiscard]] static Result<std::optional<bool>, UmaFailure> GetOptionalBool(
        const JsonObject& object, std::string_view key, ErrorCode error_code);

    [[nodiscard]] static Result<JsonObject, UmaFailure> GetObject(
        const JsonObject& object, std::string_view key, ErrorCode error_code);
    [[nodiscard]] static Result<std::optional<JsonObject>, UmaFailure> GetOptionalObject(
        const JsonObject& object, std::string_view key, ErrorCode error_code);

    [[nodiscard]] static Result<std::vector<JsonObject>, UmaFailure> GetObjectList(
        const JsonObject& object, std::string_view key, ErrorCode error_code);
    [[nodiscard]] static Result<std::vector<std::string>, UmaFailure> GetStringList(
        const JsonObject& object, std::string_view key, ErrorCode error_code);

    [[nodiscard]] static Result<int64_t, UmaFailure> AsInt64(
        const JsonValue& value, std::string_view key, ErrorCode error_code);

    static void SetString(JsonObject& object, std::string_view key, std::string_view value);
    static void SetInt64(JsonObject& object, std::string_view key, int64_t value);
    static void SetDouble(JsonObject& object, std::string_view key, double value);
    static void SetBool(JsonObject& object, std::string_view key, bool value);
    static void SetObject(JsonObject& object, std::string_view key, JsonObject value);
    static void SetValue(JsonObject& object, std::string_view key, JsonValue value);
    static void SetObjectList(JsonObject& object, std::string_view key, std::vector<JsonObject> values);
    static void SetStringList(JsonObject& object, std::string_view key, const std::vector<std::string>& values);
    static void SetIntList(JsonObject& object, std::string_view key, const std::vector<int>& values);

private:
    Json() = delete;
};

} // namespace uma::protocol::utilities
