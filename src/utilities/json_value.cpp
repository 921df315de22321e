#include "uma/utilities/json_value.hpp"
#include "uma/core/format.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <vector>

namespace uma::protocol::utilities {

    namespace {

        constexpr double kMaxExactInteger = 9007199254740992.0;
        constexpr int64_t kMaxExactInt64 = int64_t{1} << 53;

        UmaFailure MissingField(const ErrorCode error_code, std::string_view key) {
            if (error_code == ErrorCode::MissingRequiredUmaParameters) {
                return UmaFailure::MissingRequiredFields({std::string(key)});
            }
            return UmaFailure::Of(error_code, compat::format("Missing required field '{}'", key));
        }

        UmaFailure WrongType(const ErrorCode error_code, std::string_view key, std::string_view expected) {
            return UmaFailure::Of(error_code, compat::format("Field '{}' is not {}", key, expected));
        }

        bool IsNull(const JsonValue& value) {
            return value.kind_case() == JsonValue::kNullValue ||
                   value.kind_case() == JsonValue::KIND_NOT_SET;
        }

        bool IsExactInteger(const double number) {
            return std::isfinite(number) && std::trunc(number) == number &&
                   std::fabs(number) <= kMaxExactInteger;
        }

        void WriteString(std::string& out, const std::string& text) {
            out.push_back('"');
            for (const char c : text) {
                switch (c) {
                    case '"': out.append("\\\""); break;
                    case '\\': out.append("\\\\"); break;
                    case '\b': out.append("\\b"); break;
                    case '\f': out.append("\\f"); break;
                    case '\n': out.append("\\n"); break;
                    case '\r': out.append("\\r"); break;
                    case '\t': out.append("\\t"); break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20) {
                            out.append(compat::format("\\u{:04x}", static_cast<unsigned>(c)));
                        } else {
                            out.push_back(c);
                        }
                }
            }
            out.push_back('"');
        }

        Result<Unit, UmaFailure> WriteValue(std::string& out, const JsonValue& value);

        Result<Unit, UmaFailure> WriteObject(std::string& out, const JsonObject& object) {
            std::vector<const std::string*> keys;
            keys.reserve(object.fields().size());
            for (const auto& field : object.fields()) {
                keys.push_back(&field.first);
            }
            std::sort(keys.begin(), keys.end(),
                [](const std::string* a, const std::string* b) { return *a < *b; });
            out.push_back('{');
            bool first = true;
            for (const std::string* key : keys) {
                if (!first) {
                    out.push_back(',');
                }
                first = false;
                WriteString(out, *key);
                out.push_back(':');
                UMA_TRY(WriteValue(out, object.fields().at(*key)));
            }
            out.push_back('}');
            return Result<Unit, UmaFailure>::Ok(unit);
        }

        // Integral numbers are written without an exponent.
        Result<Unit, UmaFailure> WriteValue(std::string& out, const JsonValue& value) {
            switch (value.kind_case()) {
                case JsonValue::kNumberValue: {
                    const double number = value.number_value();
                    if (!std::isfinite(number)) {
                        return Result<Unit, UmaFailure>::Err(
                            UmaFailure::Internal("JSON cannot represent a non-finite number"));
                    }
                    if (IsExactInteger(number)) {
                        out.append(compat::format("{}", static_cast<int64_t>(number)));
                    } else {
                        out.append(compat::format("{}", number));
                    }
                    break;
                }
                case JsonValue::kStringValue:
                    WriteString(out, value.string_value());
                    break;
                case JsonValue::kBoolValue:
                    out.append(value.bool_value() ? "true" : "false");
                    break;
                case JsonValue::kStructValue:
                    UMA_TRY(WriteObject(out, value.struct_value()));
                    break;
                case JsonValue::kListValue: {
                    out.push_back('[');
                    bool first = true;
                    for (const auto& item : value.list_value().values()) {
                        if (!first) {
                            out.push_back(',');
                        }
                        first = false;
                        UMA_TRY(WriteValue(out, item));
                    }
                    out.push_back(']');
                    break;
                }
                case JsonValue::kNullValue:
                case JsonValue::KIND_NOT_SET:
                    out.append("null");
                    break;
            }
            return Result<Unit, UmaFailure>::Ok(unit);
        }

    }

    Result<JsonObject, UmaFailure> Json::ParseObject(std::string_view text, const ErrorCode error_code) {
        JsonObject object;
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;
        const auto status = google::protobuf::util::JsonStringToMessage(
            std::string(text), &object, options);
        if (!status.ok()) {
            return Result<JsonObject, UmaFailure>::Err(
                UmaFailure::Of(error_code, compat::format("Invalid JSON object: {}", status.ToString())));
        }
        return Result<JsonObject, UmaFailure>::Ok(std::move(object));
    }

    Result<std::string, UmaFailure> Json::Serialize(const JsonObject& object) {
        std::string output;
        UMA_TRY(WriteObject(output, object));
        return Result<std::string, UmaFailure>::Ok(std::move(output));
    }

    Result<std::string, UmaFailure> Json::SerializeValue(const JsonValue& value) {
        std::string output;
        UMA_TRY(WriteValue(output, value));
        return Result<std::string, UmaFailure>::Ok(std::move(output));
    }

    bool Json::Equals(const JsonObject& a, const JsonObject& b) {
        return google::protobuf::util::MessageDifferencer::Equals(a, b);
    }

    bool Json::Equals(const JsonValue& a, const JsonValue& b) {
        return google::protobuf::util::MessageDifferencer::Equals(a, b);
    }

    const JsonValue* Json::Find(const JsonObject& object, std::string_view key) {
        const auto it = object.fields().find(std::string(key));
        if (it == object.fields().end() || IsNull(it->second)) {
            return nullptr;
        }
        return &it->second;
    }

    // ----------------------------------------------------------------------------
    // Getters
    // ----------------------------------------------------------------------------

    Result<std::string, UmaFailure> Json::GetString(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        const JsonValue* value = Find(object, key);
        if (value == nullptr) {
            return Result<std::string, UmaFailure>::Err(MissingField(error_code, key));
        }
        if (value->kind_case() != JsonValue::kStringValue) {
            return Result<std::string, UmaFailure>::Err(WrongType(error_code, key, "a string"));
        }
        return Result<std::string, UmaFailure>::Ok(value->string_value());
    }

    Result<std::optional<std::string>, UmaFailure> Json::GetOptionalString(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        if (!Has(object, key)) {
            return Result<std::optional<std::string>, UmaFailure>::Ok(std::nullopt);
        }
        UMA_TRY_ASSIGN(auto value, GetString(object, key, error_code));
        return Result<std::optional<std::string>, UmaFailure>::Ok(std::move(value));
    }

    Result<int64_t, UmaFailure> Json::AsInt64(
        const JsonValue& value, std::string_view key, const ErrorCode error_code) {
        if (value.kind_case() == JsonValue::kNumberValue) {
            const double number = value.number_value();
            if (!IsExactInteger(number)) {
                return Result<int64_t, UmaFailure>::Err(WrongType(error_code, key, "an integer"));
            }
            return Result<int64_t, UmaFailure>::Ok(static_cast<int64_t>(number));
        }
        if (value.kind_case() == JsonValue::kStringValue) {
            const std::string& text = value.string_value();
            int64_t parsed = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
            if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
                return Result<int64_t, UmaFailure>::Err(WrongType(error_code, key, "an integer"));
            }
            return Result<int64_t, UmaFailure>::Ok(parsed);
        }
        return Result<int64_t, UmaFailure>::Err(WrongType(error_code, key, "an integer"));
    }

    Result<int64_t, UmaFailure> Json::GetInt64(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        const JsonValue* value = Find(object, key);
        if (value == nullptr) {
            return Result<int64_t, UmaFailure>::Err(MissingField(error_code, key));
        }
        return AsInt64(*value, key, error_code);
    }

    Result<std::optional<int64_t>, UmaFailure> Json::GetOptionalInt64(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        if (!Has(object, key)) {
            return Result<std::optional<int64_t>, UmaFailure>::Ok(std::nullopt);
        }
        UMA_TRY_ASSIGN(const int64_t value, GetInt64(object, key, error_code));
        return Result<std::optional<int64_t>, UmaFailure>::Ok(value);
    }

    Result<double, UmaFailure> Json::GetDouble(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        const JsonValue* value = Find(object, key);
        if (value == nullptr) {
            return Result<double, UmaFailure>::Err(MissingField(error_code, key));
        }
        if (value->kind_case() != JsonValue::kNumberValue) {
            return Result<double, UmaFailure>::Err(WrongType(error_code, key, "a number"));
        }
        return Result<double, UmaFailure>::Ok(value->number_value());
    }

    Result<bool, UmaFailure> Json::GetBool(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        const JsonValue* value = Find(object, key);
        if (value == nullptr) {
            return Result<bool, UmaFailure>::Err(MissingField(error_code, key));
        }
        if (value->kind_case() == JsonValue::kBoolValue) {
            return Result<bool, UmaFailure>::Ok(value->bool_value());
        }
        if (value->kind_case() == JsonValue::kStringValue) {
            if (value->string_value() == "true") {
                return Result<bool, UmaFailure>::Ok(true);
            }
            if (value->string_value() == "false") {
                return Result<bool, UmaFailure>::Ok(false);
            }
        }
        return Result<bool, UmaFailure>::Err(WrongType(error_code, key, "a boolean"));
    }

    Result<std::optional<bool>, UmaFailure> Json::GetOptionalBool(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        if (!Has(object, key)) {
            return Result<std::optional<bool>, UmaFailure>::Ok(std::nullopt);
        }
        UMA_TRY_ASSIGN(const bool value, GetBool(object, key, error_code));
        return Result<std::optional<bool>, UmaFailure>::Ok(value);
    }

    Result<JsonObject, UmaFailure> Json::GetObject(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        const JsonValue* value = Find(object, key);
        if (value == nullptr) {
            return Result<JsonObject, UmaFailure>::Err(MissingField(error_code, key));
        }
        if (value->kind_case() != JsonValue::kStructValue) {
            return Result<JsonObject, UmaFailure>::Err(WrongType(error_code, key, "an object"));
        }
        return Result<JsonObject, UmaFailure>::Ok(value->struct_value());
    }

    Result<std::optional<JsonObject>, UmaFailure> Json::GetOptionalObject(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        if (!Has(object, key)) {
            return Result<std::optional<JsonObject>, UmaFailure>::Ok(std::nullopt);
        }
        UMA_TRY_ASSIGN(auto value, GetObject(object, key, error_code));
        return Result<std::optional<JsonObject>, UmaFailure>::Ok(std::move(value));
    }

    Result<std::vector<JsonObject>, UmaFailure> Json::GetObjectList(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        const JsonValue* value = Find(object, key);
        if (value == nullptr) {
            return Result<std::vector<JsonObject>, UmaFailure>::Err(MissingField(error_code, key));
        }
        if (value->kind_case() != JsonValue::kListValue) {
            return Result<std::vector<JsonObject>, UmaFailure>::Err(WrongType(error_code, key, "a list"));
        }
        std::vector<JsonObject> items;
        items.reserve(static_cast<size_t>(value->list_value().values_size()));
        for (const auto& item : value->list_value().values()) {
            if (item.kind_case() != JsonValue::kStructValue) {
                return Result<std::vector<JsonObject>, UmaFailure>::Err(
                    WrongType(error_code, key, "a list of objects"));
            }
            items.push_back(item.struct_value());
        }
        return Result<std::vector<JsonObject>, UmaFailure>::Ok(std::move(items));
    }

    Result<std::vector<std::string>, UmaFailure> Json::GetStringList(
        const JsonObject& object, std::string_view key, const ErrorCode error_code) {
        const JsonValue* value = Find(object, key);
        if (value == nullptr) {
            return Result<std::vector<std::string>, UmaFailure>::Err(MissingField(error_code, key));
        }
        if (value->kind_case() != JsonValue::kListValue) {
            return Result<std::vector<std::string>, UmaFailure>::Err(WrongType(error_code, key, "a list"));
        }
        std::vector<std::string> items;
        items.reserve(static_cast<size_t>(value->list_value().values_size()));
        for (const auto& item : value->list_value().values()) {
            if (item.kind_case() != JsonValue::kStringValue) {
                return Result<std::vector<std::string>, UmaFailure>::Err(
                    WrongType(error_code, key, "a list of strings"));
            }
            items.push_back(item.string_value());
        }
        return Result<std::vector<std::string>, UmaFailure>::Ok(std::move(items));
    }

    // ----------------------------------------------------------------------------
    // Setters
    // ----------------------------------------------------------------------------

    void Json::SetString(JsonObject& object, std::string_view key, std::string_view value) {
        (*object.mutable_fields())[std::string(key)].set_string_value(std::string(value));
    }

    void Json::SetInt64(JsonObject& object, std::string_view key, const int64_t value) {
        auto& field = (*object.mutable_fields())[std::string(key)];
        if (value > kMaxExactInt64 || value < -kMaxExactInt64) {
            field.set_string_value(std::to_string(value));
        } else {
            field.set_number_value(static_cast<double>(value));
        }
    }

    void Json::SetDouble(JsonObject& object, std::string_view key, const double value) {
        (*object.mutable_fields())[std::string(key)].set_number_value(value);
    }

    void Json::SetBool(JsonObject& object, std::string_view key, const bool value) {
        (*object.mutable_fields())[std::string(key)].set_bool_value(value);
    }

    void Json::SetObject(JsonObject& object, std::string_view key, JsonObject value) {
        *(*object.mutable_fields())[std::string(key)].mutable_struct_value() = std::move(value);
    }

    void Json::SetValue(JsonObject& object, std::string_view key, JsonValue value) {
        (*object.mutable_fields())[std::string(key)] = std::move(value);
    }

    void Json::SetObjectList(JsonObject& object, std::string_view key, std::vector<JsonObject> values) {
        JsonList* list = (*object.mutable_fields())[std::string(key)].mutable_list_value();
        list->clear_values();
        for (auto& value : values) {
            *list->add_values()->mutable_struct_value() = std::move(value);
        }
    }

    void Json::SetStringList(JsonObject& object, std::string_view key, const std::vector<std::string>& values) {
        JsonList* list = (*object.mutable_fields())[std::string(key)].mutable_list_value();
        list->clear_values();
        for (const auto& value : values) {
            list->add_values()->set_string_value(value);
        }
    }

    void Json::SetIntList(JsonObject& object, std::string_view key, const std::vector<int>& values) {
        JsonList* list = (*object.mutable_fields())[std::string(key)].mutable_list_value();
        list->clear_values();
        for (const int value : values) {
            list->add_values()->set_number_value(static_cast<double>(value));
        }
    }

}
