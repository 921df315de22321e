#include "uma/protocol/counter_party_data.hpp"

namespace uma::protocol {

    using utilities::Json;
    using utilities::JsonObject;

    CounterPartyDataOptions CounterPartyData::CreateOptions(const std::map<std::string, bool>& fields) {
        CounterPartyDataOptions options;
        for (const auto& [name, mandatory] : fields) {
            options.emplace(name, CounterPartyDataOption{mandatory});
        }
        return options;
    }

    JsonObject CounterPartyData::ToJsonObject(const CounterPartyDataOptions& options) {
        JsonObject object;
        for (const auto& [name, option] : options) {
            JsonObject entry;
            Json::SetBool(entry, "mandatory", option.mandatory);
            Json::SetObject(object, name, std::move(entry));
        }
        return object;
    }

    Result<CounterPartyDataOptions, UmaFailure> CounterPartyData::FromJsonObject(
        const JsonObject& object, const ErrorCode error_code) {
        CounterPartyDataOptions options;
        for (const auto& [name, value] : object.fields()) {
            if (value.kind_case() != utilities::JsonValue::kStructValue) {
                return Result<CounterPartyDataOptions, UmaFailure>::Err(
                    UmaFailure::Of(error_code, "Counterparty data option '" + name + "' is not an object"));
            }
            UMA_TRY_ASSIGN(const bool mandatory, Json::GetBool(value.struct_value(), "mandatory", error_code));
            options.emplace(name, CounterPartyDataOption{mandatory});
        }
        return Result<CounterPartyDataOptions, UmaFailure>::Ok(std::move(options));
    }

    Result<std::optional<CounterPartyDataOptions>, UmaFailure> CounterPartyData::OptionalFromJson(
        const JsonObject& parent, std::string_view key, const ErrorCode error_code) {
        using OptionalResult = Result<std::optional<CounterPartyDataOptions>, UmaFailure>;
        UMA_TRY_ASSIGN(const auto object, Json::GetOptionalObject(parent, key, error_code));
        if (!object.has_value()) {
            return OptionalResult::Ok(std::nullopt);
        }
        UMA_TRY_ASSIGN(auto options, FromJsonObject(*object, error_code));
        return OptionalResult::Ok(std::move(options));
    }

    std::string CounterPartyData::EncodeCompact(const CounterPartyDataOptions& options) {
        std::string encoded;
        for (const auto& [name, option] : options) {
            if (!encoded.empty()) {
                encoded.push_back(',');
            }
            encoded += name;
            encoded.push_back(':');
            encoded.push_back(option.mandatory ? '1' : '0');
        }
        return encoded;
    }

    CounterPartyDataOptions CounterPartyData::DecodeCompact(std::string_view encoded) {
        CounterPartyDataOptions options;
        size_t start = 0;
        while (start <= encoded.size()) {
            auto end = encoded.find(',', start);
            if (end == std::string_view::npos) {
                end = encoded.size();
            }
            const std::string_view entry = encoded.substr(start, end - start);
            const auto colon = entry.find(':');
            if (colon != std::string_view::npos && entry.find(':', colon + 1) == std::string_view::npos) {
                options.emplace(
                    std::string(entry.substr(0, colon)),
                    CounterPartyDataOption{entry.substr(colon + 1) == "1"});
            }
            start = end + 1;
        }
        return options;
    }

}
