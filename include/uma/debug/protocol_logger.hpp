#pragma once

/**
 * @file protocol_logger.hpp
 * @brief Debug tracing for signature checks, replay rejections, key cache
 * activity and invoice decoding.
 *
 * Private keys are never passed to these helpers. Public keys and signatures
 * are printed as truncated hex.
 *
 * Enable via CMake: -DUMA_DEBUG_PROTOCOL=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace uma::debug {

enum class Component {
    Signing,
    Replay,
    KeyCache,
    Invoice,
    Helper
};

#ifdef UMA_DEBUG_PROTOCOL

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string Truncate(std::string_view text, size_t max_chars = 32) {
    if (text.size() <= max_chars) {
        return std::string(text);
    }
    return std::string(text.substr(0, max_chars)) + "...(" + std::to_string(text.size()) + " chars)";
}

inline const char* ComponentToString(Component component) {
    switch (component) {
        case Component::Signing: return "SIGNING";
        case Component::Replay: return "REPLAY";
        case Component::KeyCache: return "KEYCACHE";
        case Component::Invoice: return "INVOICE";
        case Component::Helper: return "HELPER";
    }
    return "UNKNOWN";
}

#define UMA_LOG_MSG(component, operation, message) \
    do { \
        fprintf(stdout, "[UMA-DEBUG] %s %s %s\n", \
            ::uma::debug::ComponentToString(component), \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define UMA_LOG_VALUE(component, operation, name, value) \
    do { \
        fprintf(stdout, "[UMA-DEBUG] %s %s %s: %s\n", \
            ::uma::debug::ComponentToString(component), \
            operation, \
            name, \
            ::uma::debug::Truncate(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define UMA_LOG_KEY(component, operation, key_name, data) \
    do { \
        fprintf(stdout, "[UMA-DEBUG] %s %s %s: %s\n", \
            ::uma::debug::ComponentToString(component), \
            operation, \
            key_name, \
            ::uma::debug::Truncate(::uma::debug::ToHex(data)).c_str()); \
        fflush(stdout); \
    } while(0)

inline void LogSignatureCheck(std::string_view payload, std::string_view signature, bool valid) {
    UMA_LOG_VALUE(Component::Signing, "VERIFY", "payload", payload);
    UMA_LOG_VALUE(Component::Signing, "VERIFY", "signature", signature);
    UMA_LOG_MSG(Component::Signing, "VERIFY", valid ? "valid" : "INVALID");
}

inline void LogNonceRejected(std::string_view nonce, int64_t timestamp, std::string_view reason) {
    UMA_LOG_VALUE(Component::Replay, "REJECT", "nonce", nonce);
    UMA_LOG_MSG(Component::Replay, "REJECT",
        std::string(reason) + " (timestamp " + std::to_string(timestamp) + ")");
}

inline void LogKeyCacheEvent(std::string_view domain, std::string_view event) {
    UMA_LOG_MSG(Component::KeyCache, std::string(event).c_str(), domain);
}

inline void LogInvoiceDecodeFailure(std::string_view reason) {
    UMA_LOG_MSG(Component::Invoice, "DECODE", reason);
}

#else // !UMA_DEBUG_PROTOCOL

#define UMA_LOG_MSG(component, operation, message) ((void)0)
#define UMA_LOG_VALUE(component, operation, name, value) ((void)0)
#define UMA_LOG_KEY(component, operation, key_name, data) ((void)0)

inline void LogSignatureCheck(std::string_view, std::string_view, bool) {}
inline void LogNonceRejected(std::string_view, int64_t, std::string_view) {}
inline void LogKeyCacheEvent(std::string_view, std::string_view) {}
inline void LogInvoiceDecodeFailure(std::string_view) {}

#endif // UMA_DEBUG_PROTOCOL

} // namespace uma::debug
