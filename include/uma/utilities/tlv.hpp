#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol::utilities {

/// One `[tag][length][value]` record. The value aliases the reader's buffer.
struct TlvRecord {
    uint8_t tag;
    std::span<const uint8_t> value;
};

/**
 * @brief Appends tag-length-value records to a growing byte buffer
 *
 * Lengths are a single byte, so every value is limited to 255 bytes; a
 * larger value is rejected instead of being truncated. Integers use the
 * smallest big-endian width among 1, 2, 4 and 8 bytes that holds the value.
 */
class TlvWriter {
public:
    static constexpr size_t MAX_VALUE_LENGTH = 255;

    Result<Unit, UmaFailure> PutString(uint8_t tag, std::string_view value);
    Result<Unit, UmaFailure> PutNumber(uint8_t tag, int64_t value);
    Result<Unit, UmaFailure> PutBool(uint8_t tag, bool value);
    Result<Unit, UmaFailure> PutBytes(uint8_t tag, std::span<const uint8_t> value);

    [[nodiscard]] const std::vector<uint8_t>& Bytes() const noexcept { return buffer_; }
    [[nodiscard]] std::vector<uint8_t> TakeBytes() noexcept { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * @brief Iterates the records of a TLV buffer
 *
 * Records may appear in any order; the reader only checks that every
 * declared length fits in the remaining input. Malformed input is reported
 * as CodecFailureKind::Structure.
 */
class TlvReader {
public:
    explicit TlvReader(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] bool HasNext() const noexcept { return offset_ < data_.size(); }

    [[nodiscard]] Result<TlvRecord, UmaFailure> Next();

    /// Width is taken from the record length: 1, 2, 4 or 8 bytes, big-endian.
    [[nodiscard]] static Result<int64_t, UmaFailure> ReadNumber(const TlvRecord& record);
    [[nodiscard]] static Result<bool, UmaFailure> ReadBool(const TlvRecord& record);
    [[nodiscard]] static std::string ReadString(const TlvRecord& record);
    [[nodiscard]] static std::vector<uint8_t> ReadBytes(const TlvRecord& record);

private:
    std::span<const uint8_t> data_;
    size_t offset_ = 0;
};

} // namespace uma::protocol::utilities
