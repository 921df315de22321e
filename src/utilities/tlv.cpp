#include "uma/utilities/tlv.hpp"
#include "uma/core/format.hpp"

#include <limits>

namespace uma::protocol::utilities {

    namespace {

        size_t NumberWidth(const int64_t value) {
            if (value >= std::numeric_limits<int8_t>::min() && value <= std::numeric_limits<int8_t>::max()) {
                return 1;
            }
            if (value >= std::numeric_limits<int16_t>::min() && value <= std::numeric_limits<int16_t>::max()) {
                return 2;
            }
            if (value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max()) {
                return 4;
            }
            return 8;
        }

    }

    Result<Unit, UmaFailure> TlvWriter::PutBytes(const uint8_t tag, std::span<const uint8_t> value) {
        if (value.size() > MAX_VALUE_LENGTH) {
            return Result<Unit, UmaFailure>::Err(
                UmaFailure::InvalidInput(compat::format(
                    "TLV value for tag {} is {} bytes, limit is {}", tag, value.size(), MAX_VALUE_LENGTH)));
        }
        buffer_.push_back(tag);
        buffer_.push_back(static_cast<uint8_t>(value.size()));
        buffer_.insert(buffer_.end(), value.begin(), value.end());
        return Result<Unit, UmaFailure>::Ok(unit);
    }

    Result<Unit, UmaFailure> TlvWriter::PutString(const uint8_t tag, std::string_view value) {
        return PutBytes(tag, std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(value.data()), value.size()));
    }

    Result<Unit, UmaFailure> TlvWriter::PutNumber(const uint8_t tag, const int64_t value) {
        const size_t width = NumberWidth(value);
        std::vector<uint8_t> encoded(width);
        auto bits = static_cast<uint64_t>(value);
        for (size_t i = 0; i < width; ++i) {
            encoded[width - 1 - i] = static_cast<uint8_t>(bits & 0xff);
            bits >>= 8;
        }
        return PutBytes(tag, encoded);
    }

    Result<Unit, UmaFailure> TlvWriter::PutBool(const uint8_t tag, const bool value) {
        const uint8_t encoded = value ? 1 : 0;
        return PutBytes(tag, std::span<const uint8_t>(&encoded, 1));
    }

    Result<TlvRecord, UmaFailure> TlvReader::Next() {
        if (offset_ + 2 > data_.size()) {
            return Result<TlvRecord, UmaFailure>::Err(
                UmaFailure::InvoiceStructure(compat::format("Truncated TLV header at offset {}", offset_)));
        }
        const uint8_t tag = data_[offset_];
        const size_t length = data_[offset_ + 1];
        const size_t value_offset = offset_ + 2;
        if (value_offset + length > data_.size()) {
            return Result<TlvRecord, UmaFailure>::Err(
                UmaFailure::InvoiceStructure(compat::format(
                    "TLV record for tag {} declares {} bytes but only {} remain",
                    tag, length, data_.size() - value_offset)));
        }
        offset_ = value_offset + length;
        return Result<TlvRecord, UmaFailure>::Ok(TlvRecord{tag, data_.subspan(value_offset, length)});
    }

    Result<int64_t, UmaFailure> TlvReader::ReadNumber(const TlvRecord& record) {
        const size_t width = record.value.size();
        if (width != 1 && width != 2 && width != 4 && width != 8) {
            return Result<int64_t, UmaFailure>::Err(
                UmaFailure::InvoiceStructure(compat::format(
                    "Invalid number width {} for tag {}", width, record.tag)));
        }
        uint64_t bits = 0;
        for (const uint8_t byte : record.value) {
            bits = (bits << 8) | byte;
        }
        // Sign-extend from the encoded width.
        if (width < 8 && (record.value[0] & 0x80) != 0) {
            bits |= ~uint64_t{0} << (width * 8);
        }
        return Result<int64_t, UmaFailure>::Ok(static_cast<int64_t>(bits));
    }

    Result<bool, UmaFailure> TlvReader::ReadBool(const TlvRecord& record) {
        if (record.value.size() != 1) {
            return Result<bool, UmaFailure>::Err(
                UmaFailure::InvoiceStructure(compat::format("Invalid boolean for tag {}", record.tag)));
        }
        return Result<bool, UmaFailure>::Ok(record.value[0] == 1);
    }

    std::string TlvReader::ReadString(const TlvRecord& record) {
        return std::string(reinterpret_cast<const char*>(record.value.data()), record.value.size());
    }

    std::vector<uint8_t> TlvReader::ReadBytes(const TlvRecord& record) {
        return std::vector<uint8_t>(record.value.begin(), record.value.end());
    }

}
