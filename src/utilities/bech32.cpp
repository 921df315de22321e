#include "uma/utilities/bech32.hpp"
#include "uma/core/format.hpp"

#include <array>
#include <cctype>

namespace uma::protocol::utilities {

    namespace {

        constexpr std::array<uint32_t, 5> kGenerator = {
            0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
        };

    }

    uint32_t Bech32::PolyMod(std::span<const uint8_t> values) {
        uint32_t chk = 1;
        for (const uint8_t value : values) {
            const uint32_t top = chk >> 25;
            chk = ((chk & 0x1ffffff) << 5) ^ value;
            for (size_t i = 0; i < kGenerator.size(); ++i) {
                if ((top >> i) & 1) {
                    chk ^= kGenerator[i];
                }
            }
        }
        return chk;
    }

    std::vector<uint8_t> Bech32::ExpandHrp(std::string_view hrp) {
        std::vector<uint8_t> expanded;
        expanded.reserve(hrp.size() * 2 + 1);
        for (const char c : hrp) {
            expanded.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) >> 5));
        }
        expanded.push_back(0);
        for (const char c : hrp) {
            expanded.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) & 0x1f));
        }
        return expanded;
    }

    std::vector<uint8_t> Bech32::CreateChecksum(std::string_view hrp, std::span<const uint8_t> words) {
        std::vector<uint8_t> values = ExpandHrp(hrp);
        values.insert(values.end(), words.begin(), words.end());
        values.insert(values.end(), CHECKSUM_LENGTH, 0);
        const uint32_t mod = PolyMod(values) ^ 1;
        std::vector<uint8_t> checksum(CHECKSUM_LENGTH);
        for (size_t i = 0; i < CHECKSUM_LENGTH; ++i) {
            checksum[i] = static_cast<uint8_t>((mod >> (5 * (5 - i))) & 0x1f);
        }
        return checksum;
    }

    bool Bech32::VerifyChecksum(std::string_view hrp, std::span<const uint8_t> words) {
        std::vector<uint8_t> values = ExpandHrp(hrp);
        values.insert(values.end(), words.begin(), words.end());
        return PolyMod(values) == 1;
    }

    std::vector<uint8_t> Bech32::ConvertBits8To5(std::span<const uint8_t> data) {
        std::vector<uint8_t> words;
        words.reserve((data.size() * 8 + 4) / 5);
        uint32_t accumulator = 0;
        int bits = 0;
        for (const uint8_t byte : data) {
            accumulator = (accumulator << 8) | byte;
            bits += 8;
            while (bits >= 5) {
                bits -= 5;
                words.push_back(static_cast<uint8_t>((accumulator >> bits) & 0x1f));
            }
        }
        if (bits > 0) {
            words.push_back(static_cast<uint8_t>((accumulator << (5 - bits)) & 0x1f));
        }
        return words;
    }

    Result<std::vector<uint8_t>, UmaFailure> Bech32::ConvertBits5To8(std::span<const uint8_t> words) {
        std::vector<uint8_t> bytes;
        bytes.reserve(words.size() * 5 / 8);
        uint32_t accumulator = 0;
        int bits = 0;
        for (const uint8_t word : words) {
            if (word > 0x1f) {
                return Result<std::vector<uint8_t>, UmaFailure>::Err(
                    UmaFailure::InvoiceStructure("Bech32 word out of range"));
            }
            accumulator = ((accumulator << 5) | word) & 0xfff;
            bits += 5;
            if (bits >= 8) {
                bits -= 8;
                bytes.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xff));
            }
        }
        if (bits >= 5 || ((accumulator << (8 - bits)) & 0xff) != 0) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::InvoiceStructure("Invalid bech32 padding"));
        }
        return Result<std::vector<uint8_t>, UmaFailure>::Ok(std::move(bytes));
    }

    std::string Bech32::Encode(std::string_view hrp, std::span<const uint8_t> data) {
        std::string lower_hrp;
        lower_hrp.reserve(hrp.size());
        for (const char c : hrp) {
            lower_hrp.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        const std::vector<uint8_t> words = ConvertBits8To5(data);
        const std::vector<uint8_t> checksum = CreateChecksum(lower_hrp, words);

        std::string encoded = lower_hrp;
        encoded.reserve(lower_hrp.size() + 1 + words.size() + checksum.size());
        encoded.push_back(SEPARATOR);
        for (const uint8_t word : words) {
            encoded.push_back(CHARSET[word]);
        }
        for (const uint8_t word : checksum) {
            encoded.push_back(CHARSET[word]);
        }
        return encoded;
    }

    Result<Bech32Data, UmaFailure> Bech32::Decode(std::string_view text) {
        bool has_lower = false;
        bool has_upper = false;
        for (const char c : text) {
            const auto uc = static_cast<unsigned char>(c);
            if (uc < 33 || uc > 126) {
                return Result<Bech32Data, UmaFailure>::Err(
                    UmaFailure::InvoiceStructure("Bech32 string contains invalid characters"));
            }
            has_lower = has_lower || std::islower(uc);
            has_upper = has_upper || std::isupper(uc);
        }
        if (has_lower && has_upper) {
            return Result<Bech32Data, UmaFailure>::Err(
                UmaFailure::InvoiceStructure("Bech32 string mixes upper and lower case"));
        }

        const auto separator = text.rfind(SEPARATOR);
        if (separator == std::string_view::npos || separator == 0 ||
            separator + 1 + CHECKSUM_LENGTH > text.size()) {
            return Result<Bech32Data, UmaFailure>::Err(
                UmaFailure::InvoiceStructure("Bech32 separator misplaced or missing"));
        }

        std::string hrp;
        hrp.reserve(separator);
        for (const char c : text.substr(0, separator)) {
            hrp.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }

        std::vector<uint8_t> words;
        words.reserve(text.size() - separator - 1);
        for (const char c : text.substr(separator + 1)) {
            const auto index = CHARSET.find(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            if (index == std::string_view::npos) {
                return Result<Bech32Data, UmaFailure>::Err(
                    UmaFailure::InvoiceStructure(compat::format("Invalid bech32 character '{}'", c)));
            }
            words.push_back(static_cast<uint8_t>(index));
        }

        if (!VerifyChecksum(hrp, words)) {
            return Result<Bech32Data, UmaFailure>::Err(
                UmaFailure::InvoiceChecksum("Bech32 checksum mismatch"));
        }

        words.resize(words.size() - CHECKSUM_LENGTH);
        UMA_TRY_ASSIGN(auto bytes, ConvertBits5To8(words));
        return Result<Bech32Data, UmaFailure>::Ok(Bech32Data{std::move(hrp), std::move(bytes)});
    }

}
