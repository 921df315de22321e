#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol::utilities {

struct Bech32Data {
    std::string hrp;
    std::vector<uint8_t> data;
};

/**
 * @brief BIP-173 bech32 text encoding of arbitrary byte strings
 *
 * Payload bytes are regrouped into 5-bit words before encoding. No overall
 * length limit is applied since invoice tokens exceed the 90 character cap
 * meant for segwit addresses.
 *
 * Decode failures are reported as invoice codec failures: a checksum
 * mismatch is CodecFailureKind::Checksum, anything wrong with the shape of
 * the string (mixed case, bad characters, missing separator, bad padding)
 * is CodecFailureKind::Structure.
 */
class Bech32 {
public:
    /// Output is lower case.
    [[nodiscard]] static std::string Encode(std::string_view hrp, std::span<const uint8_t> data);

    /// Accepts all-lower or all-upper input; the returned hrp is lower case.
    [[nodiscard]] static Result<Bech32Data, UmaFailure> Decode(std::string_view text);

    [[nodiscard]] static std::vector<uint8_t> ConvertBits8To5(std::span<const uint8_t> data);

    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure> ConvertBits5To8(
        std::span<const uint8_t> words);

private:
    static constexpr std::string_view CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
    static constexpr size_t CHECKSUM_LENGTH = 6;
    static constexpr char SEPARATOR = '1';

    static uint32_t PolyMod(std::span<const uint8_t> values);
    static std::vector<uint8_t> ExpandHrp(std::string_view hrp);
    static std::vector<uint8_t> CreateChecksum(std::string_view hrp, std::span<const uint8_t> words);
    static bool VerifyChecksum(std::string_view hrp, std::span<const uint8_t> words);

    Bech32() = delete;
};

} // namespace uma::protocol::utilities
