#include <catch2/catch_test_macros.hpp>
#include "uma/protocol/invoice.hpp"
#include "uma/protocol/signing_engine.hpp"
#include "uma/crypto/sodium_interop.hpp"
#include "helpers/test_fixtures.hpp"
using namespace uma::protocol;
using namespace uma::protocol::crypto;
using namespace uma::protocol::test_helpers;

namespace {

InvoiceBuilder SampleBuilder() {
    InvoiceBuilder builder;
    builder.SetReceiverUma("$foo@bar.com")
        .SetInvoiceUuid("c7c07fec-cf00-431c-916f-6c13fc4b69f9")
        .SetAmount(1000)
        .SetReceivingCurrency(InvoiceCurrency{"USD", "US Dollar", "$", 2})
        .SetExpiration(1000000)
        .SetIsSubjectToTravelRule(true)
        .SetRequiredPayerData(CounterPartyData::CreateOptions({{"name", false}, {"email", false},
            {"compliance", true}, {"identifier", true}}))
        .SetUmaVersion("0.3")
        .SetCommentCharsAllowed(18)
        .SetSenderUma("$foo@bar.com")
        .SetInvoiceLimit(100)
        .SetKycStatus(KycStatus::Verified)
        .SetCallback("https://example.com/callback");
    return builder;
}

} // namespace

TEST_CASE("Invoice - Bech32 round trip", "[invoice][codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Every field survives encoding") {
        auto built = SampleBuilder().Build();
        REQUIRE(built.IsOk());
        const auto invoice = std::move(built).Unwrap();
        auto token = invoice.ToBech32();
        REQUIRE(token.IsOk());
        REQUIRE(token.Unwrap().rfind("uma1", 0) == 0);

        auto decoded = Invoice::FromBech32(token.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == invoice);
        REQUIRE(decoded.Unwrap().ReceivingCurrency().symbol == "$");
        REQUIRE(decoded.Unwrap().GetKycStatus() == KycStatus::Verified);
        REQUIRE(decoded.Unwrap().RequiredPayerData()->at("compliance").mandatory);
    }

    SECTION("Optional fields may be absent") {
        InvoiceBuilder builder;
        builder.SetReceiverUma("$foo@bar.com")
            .SetInvoiceUuid("uuid")
            .SetAmount(1)
            .SetReceivingCurrency(InvoiceCurrency{"SAT", "Satoshi", "sat", 0})
            .SetExpiration(2)
            .SetIsSubjectToTravelRule(false)
            .SetUmaVersion("1.0")
            .SetCallback("https://example.com/cb");
        const auto invoice = builder.Build().Unwrap();
        const auto decoded = Invoice::FromBech32(invoice.ToBech32().Unwrap()).Unwrap();
        REQUIRE_FALSE(decoded.SenderUma().has_value());
        REQUIRE_FALSE(decoded.InvoiceLimit().has_value());
        REQUIRE_FALSE(decoded.Signature().has_value());
        REQUIRE(decoded == invoice);
    }
}

TEST_CASE("Invoice - Decode failures", "[invoice][codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto token = SampleBuilder().Build().Unwrap().ToBech32().Unwrap();

    SECTION("Flipped character fails the checksum") {
        std::string corrupted = token;
        const size_t index = corrupted.size() / 2;
        corrupted[index] = corrupted[index] == 'q' ? 'p' : 'q';
        auto result = Invoice::FromBech32(corrupted);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().code == ErrorCode::InvalidInvoice);
        REQUIRE(result.UnwrapErr().codec_failure == CodecFailureKind::Checksum);
    }

    SECTION("Foreign prefix is a structure failure") {
        const auto tlv = SampleBuilder().Build().Unwrap().ToTlv().Unwrap();
        const auto foreign = uma::protocol::utilities::Bech32::Encode("lnbc", tlv);
        auto result = Invoice::FromBech32(foreign);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().codec_failure == CodecFailureKind::Structure);
    }

    SECTION("Missing fields are all reported") {
        InvoiceBuilder builder;
        builder.SetReceiverUma("$foo@bar.com").SetAmount(5);
        auto result = builder.Build();
        REQUIRE(result.IsErr());
        const auto& failure = result.UnwrapErr();
        REQUIRE(failure.codec_failure == CodecFailureKind::MissingField);
        REQUIRE(failure.missing_fields == std::vector<std::string>{
            "invoiceUUID", "receivingCurrency", "expiration", "isSubjectToTravelRule", "umaVersion", "callback"});
    }

    SECTION("Unknown tags are skipped") {
        auto tlv = SampleBuilder().Build().Unwrap().ToTlv().Unwrap();
        tlv.insert(tlv.end(), {0x50, 0x02, 0xAB, 0xCD});
        auto result = Invoice::FromTlv(tlv);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == SampleBuilder().Build().Unwrap());
    }
}

TEST_CASE("Invoice - Signatures", "[invoice][signing]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto invoice = SampleBuilder().Build().Unwrap();

    SECTION("Signature covers every field but itself") {
        auto signed_invoice = SigningEngine::SignInvoice(invoice, PrivateKey());
        REQUIRE(signed_invoice.IsOk());
        const auto& value = signed_invoice.Unwrap();
        REQUIRE(value.Signature().has_value());
        REQUIRE(value.SignablePayload().Unwrap() == invoice.SignablePayload().Unwrap());

        const auto decoded = Invoice::FromBech32(value.ToBech32().Unwrap()).Unwrap();
        REQUIRE(decoded.Signature() == value.Signature());
        REQUIRE(SigningEngine::VerifyInvoiceSignature(decoded, PublicKey()).Unwrap());
    }

    SECTION("Tampered fields invalidate the signature") {
        const auto signed_invoice = SigningEngine::SignInvoice(invoice, PrivateKey()).Unwrap();
        auto builder = SampleBuilder();
        builder.SetAmount(1001).SetSignature(*signed_invoice.Signature());
        const auto tampered = builder.Build().Unwrap();
        REQUIRE_FALSE(SigningEngine::VerifyInvoiceSignature(tampered, PublicKey()).Unwrap());
    }

    SECTION("Unsigned invoices cannot be verified") {
        auto result = SigningEngine::VerifyInvoiceSignature(invoice, PublicKey());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().missing_fields == std::vector<std::string>{"signature"});
    }
}
