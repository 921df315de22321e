#include "uma/protocol/uma_protocol_helper.hpp"
#include "uma/core/format.hpp"
#include "uma/crypto/sodium_interop.hpp"
#include "uma/debug/protocol_logger.hpp"
#include "uma/protocol/canonical_payload.hpp"
#include "uma/protocol/constants.hpp"
#include "uma/protocol/signing_engine.hpp"
#include "uma/utilities/json_value.hpp"
#include "uma/utilities/url.hpp"

#include <chrono>
#include <cmath>

namespace uma::protocol {

    using crypto::SodiumInterop;
    using utilities::Json;
    using utilities::Url;

    namespace {

        bool IsLegacyVersion(const std::string_view version) {
            const auto parsed = Version::Parse(version);
            return parsed.IsOk() && parsed.Unwrap().major < 1;
        }

        CounterPartyDataOptions DefaultPayerDataOptions() {
            return CounterPartyData::CreateOptions({
                {std::string(kPayerDataIdentifierKey), true},
                {std::string(kPayerDataComplianceKey), true},
            });
        }

    }

    UmaProtocolHelper::UmaProtocolHelper(
        std::shared_ptr<interfaces::IPublicKeyCache> public_key_cache,
        std::shared_ptr<interfaces::IUmaRequester> requester,
        std::shared_ptr<interfaces::INonceCache> nonce_cache,
        configuration::ProtocolConfig config,
        Clock clock)
        : public_key_cache_(std::move(public_key_cache))
        , requester_(std::move(requester))
        , nonce_cache_(std::move(nonce_cache))
        , config_(config)
        , negotiator_(std::move(config))
        , clock_(std::move(clock)) {
    }

    int64_t UmaProtocolHelper::SystemClock() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::string UmaProtocolHelper::GenerateNonce() {
        return std::to_string(SodiumInterop::GenerateRandomUInt64());
    }

    Result<PubKeyResponse, UmaFailure> UmaProtocolHelper::FetchPublicKeyForVasp(const std::string_view vasp_domain) {
        if (auto cached = public_key_cache_->FetchPublicKeyForVasp(vasp_domain); cached.has_value()) {
            return Result<PubKeyResponse, UmaFailure>::Ok(std::move(*cached));
        }
        const std::string url = compat::format("{}://{}{}",
            Url::SchemeForDomain(vasp_domain), vasp_domain, kPubKeyPath);
        UMA_LOG_VALUE(debug::Component::Helper, "FETCH_KEYS", "url", url);
        UMA_TRY_ASSIGN(const std::string body, requester_->MakeGetRequest(url));
        UMA_TRY_ASSIGN(auto response, PubKeyResponse::FromJson(body));
        public_key_cache_->AddPublicKeyForVasp(vasp_domain, response);
        return Result<PubKeyResponse, UmaFailure>::Ok(std::move(response));
    }

    Result<std::string, UmaFailure> UmaProtocolHelper::GetSignedLnurlpRequestUrl(
        const std::span<const uint8_t> signing_private_key,
        const std::string_view receiver_address,
        const std::string_view sender_vasp_domain,
        const bool is_subject_to_travel_rule,
        std::optional<std::string> uma_version_override) const {
        UmaLnurlpRequest request;
        request.receiver_address = std::string(receiver_address);
        request.nonce = GenerateNonce();
        request.is_subject_to_travel_rule = is_subject_to_travel_rule;
        request.vasp_domain = std::string(sender_vasp_domain);
        request.timestamp = CurrentTimestamp();
        request.uma_version = uma_version_override.value_or(config_.GetCurrentVersion());

        UMA_TRY_ASSIGN(auto signature, SigningEngine::Sign(request.SignablePayload(), signing_private_key));
        return request.SignedWith(std::move(signature)).EncodeToUrl();
    }

    bool UmaProtocolHelper::IsUmaLnurlpQuery(const std::string_view url) const {
        const auto parsed = ParseLnurlpRequest(url);
        if (parsed.IsOk()) {
            return parsed.Unwrap().IsUmaRequest();
        }
        return parsed.UnwrapErr().code == ErrorCode::UnsupportedUmaVersion;
    }

    Result<LnurlpRequest, UmaFailure> UmaProtocolHelper::ParseLnurlpRequest(const std::string_view url) const {
        return LnurlpRequest::DecodeFromUrl(url, negotiator_);
    }

    Result<bool, UmaFailure> UmaProtocolHelper::CheckNonceAndVerify(
        const std::string_view nonce,
        const int64_t timestamp,
        const std::string_view payload,
        const std::string_view signature,
        const PubKeyResponse& pub_key_response) {
        UMA_TRY(nonce_cache_->CheckAndSaveNonce(nonce, timestamp));
        UMA_TRY_ASSIGN(const auto public_key, pub_key_response.GetSigningPublicKey());
        return Result<bool, UmaFailure>::Ok(SigningEngine::Verify(payload, signature, public_key));
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyBackingChain(
        const std::string_view payload,
        const std::optional<std::vector<BackingSignature>>& backing_signatures) {
        if (!backing_signatures.has_value() || backing_signatures->empty()) {
            return Result<bool, UmaFailure>::Ok(true);
        }
        const SigningEngine::PublicKeyLookup lookup =
            [this](const std::string_view domain) -> Result<std::vector<uint8_t>, UmaFailure> {
                UMA_TRY_ASSIGN(const auto keys, FetchPublicKeyForVasp(domain));
                return keys.GetSigningPublicKey();
            };
        return SigningEngine::VerifyBackingSignatures(payload, *backing_signatures, lookup);
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyUmaLnurlpQuerySignature(
        const UmaLnurlpRequest& query,
        const PubKeyResponse& pub_key_response) {
        return CheckNonceAndVerify(
            query.nonce, query.timestamp, query.SignablePayload(), query.signature, pub_key_response);
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyUmaLnurlpQueryBackingSignatures(const UmaLnurlpRequest& query) {
        return VerifyBackingChain(query.SignablePayload(), query.backing_signatures);
    }

    Result<LnurlpResponse, UmaFailure> UmaProtocolHelper::GetLnurlpResponse(
        const LnurlpRequest& query,
        const LnurlpResponseParams& params) const {
        LnurlpResponse response;
        response.callback = params.callback;
        response.min_sendable = params.min_sendable_sats * 1000;
        response.max_sendable = params.max_sendable_sats * 1000;
        response.encoded_metadata = params.encoded_metadata;
        response.comment_chars_allowed = params.comment_chars_allowed;
        response.nostr_pubkey = params.nostr_pubkey;
        if (params.nostr_pubkey.has_value()) {
            response.allows_nostr = true;
        }
        if (!query.IsUmaRequest()) {
            return Result<LnurlpResponse, UmaFailure>::Ok(std::move(response));
        }

        UMA_TRY_ASSIGN(const auto version, negotiator_.SelectResponseVersion(*query.uma_version));
        const bool legacy = IsLegacyVersion(version);

        LnurlComplianceResponse compliance;
        compliance.kyc_status = params.receiver_kyc_status;
        compliance.signature_nonce = GenerateNonce();
        compliance.signature_timestamp = CurrentTimestamp();
        compliance.is_subject_to_travel_rule = params.requires_travel_rule_info;
        compliance.receiver_identifier = query.receiver_address;
        UMA_TRY_ASSIGN(auto signature, SigningEngine::Sign(compliance.SignablePayload(), params.signing_private_key));

        std::vector<Currency> currencies;
        currencies.reserve(params.currency_options.size());
        for (const auto& currency : params.currency_options) {
            currencies.push_back(legacy ? currency.ToV0() : currency.ToV1());
        }

        response.currencies = std::move(currencies);
        response.required_payer_data = params.payer_data_options.value_or(DefaultPayerDataOptions());
        response.compliance = compliance.SignedWith(std::move(signature));
        response.uma_version = version;
        response.settlement_options = params.settlement_options;
        UMA_LOG_VALUE(debug::Component::Helper, "LNURLP_RESPONSE", "version", version);
        return Result<LnurlpResponse, UmaFailure>::Ok(std::move(response));
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyLnurlpResponseSignature(
        const UmaLnurlpResponse& response,
        const PubKeyResponse& pub_key_response) {
        return CheckNonceAndVerify(
            response.compliance.signature_nonce,
            response.compliance.signature_timestamp,
            response.SignablePayload(),
            response.compliance.signature,
            pub_key_response);
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyLnurlpResponseBackingSignatures(
        const UmaLnurlpResponse& response) {
        return VerifyBackingChain(response.SignablePayload(), response.backing_signatures);
    }

    Result<PayRequest, UmaFailure> UmaProtocolHelper::GetPayRequest(const PayRequestParams& params) const {
        CompliancePayerData compliance;
        compliance.utxos = params.payer_utxos;
        compliance.node_pub_key = params.payer_node_pub_key;
        compliance.kyc_status = params.payer_kyc_status;
        compliance.utxo_callback = params.utxo_callback;
        compliance.signature_nonce = GenerateNonce();
        compliance.signature_timestamp = CurrentTimestamp();
        compliance.travel_rule_format = params.travel_rule_format;
        if (params.travel_rule_info.has_value()) {
            UMA_TRY_ASSIGN(compliance.encrypted_travel_rule_info,
                SigningEngine::EncryptCompliancePayload(*params.travel_rule_info, params.receiver_encryption_pub_key));
        }

        const bool legacy = params.receiver_uma_version.has_value() && IsLegacyVersion(*params.receiver_uma_version);
        const std::string payload = legacy
            ? CanonicalPayload::ForPayRequestV0(
                params.payer_identifier, compliance.signature_nonce, compliance.signature_timestamp)
            : CanonicalPayload::ForPayRequest(
                params.payer_identifier, compliance.signature_nonce, compliance.signature_timestamp);
        UMA_TRY_ASSIGN(auto signature, SigningEngine::Sign(payload, params.sending_vasp_private_key));

        const PayerData payer_data = PayerData::Create(
            params.payer_identifier,
            compliance.SignedWith(std::move(signature)),
            params.payer_name,
            params.payer_email);

        if (legacy) {
            if (!params.is_amount_in_receiving_currency) {
                return Result<PayRequest, UmaFailure>::Err(UmaFailure::InvalidInput(
                    "Legacy receivers only accept amounts in the receiving currency"));
            }
            PayRequestV0 request;
            request.currency_code = params.receiving_currency_code;
            request.amount = params.amount;
            request.payer_data = payer_data;
            return Result<PayRequest, UmaFailure>::Ok(PayRequest(std::move(request)));
        }

        PayRequestV1 request;
        if (params.is_amount_in_receiving_currency) {
            request.sending_currency_code = params.receiving_currency_code;
        }
        request.receiving_currency_code = params.receiving_currency_code;
        request.amount = params.amount;
        request.payer_data = payer_data;
        request.requested_payee_data = params.requested_payee_data;
        request.comment = params.comment;
        request.invoice_uuid = params.invoice_uuid;
        request.settlement = params.settlement;
        return Result<PayRequest, UmaFailure>::Ok(PayRequest(std::move(request)));
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyPayReqSignature(
        const PayRequest& request,
        const PubKeyResponse& pub_key_response) {
        UMA_TRY_ASSIGN(const std::string payload, request.SignablePayload());
        const auto& compliance = request.GetPayerData()->Compliance();
        return CheckNonceAndVerify(
            compliance->signature_nonce,
            compliance->signature_timestamp,
            payload,
            compliance->signature,
            pub_key_response);
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyPayReqBackingSignatures(const PayRequest& request) {
        UMA_TRY_ASSIGN(const std::string payload, request.SignablePayload());
        const PayerData* payer_data = request.GetPayerData();
        if (payer_data == nullptr || !payer_data->Compliance().has_value()) {
            return Result<bool, UmaFailure>::Ok(true);
        }
        return VerifyBackingChain(payload, payer_data->Compliance()->backing_signatures);
    }

    Result<PayReqResponse, UmaFailure> UmaProtocolHelper::GetPayReqResponse(
        const PayRequest& request,
        interfaces::IInvoiceCreator& invoice_creator,
        const PayReqResponseParams& params) const {
        const bool is_uma = request.IsUmaRequest();
        if (is_uma) {
            std::vector<std::string> missing;
            if (!params.receiving_currency_code.has_value()) {
                missing.emplace_back("receivingCurrencyCode");
            }
            if (!params.receiving_currency_decimals.has_value()) {
                missing.emplace_back("receivingCurrencyDecimals");
            }
            if (!params.conversion_rate.has_value()) {
                missing.emplace_back("conversionRate");
            }
            if (!params.receiver_fees_millisats.has_value()) {
                missing.emplace_back("receiverFeesMillisats");
            }
            if (!params.utxo_callback.has_value()) {
                missing.emplace_back("utxoCallback");
            }
            if (!missing.empty()) {
                return Result<PayReqResponse, UmaFailure>::Err(UmaFailure::MissingRequiredFields(std::move(missing)));
            }
        }

        const double rate = params.conversion_rate.value_or(1.0);
        const int64_t fees = params.receiver_fees_millisats.value_or(0);
        const auto sending_code = request.SendingCurrencyCode();
        const bool amount_in_msats = request.IsV1() && (!sending_code.has_value() || *sending_code == "SAT");

        int64_t amount_msats = 0;
        int64_t receiving_amount = 0;
        if (amount_in_msats) {
            if (rate <= 0.0) {
                return Result<PayReqResponse, UmaFailure>::Err(
                    UmaFailure::InvalidInput("Conversion rate must be positive"));
            }
            amount_msats = request.Amount();
            receiving_amount = static_cast<int64_t>(std::llround(static_cast<double>(amount_msats - fees) / rate));
        } else {
            amount_msats = static_cast<int64_t>(std::llround(static_cast<double>(request.Amount()) * rate)) + fees;
            receiving_amount = request.Amount();
        }

        std::string metadata = params.metadata;
        if (const PayerData* payer_data = request.GetPayerData(); payer_data != nullptr) {
            UMA_TRY_ASSIGN(const std::string payer_json, Json::Serialize(payer_data->ToJsonObject()));
            metadata += payer_json;
        }
        UMA_TRY_ASSIGN(std::string encoded_invoice,
            invoice_creator.CreateUmaInvoice(amount_msats, metadata, params.payee_identifier));
        UMA_LOG_VALUE(debug::Component::Helper, "PAYREQ_RESPONSE", "amountMsats", std::to_string(amount_msats));

        if (request.IsV0()) {
            PayReqResponseV0 response;
            response.encoded_invoice = std::move(encoded_invoice);
            response.compliance.utxos = params.receiver_channel_utxos;
            response.compliance.node_pub_key = params.receiver_node_pub_key;
            response.compliance.utxo_callback = params.utxo_callback.value_or("");
            response.payment_info.currency_code = params.receiving_currency_code.value_or("");
            response.payment_info.decimals = params.receiving_currency_decimals.value_or(0);
            response.payment_info.multiplier = rate;
            response.payment_info.exchange_fees_millisatoshi = fees;
            return Result<PayReqResponse, UmaFailure>::Ok(PayReqResponse(std::move(response)));
        }

        PayReqResponseV1 response;
        response.encoded_invoice = std::move(encoded_invoice);
        response.disposable = params.disposable;
        response.success_action = params.success_action;
        if (params.receiving_currency_code.has_value()) {
            PayReqResponsePaymentInfo info;
            info.amount = receiving_amount;
            info.currency_code = *params.receiving_currency_code;
            info.decimals = params.receiving_currency_decimals.value_or(0);
            info.multiplier = rate;
            info.exchange_fees_millisatoshi = fees;
            response.payment_info = info;
        }

        const PayeeData base = params.payee_data.value_or(PayeeData());
        if (!is_uma) {
            response.payee_data = base;
            return Result<PayReqResponse, UmaFailure>::Ok(PayReqResponse(std::move(response)));
        }
        if (!params.payee_identifier.has_value()) {
            return Result<PayReqResponse, UmaFailure>::Err(UmaFailure::MissingRequiredFields({"payeeIdentifier"}));
        }
        if (params.signing_private_key.empty()) {
            return Result<PayReqResponse, UmaFailure>::Err(
                UmaFailure::InvalidInput("A signing key is required to answer a UMA pay request"));
        }
        CompliancePayeeData compliance;
        compliance.utxos = params.receiver_channel_utxos;
        compliance.node_pub_key = params.receiver_node_pub_key;
        compliance.utxo_callback = *params.utxo_callback;
        compliance.signature_nonce = GenerateNonce();
        compliance.signature_timestamp = CurrentTimestamp();
        const std::string payload = CanonicalPayload::ForPayReqResponse(
            *request.GetPayerData()->Identifier(),
            *params.payee_identifier,
            compliance.signature_nonce,
            compliance.signature_timestamp);
        UMA_TRY_ASSIGN(auto signature, SigningEngine::Sign(payload, params.signing_private_key));

        PayeeData payee_data = PayeeData::Create(
            compliance.SignedWith(std::move(signature)),
            params.payee_identifier,
            base.Name(),
            base.Email());
        for (const auto& [key, value] : base.Extra().fields()) {
            payee_data.SetExtra(key, value);
        }
        response.payee_data = std::move(payee_data);
        return Result<PayReqResponse, UmaFailure>::Ok(PayReqResponse(std::move(response)));
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyPayReqResponseSignature(
        const PayReqResponse& response,
        const PubKeyResponse& pub_key_response,
        const std::string_view payer_identifier) {
        UMA_TRY_ASSIGN(const std::string payload, response.SignablePayload(payer_identifier));
        const auto& compliance = response.AsV1().payee_data->Compliance();
        return CheckNonceAndVerify(
            compliance->signature_nonce,
            compliance->signature_timestamp,
            payload,
            compliance->signature,
            pub_key_response);
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyPayReqResponseBackingSignatures(
        const PayReqResponse& response,
        const std::string_view payer_identifier) {
        UMA_TRY_ASSIGN(const std::string payload, response.SignablePayload(payer_identifier));
        const auto& payee_data = response.AsV1().payee_data;
        if (!payee_data.has_value() || !payee_data->Compliance().has_value()) {
            return Result<bool, UmaFailure>::Ok(true);
        }
        return VerifyBackingChain(payload, payee_data->Compliance()->backing_signatures);
    }

    Result<PostTransactionCallback, UmaFailure> UmaProtocolHelper::GetPostTransactionCallback(
        std::vector<UtxoWithAmount> utxos,
        const std::string_view vasp_domain,
        const std::span<const uint8_t> signing_private_key) const {
        PostTransactionCallback callback;
        callback.utxos = std::move(utxos);
        callback.vasp_domain = std::string(vasp_domain);
        callback.signature_nonce = GenerateNonce();
        callback.signature_timestamp = CurrentTimestamp();
        UMA_TRY_ASSIGN(auto signature, SigningEngine::Sign(callback.SignablePayload(), signing_private_key));
        return Result<PostTransactionCallback, UmaFailure>::Ok(callback.SignedWith(std::move(signature)));
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyPostTransactionCallbackSignature(
        const PostTransactionCallback& callback,
        const PubKeyResponse& pub_key_response) {
        return CheckNonceAndVerify(
            callback.signature_nonce,
            callback.signature_timestamp,
            callback.SignablePayload(),
            callback.signature,
            pub_key_response);
    }

    PubKeyResponse UmaProtocolHelper::GetPubKeyResponse(
        std::vector<uint8_t> signing_pub_key,
        std::vector<uint8_t> encryption_pub_key,
        const std::optional<int64_t> expiration_timestamp) {
        return PubKeyResponse::FromKeys(
            std::move(signing_pub_key), std::move(encryption_pub_key), expiration_timestamp);
    }

    Result<PubKeyResponse, UmaFailure> UmaProtocolHelper::GetPubKeyResponseFromCertificates(
        std::string signing_cert_chain,
        std::string encryption_cert_chain,
        const std::optional<int64_t> expiration_timestamp) {
        auto response = PubKeyResponse::FromCertificates(
            std::move(signing_cert_chain), std::move(encryption_cert_chain), expiration_timestamp);
        UMA_TRY(response.GetSigningPublicKey());
        UMA_TRY(response.GetEncryptionPublicKey());
        return Result<PubKeyResponse, UmaFailure>::Ok(std::move(response));
    }

    Result<Invoice, UmaFailure> UmaProtocolHelper::CreateUmaInvoice(
        const InvoiceBuilder& builder,
        const std::span<const uint8_t> signing_private_key) {
        UMA_TRY_ASSIGN(const Invoice invoice, builder.Build());
        return SigningEngine::SignInvoice(invoice, signing_private_key);
    }

    Result<bool, UmaFailure> UmaProtocolHelper::VerifyUmaInvoiceSignature(
        const Invoice& invoice,
        const PubKeyResponse& pub_key_response) {
        UMA_TRY_ASSIGN(const auto public_key, pub_key_response.GetSigningPublicKey());
        return SigningEngine::VerifyInvoiceSignature(invoice, public_key);
    }

}
