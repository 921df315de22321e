#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/configuration/protocol_config.hpp"
#include "uma/interfaces/i_invoice_creator.hpp"
#include "uma/interfaces/i_nonce_cache.hpp"
#include "uma/interfaces/i_public_key_cache.hpp"
#include "uma/interfaces/i_uma_requester.hpp"
#include "uma/protocol/invoice.hpp"
#include "uma/protocol/lnurlp_request.hpp"
#include "uma/protocol/lnurlp_response.hpp"
#include "uma/protocol/pay_req_response.hpp"
#include "uma/protocol/pay_request.hpp"
#include "uma/protocol/post_transaction_callback.hpp"
#include "uma/protocol/pub_key_response.hpp"
#include "uma/protocol/version.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

struct LnurlpResponseParams {
    std::span<const uint8_t> signing_private_key;
    bool requires_travel_rule_info = false;
    std::string callback;
    std::string encoded_metadata;
    int64_t min_sendable_sats = 0;
    int64_t max_sendable_sats = 0;
    /// Defaults to identifier and compliance, both mandatory.
    std::optional<CounterPartyDataOptions> payer_data_options;
    std::vector<Currency> currency_options;
    KycStatus receiver_kyc_status = KycStatus::Unknown;
    std::optional<int> comment_chars_allowed;
    std::optional<std::string> nostr_pubkey;
    std::optional<std::vector<SettlementOption>> settlement_options;
};

struct PayRequestParams {
    std::span<const uint8_t> receiver_encryption_pub_key;
    std::span<const uint8_t> sending_vasp_private_key;
    std::string receiving_currency_code;
    /// True when `amount` is in the smallest unit of the receiving currency,
    /// false when it is in millisatoshis.
    bool is_amount_in_receiving_currency = true;
    int64_t amount = 0;
    std::string payer_identifier;
    KycStatus payer_kyc_status = KycStatus::Unknown;
    std::string utxo_callback;
    std::optional<std::string> travel_rule_info;
    std::vector<std::string> payer_utxos;
    std::optional<std::string> payer_node_pub_key;
    std::optional<std::string> payer_name;
    std::optional<std::string> payer_email;
    std::optional<TravelRuleFormat> travel_rule_format;
    std::optional<CounterPartyDataOptions> requested_payee_data;
    std::optional<std::string> comment;
    std::optional<std::string> invoice_uuid;
    std::optional<SettlementInfo> settlement;
    /// Version the receiver answered the lnurlp request with. Major 0
    /// selects the legacy layout.
    std::optional<std::string> receiver_uma_version;
};

struct PayReqResponseParams {
    std::string metadata;
    std::optional<std::string> receiving_currency_code;
    std::optional<int> receiving_currency_decimals;
    /// Millisatoshis per smallest unit of the receiving currency.
    std::optional<double> conversion_rate;
    std::optional<int64_t> receiver_fees_millisats;
    std::vector<std::string> receiver_channel_utxos;
    std::optional<std::string> receiver_node_pub_key;
    std::optional<std::string> utxo_callback;
    std::optional<std::string> payee_identifier;
    std::span<const uint8_t> signing_private_key;
    std::optional<PayeeData> payee_data;
    std::optional<bool> disposable;
    std::optional<std::map<std::string, std::string>> success_action;
};

/**
 * @brief Orchestrates the UMA message flow on top of the codec, signing,
 * replay and key-cache modules
 *
 * Every Verify* entry point records the message nonce before checking the
 * signature, so a replayed message is rejected with INVALID_NONCE and never
 * reaches signature verification. Signature mismatches are Ok(false).
 */
class UmaProtocolHelper {
public:
    /// Seconds since epoch.
    using Clock = std::function<int64_t()>;

    UmaProtocolHelper(
        std::shared_ptr<interfaces::IPublicKeyCache> public_key_cache,
        std::shared_ptr<interfaces::IUmaRequester> requester,
        std::shared_ptr<interfaces::INonceCache> nonce_cache,
        configuration::ProtocolConfig config = configuration::ProtocolConfig::Default(),
        Clock clock = SystemClock);

    UmaProtocolHelper(const UmaProtocolHelper&) = delete;
    UmaProtocolHelper& operator=(const UmaProtocolHelper&) = delete;

    static int64_t SystemClock();

    [[nodiscard]] static std::string GenerateNonce();
    [[nodiscard]] int64_t CurrentTimestamp() const { return clock_(); }
    [[nodiscard]] const VersionNegotiator& GetVersionNegotiator() const noexcept { return negotiator_; }

    /// Cached keys when still valid, otherwise a GET of
    /// `<scheme>://<domain>/.well-known/lnurlpubkey` whose result is cached.
    [[nodiscard]] Result<PubKeyResponse, UmaFailure> FetchPublicKeyForVasp(std::string_view vasp_domain);

    [[nodiscard]] Result<std::string, UmaFailure> GetSignedLnurlpRequestUrl(
        std::span<const uint8_t> signing_private_key,
        std::string_view receiver_address,
        std::string_view sender_vasp_domain,
        bool is_subject_to_travel_rule,
        std::optional<std::string> uma_version_override = std::nullopt) const;

    /// True for a well-formed UMA lnurlp URL, including one that only fails
    /// version negotiation.
    [[nodiscard]] bool IsUmaLnurlpQuery(std::string_view url) const;

    [[nodiscard]] Result<LnurlpRequest, UmaFailure> ParseLnurlpRequest(std::string_view url) const;

    [[nodiscard]] Result<bool, UmaFailure> VerifyUmaLnurlpQuerySignature(
        const UmaLnurlpRequest& query,
        const PubKeyResponse& pub_key_response);

    [[nodiscard]] Result<bool, UmaFailure> VerifyUmaLnurlpQueryBackingSignatures(const UmaLnurlpRequest& query);

    /**
     * @brief Builds the answer to an lnurlp request
     *
     * A plain LNURL query gets only the LNURL fields. For a UMA query the
     * compliance block is signed, the response version is the smaller of
     * the requested and current version, and currencies are rendered in the
     * V0 layout when that version is below major 1.
     */
    [[nodiscard]] Result<LnurlpResponse, UmaFailure> GetLnurlpResponse(
        const LnurlpRequest& query,
        const LnurlpResponseParams& params) const;

    [[nodiscard]] Result<bool, UmaFailure> VerifyLnurlpResponseSignature(
        const UmaLnurlpResponse& response,
        const PubKeyResponse& pub_key_response);

    [[nodiscard]] Result<bool, UmaFailure> VerifyLnurlpResponseBackingSignatures(const UmaLnurlpResponse& response);

    /// Signed pay request; travel rule info is ECIES-encrypted to the
    /// receiver's encryption key.
    [[nodiscard]] Result<PayRequest, UmaFailure> GetPayRequest(const PayRequestParams& params) const;

    [[nodiscard]] Result<bool, UmaFailure> VerifyPayReqSignature(
        const PayRequest& request,
        const PubKeyResponse& pub_key_response);

    [[nodiscard]] Result<bool, UmaFailure> VerifyPayReqBackingSignatures(const PayRequest& request);

    /**
     * @brief Builds the pay response around a freshly created invoice
     *
     * The invoice amount is `amount * conversion_rate + fees` when the
     * request amount is in the receiving currency, or the request amount
     * itself when it is in millisatoshis. The invoice metadata is the
     * lnurlp metadata followed by the JSON payer data.
     */
    [[nodiscard]] Result<PayReqResponse, UmaFailure> GetPayReqResponse(
        const PayRequest& request,
        interfaces::IInvoiceCreator& invoice_creator,
        const PayReqResponseParams& params) const;

    [[nodiscard]] Result<bool, UmaFailure> VerifyPayReqResponseSignature(
        const PayReqResponse& response,
        const PubKeyResponse& pub_key_response,
        std::string_view payer_identifier);

    [[nodiscard]] Result<bool, UmaFailure> VerifyPayReqResponseBackingSignatures(
        const PayReqResponse& response,
        std::string_view payer_identifier);

    [[nodiscard]] Result<PostTransactionCallback, UmaFailure> GetPostTransactionCallback(
        std::vector<UtxoWithAmount> utxos,
        std::string_view vasp_domain,
        std::span<const uint8_t> signing_private_key) const;

    [[nodiscard]] Result<bool, UmaFailure> VerifyPostTransactionCallbackSignature(
        const PostTransactionCallback& callback,
        const PubKeyResponse& pub_key_response);

    [[nodiscard]] static PubKeyResponse GetPubKeyResponse(
        std::vector<uint8_t> signing_pub_key,
        std::vector<uint8_t> encryption_pub_key,
        std::optional<int64_t> expiration_timestamp = std::nullopt);

    /// Fails with CERT_CHAIN_INVALID when either chain does not parse.
    [[nodiscard]] static Result<PubKeyResponse, UmaFailure> GetPubKeyResponseFromCertificates(
        std::string signing_cert_chain,
        std::string encryption_cert_chain,
        std::optional<int64_t> expiration_timestamp = std::nullopt);

    [[nodiscard]] static Result<Invoice, UmaFailure> CreateUmaInvoice(
        const InvoiceBuilder& builder,
        std::span<const uint8_t> signing_private_key);

    [[nodiscard]] static Result<bool, UmaFailure> VerifyUmaInvoiceSignature(
        const Invoice& invoice,
        const PubKeyResponse& pub_key_response);

private:
    [[nodiscard]] Result<bool, UmaFailure> CheckNonceAndVerify(
        std::string_view nonce,
        int64_t timestamp,
        std::string_view payload,
        std::string_view signature,
        const PubKeyResponse& pub_key_response);

    [[nodiscard]] Result<bool, UmaFailure> VerifyBackingChain(
        std::string_view payload,
        const std::optional<std::vector<BackingSignature>>& backing_signatures);

    std::shared_ptr<interfaces::IPublicKeyCache> public_key_cache_;
    std::shared_ptr<interfaces::IUmaRequester> requester_;
    std::shared_ptr<interfaces::INonceCache> nonce_cache_;
    configuration::ProtocolConfig config_;
    VersionNegotiator negotiator_;
    Clock clock_;
};

} // namespace uma::protocol
