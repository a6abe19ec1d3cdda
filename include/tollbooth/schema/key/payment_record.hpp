#pragma once
#include <tollbooth/schema/payment_authorization.hpp>
#include <tollbooth/schema/primitives.hpp>

#include <optional>
#include <string_view>

// Schema key type: payment record.
// PAY|<id> holds every record; OPEN|<id> indexes records the background tasks
// still have to look at. PAYER| and PAYEE| index records by party, newest
// first.
namespace tollbooth::schema::key {

inline constexpr auto kPaymentPrefix = std::string_view{"PAY|"};
inline constexpr auto kOpenPaymentPrefix = std::string_view{"OPEN|"};
inline constexpr auto kPayerIndexPrefix = std::string_view{"PAYER|"};
inline constexpr auto kPayeeIndexPrefix = std::string_view{"PAYEE|"};

/// BLAKE3 over (payer, network, nonce); identical authorizations always map to
/// the same record.
payment_id_t make_payment_id(const bytes_view_t& payer,
                             std::string_view network,
                             const nonce_t& nonce);
payment_id_t make_payment_id(const payment_authorization_t& authorization);

bytes_t make_payment_key(const payment_id_t& id);
bytes_t make_open_payment_key(const payment_id_t& id);

/// `index` is kPayerIndexPrefix or kPayeeIndexPrefix.
bytes_t make_party_prefix(std::string_view index, const bytes_view_t& party);
bytes_t make_party_key(std::string_view index,
                       const bytes_view_t& party,
                       timestamp_milliseconds_t created_at,
                       const payment_id_t& id);

/// Recovers the id from an OPEN|, PAY|, PAYER| or PAYEE| key.
std::optional<payment_id_t> try_payment_id_from_key(const bytes_view_t& key);

}  // namespace tollbooth::schema::key
