#pragma once
#include <tollbooth/schema/primitives.hpp>

#include <string_view>

// Schema key type: nonce record.
// Anti-replay keyspace; one entry per consumed (payer, network, nonce).
// RESV|<reserved_at be64><nonce key> orders reservations that have not yet
// reached submission by time.
namespace tollbooth::schema::key {

inline constexpr auto kNoncePrefix = std::string_view{"NONCE|"};
inline constexpr auto kReservationPrefix = std::string_view{"RESV|"};

bytes_t make_nonce_key(const bytes_view_t& payer,
                       std::string_view network,
                       const nonce_t& nonce);

bytes_t make_reservation_key(timestamp_milliseconds_t reserved_at,
                             const bytes_view_t& payer,
                             std::string_view network,
                             const nonce_t& nonce);

/// First key past every reservation made before `cutoff`.
bytes_t make_reservation_bound(timestamp_milliseconds_t cutoff);

}  // namespace tollbooth::schema::key
