#pragma once
#include <tollbooth/schema/error_code.hpp>
#include <tollbooth/schema/payment_authorization.hpp>
#include <tollbooth/schema/payment_requirement.hpp>
#include <tollbooth/schema/payment_status.hpp>
#include <tollbooth/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: payment record.
// Durable lifecycle of one authorization, keyed by its deterministic id.
namespace tollbooth::schema {

template <uint16_t Version>
struct payment_record;

template <>
struct payment_record<1> final {
  payment_id_t id{};
  payment_status status{payment_status::requested};
  payment_requirement_t requirement;
  payment_authorization_t authorization;
  std::optional<transaction_ref_t> transaction_ref;
  // Signed settlement transaction, persisted before its first broadcast.
  bytes_t prepared;
  uint64_t confirmations{0};
  error_code failure_code{error_code::none};
  std::string failure_reason;
  uint32_t attempts{0};
  timestamp_milliseconds_t created_at{0};
  timestamp_milliseconds_t updated_at{0};
  timestamp_milliseconds_t deadline{0};
  amount_t fee{0};
};

using payment_record_t = payment_record<1>;

}  // namespace tollbooth::schema
