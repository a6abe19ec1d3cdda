#pragma once
#include <tollbooth/schema/payment_status.hpp>
#include <tollbooth/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: settlement notification.
// Emitted once per terminal transition to downstream collaborators.
namespace tollbooth::schema {

struct settlement_notification final {
  payment_id_t payment_id{};
  payment_status status{payment_status::requested};
  std::optional<transaction_ref_t> transaction_ref;
  std::string network;
  std::string reason;
  timestamp_milliseconds_t created_at{0};
  timestamp_milliseconds_t updated_at{0};
};

using settlement_notification_t = settlement_notification;

}  // namespace tollbooth::schema
