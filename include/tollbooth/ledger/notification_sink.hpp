#pragma once
#include <tollbooth/schema/settlement_notification.hpp>

namespace tollbooth::ledger {

/// Receives one notification per terminal transition. Implementations must
/// not throw; delivery guarantees beyond the call are theirs.
struct notification_sink {
  virtual ~notification_sink() = default;

  virtual void notify(
      const tollbooth::schema::settlement_notification_t& notification) = 0;
};

/// Default sink: one spdlog line per notification.
class logging_notification_sink final : public notification_sink {
 public:
  void notify(const tollbooth::schema::settlement_notification_t& notification)
      override;
};

}  // namespace tollbooth::ledger
