#include <tollbooth/ledger/notification_sink.hpp>

#include <spdlog/spdlog.h>

using namespace tollbooth::schema;

namespace tollbooth::ledger {

void logging_notification_sink::notify(
    const settlement_notification_t& notification) {
  spdlog::info("payment {} {} on {} ref={} reason='{}' created={} updated={}",
               to_hex(notification.payment_id), to_string(notification.status),
               notification.network,
               notification.transaction_ref.value_or("-"), notification.reason,
               notification.created_at, notification.updated_at);
}

}  // namespace tollbooth::ledger
