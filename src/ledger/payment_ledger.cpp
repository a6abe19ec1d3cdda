#include <tollbooth/ledger/payment_ledger.hpp>
#include <tollbooth/schema/key/payment_record.hpp>

#include <spdlog/spdlog.h>

using namespace tollbooth::schema;

namespace tollbooth::ledger {

bool is_open(const payment_status status) {
  switch (status) {
    case payment_status::reserved:
    case payment_status::submitting:
    case payment_status::submitted:
    case payment_status::confirming:
    case payment_status::settlement_timeout:
      return true;
    default:
      return false;
  }
}

payment_ledger::payment_ledger(
    std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage)
    : storage_{std::move(storage)} {}

std::optional<payment_record_t> payment_ledger::find(
    const payment_id_t& id) const {
  auto encoder = tollbooth::storage::detail::encoder_t{};
  return storage_->get<payment_record_t>(encoder, key::make_payment_key(id));
}

std::vector<payment_record_t> payment_ledger::list() const {
  auto encoder = tollbooth::storage::detail::encoder_t{};
  auto out = std::vector<payment_record_t>{};
  for (const auto& [entry_key, value] :
       storage_->list_by_prefix(make_bytes_view(key::kPaymentPrefix))) {
    auto record = encoder.try_decode<payment_record_t>(value);
    if (!record) {
      spdlog::warn("skipping undecodable payment entry {}", to_hex(entry_key));
      continue;
    }
    out.push_back(std::move(*record));
  }
  return out;
}

std::vector<payment_id_t> payment_ledger::open_ids() const {
  auto out = std::vector<payment_id_t>{};
  for (const auto& [entry_key, _] :
       storage_->list_by_prefix(make_bytes_view(key::kOpenPaymentPrefix))) {
    if (auto id = key::try_payment_id_from_key(entry_key)) {
      out.push_back(*id);
    }
  }
  return out;
}

std::vector<payment_record_t> payment_ledger::by_payer(
    const bytes_view_t& payer,
    const std::size_t limit) const {
  return by_party(key::kPayerIndexPrefix, payer, limit);
}

std::vector<payment_record_t> payment_ledger::by_payee(
    const bytes_view_t& payee,
    const std::size_t limit) const {
  return by_party(key::kPayeeIndexPrefix, payee, limit);
}

std::vector<payment_record_t> payment_ledger::by_party(
    const std::string_view index,
    const bytes_view_t& party,
    const std::size_t limit) const {
  auto out = std::vector<payment_record_t>{};
  auto prefix = key::make_party_prefix(index, party);
  for (const auto& [entry_key, _] : storage_->list_by_prefix(prefix, limit)) {
    auto id = key::try_payment_id_from_key(entry_key);
    if (!id) {
      continue;
    }
    if (auto record = find(*id)) {
      out.push_back(std::move(*record));
    } else {
      spdlog::warn("{} index entry without record {}", index, to_hex(*id));
    }
  }
  return out;
}

void payment_ledger::record(
    const payment_record_t& record,
    std::vector<tollbooth::storage::write_entry_t> extra) {
  write(record, is_open(record.status), std::move(extra));
}

void payment_ledger::retire(const payment_record_t& record) {
  write(record, false, {});
}

void payment_ledger::write(const payment_record_t& record,
                           const bool open,
                           std::vector<tollbooth::storage::write_entry_t> extra) {
  auto encoder = tollbooth::storage::detail::encoder_t{};
  auto entries = std::move(extra);
  entries.emplace_back(key::make_payment_key(record.id),
                       encoder.encode(record));
  if (open) {
    entries.emplace_back(key::make_open_payment_key(record.id), bytes_t{});
  } else {
    entries.emplace_back(key::make_open_payment_key(record.id), std::nullopt);
  }
  entries.emplace_back(
      key::make_party_key(key::kPayerIndexPrefix, record.authorization.payer,
                          record.created_at, record.id),
      bytes_t{});
  entries.emplace_back(
      key::make_party_key(key::kPayeeIndexPrefix, record.authorization.payee,
                          record.created_at, record.id),
      bytes_t{});
  storage_->apply(entries);
}

}  // namespace tollbooth::ledger
