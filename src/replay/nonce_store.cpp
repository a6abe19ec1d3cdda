#include <tollbooth/replay/nonce_store.hpp>
#include <tollbooth/schema/key/nonce_record.hpp>

#include <spdlog/spdlog.h>

using namespace tollbooth::schema;

namespace tollbooth::replay {

nonce_store::nonce_store(
    std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage)
    : storage_{std::move(storage)} {}

reservation_result nonce_store::reserve(const bytes_view_t& payer,
                                        const std::string_view network,
                                        const nonce_t& nonce,
                                        const timestamp_milliseconds_t now) {
  auto encoder = tollbooth::storage::detail::encoder_t{};
  auto nonce_key = key::make_nonce_key(payer, network, nonce);
  auto encoded = encoder.encode(nonce_record_t{.payer = make_bytes(payer),
                                               .network = std::string{network},
                                               .nonce = nonce,
                                               .reserved_at = now});
  auto entries = std::vector<tollbooth::storage::write_entry_t>{
      {nonce_key, encoded},
      {key::make_reservation_key(now, payer, network, nonce), encoded}};
  if (!storage_->apply_if_absent(nonce_key, entries)) {
    spdlog::debug("nonce {} already reserved for {} on {}", to_hex(nonce),
                  to_hex(payer), network);
    return reservation_result::already_reserved;
  }
  return reservation_result::reserved;
}

bool nonce_store::reserved(const bytes_view_t& payer,
                           const std::string_view network,
                           const nonce_t& nonce) const {
  return storage_->contains(key::make_nonce_key(payer, network, nonce));
}

std::optional<nonce_record_t> nonce_store::find(const bytes_view_t& payer,
                                                const std::string_view network,
                                                const nonce_t& nonce) const {
  auto encoder = tollbooth::storage::detail::encoder_t{};
  return storage_->get<nonce_record_t>(
      encoder, key::make_nonce_key(payer, network, nonce));
}

void nonce_store::expire(const bytes_view_t& payer,
                         const std::string_view network,
                         const nonce_t& nonce) {
  storage_->apply(release_entries(payer, network, nonce));
}

std::vector<tollbooth::storage::write_entry_t> nonce_store::release_entries(
    const bytes_view_t& payer,
    const std::string_view network,
    const nonce_t& nonce) const {
  auto entries = unindex_entries(payer, network, nonce);
  entries.emplace_back(key::make_nonce_key(payer, network, nonce),
                       std::nullopt);
  return entries;
}

std::vector<tollbooth::storage::write_entry_t> nonce_store::unindex_entries(
    const bytes_view_t& payer,
    const std::string_view network,
    const nonce_t& nonce) const {
  auto record = find(payer, network, nonce);
  if (!record) {
    return {};
  }
  return {{key::make_reservation_key(record->reserved_at, payer, network,
                                     nonce),
           std::nullopt}};
}

void nonce_store::unindex(const bytes_view_t& payer,
                          const std::string_view network,
                          const nonce_t& nonce) {
  auto entries = unindex_entries(payer, network, nonce);
  if (!entries.empty()) {
    storage_->apply(entries);
  }
}

std::vector<nonce_record_t> nonce_store::reserved_before(
    const timestamp_milliseconds_t cutoff) const {
  auto encoder = tollbooth::storage::detail::encoder_t{};
  auto out = std::vector<nonce_record_t>{};
  for (const auto& [entry_key, value] : storage_->list_range(
           key::make_reservation_bound(0), key::make_reservation_bound(cutoff))) {
    auto record = encoder.try_decode<nonce_record_t>(value);
    if (!record) {
      spdlog::warn("skipping undecodable reservation {}", to_hex(entry_key));
      continue;
    }
    out.push_back(std::move(*record));
  }
  return out;
}

}  // namespace tollbooth::replay
