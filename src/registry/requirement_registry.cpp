#include <tollbooth/registry/requirement_registry.hpp>
#include <tollbooth/schema/key/payment_requirement.hpp>

#include <algorithm>
#include <iterator>
#include <mutex>

#include <spdlog/spdlog.h>

using namespace tollbooth::schema;

namespace tollbooth::registry {

namespace {

failure invalid(std::string reason) {
  return failure{.code = error_code::invalid_requirement,
                 .reason = std::move(reason)};
}

}  // namespace

std::optional<failure> validate(const payment_requirement_t& requirement) {
  if (requirement.resource.empty()) {
    return invalid("resource must not be empty");
  }
  if (requirement.network.name.empty()) {
    return invalid("network must not be empty");
  }
  if (requirement.max_amount_required == 0) {
    return invalid("maxAmountRequired must be greater than zero");
  }
  if (requirement.max_timeout_seconds == 0) {
    return invalid("maxTimeoutSeconds must be greater than zero");
  }
  if (!is_well_formed_address(requirement.network.family,
                              requirement.pay_to)) {
    return invalid("payTo is not a valid " +
                   std::string{to_string(requirement.network.family)} +
                   " address");
  }
  if (!is_well_formed_address(requirement.network.family, requirement.asset)) {
    return invalid("asset is not a valid " +
                   std::string{to_string(requirement.network.family)} +
                   " address");
  }
  return std::nullopt;
}

requirement_registry::requirement_registry(
    std::shared_ptr<const tollbooth::storage::rocksdb_storage_t> storage)
    : storage_{std::move(storage)} {
  if (!storage_) {
    return;
  }
  auto encoder = tollbooth::storage::detail::encoder_t{};
  for (const auto& [entry_key, value] :
       storage_->list_by_prefix(make_bytes_view(key::kRequirementPrefix))) {
    auto requirement = encoder.try_decode<payment_requirement_t>(value);
    if (!requirement) {
      spdlog::warn("skipping undecodable requirement {}", to_hex(entry_key));
      continue;
    }
    auto slot = key_of(*requirement);
    entries_.emplace(std::move(slot), std::move(*requirement));
  }
  if (!entries_.empty()) {
    spdlog::info("loaded {} declared requirement(s)", entries_.size());
  }
}

requirement_registry::key_t requirement_registry::key_of(
    const payment_requirement_t& requirement) {
  return key_t{requirement.resource, static_cast<uint8_t>(requirement.scheme),
               requirement.network.name};
}

declare_result_t requirement_registry::declare(
    payment_requirement_t requirement) {
  if (auto error = validate(requirement)) {
    spdlog::warn("rejected requirement for '{}': {}", requirement.resource,
                 error->reason);
    return *error;
  }

  auto slot = key_of(requirement);
  auto lock = std::unique_lock{mutex_};
  auto it = entries_.find(slot);
  if (it != std::end(entries_)) {
    if (it->second == requirement) {
      return it->second;
    }
    return invalid("requirement for (" + requirement.resource + ", " +
                   std::string{to_string(requirement.scheme)} + ", " +
                   requirement.network.name + ") is already declared");
  }
  if (storage_) {
    try {
      auto encoder = tollbooth::storage::detail::encoder_t{};
      auto entry_key = key::make_requirement_key(requirement);
      storage_->put(encoder, make_bytes_view(entry_key), requirement);
    } catch (const tollbooth::storage::storage_error& e) {
      spdlog::error("requirement for '{}' not persisted: {}",
                    requirement.resource, e.what());
      return failure{.code = error_code::internal_error, .reason = e.what()};
    }
  }
  spdlog::info("declared requirement resource='{}' scheme={} network={}",
               requirement.resource, to_string(requirement.scheme),
               requirement.network.name);
  auto [inserted, _] = entries_.emplace(std::move(slot), std::move(requirement));
  return inserted->second;
}

std::vector<payment_requirement_t> requirement_registry::lookup(
    const std::string_view resource,
    const std::string_view network) const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<payment_requirement_t>{};
  for (const auto& [key, requirement] : entries_) {
    if (std::get<0>(key) == resource && std::get<2>(key) == network) {
      out.push_back(requirement);
    }
  }
  return out;
}

std::vector<payment_requirement_t> requirement_registry::lookup(
    const std::string_view resource) const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<payment_requirement_t>{};
  for (const auto& [key, requirement] : entries_) {
    if (std::get<0>(key) == resource) {
      out.push_back(requirement);
    }
  }
  return out;
}

std::vector<payment_requirement_t> requirement_registry::list() const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<payment_requirement_t>{};
  out.reserve(entries_.size());
  for (const auto& [_, requirement] : entries_) {
    out.push_back(requirement);
  }
  return out;
}

requirement_page requirement_registry::list(const std::size_t offset,
                                           const std::size_t limit) const {
  auto count = std::clamp<std::size_t>(limit, 1, kMaxPageSize);
  auto lock = std::shared_lock{mutex_};
  auto page = requirement_page{.total = entries_.size()};
  if (offset >= entries_.size()) {
    return page;
  }
  auto it = std::next(std::begin(entries_),
                      static_cast<std::ptrdiff_t>(offset));
  for (; it != std::end(entries_) && page.items.size() < count; ++it) {
    page.items.push_back(it->second);
  }
  return page;
}

std::size_t requirement_registry::size() const {
  auto lock = std::shared_lock{mutex_};
  return entries_.size();
}

}  // namespace tollbooth::registry
