#include <tollbooth/chain/errors.hpp>
#include <tollbooth/chain/evm_adapter.hpp>
#include <tollbooth/chain/json.hpp>
#include <tollbooth/chain/rlp.hpp>
#include <tollbooth/crypto/verify.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <iterator>

using namespace tollbooth::schema;

namespace tollbooth::chain {

namespace {

void append_word(bytes_t& out, const bytes_view_t& value) {
  auto padding = value.size() < 32 ? 32 - value.size() : 0;
  out.insert(std::end(out), padding, uint8_t{0});
  out.insert(std::end(out), std::begin(value), std::end(value));
}

void append_word(bytes_t& out, const amount_t& value) {
  auto word = to_be_bytes32(value);
  out.insert(std::end(out), std::begin(word), std::end(word));
}

hash32_t keccak_or_reject(const bytes_view_t& data) {
  auto hash = tollbooth::crypto::keccak256(data);
  if (!hash) {
    throw chain_rejected{"keccak-256 is not available in this OpenSSL build"};
  }
  return *hash;
}

amount_t parse_quantity(const google::protobuf::Value& value,
                        const std::string_view what) {
  if (!value.has_string_value()) {
    throw chain_unavailable{std::string{what} + " is not a hex quantity"};
  }
  auto parsed = try_parse_amount(value.string_value());
  if (!parsed) {
    throw chain_unavailable{std::string{what} + " is not a hex quantity: " +
                            value.string_value()};
  }
  return *parsed;
}

bool is_already_known(const json_rpc_error& error) {
  const auto& message = error.rpc_message();
  return message.find("already known") != std::string::npos ||
         message.find("known transaction") != std::string::npos ||
         message.find("already imported") != std::string::npos;
}

}  // namespace

account_nonce_allocator::slot& account_nonce_allocator::slot_for(
    const std::string& network) {
  auto lock = std::scoped_lock{slots_mutex_};
  auto& entry = slots_[network];
  if (!entry) {
    entry = std::make_unique<slot>();
  }
  return *entry;
}

amount_t account_nonce_allocator::allocate(const std::string& network,
                                           const fetch_fn& pending) {
  auto& entry = slot_for(network);
  auto lock = std::scoped_lock{entry.mutex};
  auto value = pending();
  if (entry.next && *entry.next > value) {
    value = *entry.next;
  }
  entry.next = value + 1;
  return value;
}

void account_nonce_allocator::forget(const std::string& network) {
  auto& entry = slot_for(network);
  auto lock = std::scoped_lock{entry.mutex};
  entry.next.reset();
}

std::optional<bytes_t> make_transfer_call_data(
    const payment_authorization_t& authorization) {
  if (authorization.signature.size() != 65) {
    return std::nullopt;
  }
  auto selector_hash =
      tollbooth::crypto::keccak256(make_bytes_view(kTransferWithAuthorizationSignature));
  if (!selector_hash) {
    return std::nullopt;
  }
  const auto& signature = authorization.signature;
  auto v = signature[64] < 27 ? static_cast<uint8_t>(signature[64] + 27)
                              : signature[64];

  auto data = bytes_t{std::begin(*selector_hash), std::begin(*selector_hash) + 4};
  data.reserve(4 + 9 * 32);
  append_word(data, authorization.payer);
  append_word(data, authorization.payee);
  append_word(data, authorization.amount);
  append_word(data, amount_t{authorization.valid_after});
  append_word(data, amount_t{authorization.valid_before});
  append_word(data, authorization.nonce);
  append_word(data, amount_t{v});
  append_word(data, bytes_view_t{signature}.subspan(0, 32));
  append_word(data, bytes_view_t{signature}.subspan(32, 32));
  return data;
}

evm_adapter::evm_adapter(tollbooth::crypto::secp256k1_signer signer,
                         std::vector<network_binding> bindings)
    : signer_{std::move(signer)}, bindings_{std::move(bindings)} {
  auto address = tollbooth::crypto::evm_address(signer_.public_key());
  if (address) {
    address_ = std::move(*address);
  }
}

std::vector<network_t> evm_adapter::networks() const {
  auto out = std::vector<network_t>{};
  for (const auto& entry : bindings_) {
    out.push_back(entry.network);
  }
  return out;
}

bool evm_adapter::supports(const network_t& network) const {
  return find_binding(bindings_, network) != nullptr;
}

uint64_t evm_adapter::required_confirmations(const network_t& network) const {
  return binding(network).required_confirmations;
}

const network_binding& evm_adapter::binding(const network_t& network) const {
  const auto* found = find_binding(bindings_, network);
  if (found == nullptr) {
    throw chain_rejected{"network " + network.name + " is not configured"};
  }
  return *found;
}

amount_t evm_adapter::gas_price(const network_binding& binding) {
  return parse_quantity(binding.pool->call("eth_gasPrice", json::params({})),
                        "eth_gasPrice");
}

uint64_t evm_adapter::gas_limit(const network_binding& binding) const {
  return static_cast<uint64_t>(std::ceil(
      static_cast<double>(kSettlementGasLimit) * binding.fee_multiplier));
}

fee_estimate evm_adapter::estimate_fee(
    const payment_requirement_t& requirement) {
  const auto& target = binding(requirement.network);
  return fee_estimate{.amount = gas_price(target) * gas_limit(target),
                      .unit = "wei"};
}

prepared_transaction evm_adapter::prepare(
    const payment_authorization_t& authorization,
    const payment_requirement_t& requirement) {
  const auto& target = binding(requirement.network);
  if (address_.empty()) {
    throw chain_rejected{"facilitator address could not be derived"};
  }

  auto call_data = make_transfer_call_data(authorization);
  if (!call_data) {
    throw chain_rejected{"cannot encode transferWithAuthorization call"};
  }

  auto price = gas_price(target);
  auto account_nonce = nonces_.allocate(target.network.name, [&] {
    return parse_quantity(
        target.pool->call("eth_getTransactionCount",
                          json::params({json::string(to_hex_prefixed(address_)),
                                        json::string("pending")})),
        "eth_getTransactionCount");
  });
  auto limit = amount_t{gas_limit(target)};
  auto chain_id = amount_t{requirement.network.chain_id};

  auto fields = std::vector<bytes_t>{
      rlp::encode_uint(account_nonce), rlp::encode_uint(price),
      rlp::encode_uint(limit),         rlp::encode_bytes(requirement.asset),
      rlp::encode_uint(0),             rlp::encode_bytes(*call_data)};

  // EIP-155 signing payload: the six fields plus (chainId, 0, 0).
  auto unsigned_fields = fields;
  unsigned_fields.push_back(rlp::encode_uint(chain_id));
  unsigned_fields.push_back(rlp::encode_uint(0));
  unsigned_fields.push_back(rlp::encode_uint(0));
  auto signing_hash =
      tollbooth::crypto::keccak256(rlp::encode_list(unsigned_fields));
  auto signature = signing_hash ? signer_.sign(*signing_hash)
                                : std::optional<bytes_t>{};
  if (!signature) {
    nonces_.forget(target.network.name);
    throw chain_rejected{"failed to sign settlement transaction"};
  }
  auto recovery_id = (*signature)[64];
  fields.push_back(rlp::encode_uint(chain_id * 2 + 35 + recovery_id));
  fields.push_back(
      rlp::encode_uint(from_be_bytes(bytes_view_t{*signature}.subspan(0, 32))));
  fields.push_back(
      rlp::encode_uint(from_be_bytes(bytes_view_t{*signature}.subspan(32, 32))));

  auto raw = rlp::encode_list(fields);
  auto reference = to_hex_prefixed(keccak_or_reject(raw));
  spdlog::debug("[{}] prepared {} nonce={} gas_price={}",
                requirement.network.name, reference, to_decimal(account_nonce),
                to_decimal(price));
  return prepared_transaction{.reference = std::move(reference),
                              .raw = std::move(raw)};
}

transaction_ref_t evm_adapter::submit(const network_t& network,
                                      const prepared_transaction& transaction) {
  const auto& target = binding(network);
  try {
    auto result = target.pool->call(
        "eth_sendRawTransaction",
        json::params({json::string(to_hex_prefixed(transaction.raw))}));
    if (result.has_string_value() && result.string_value() != transaction.reference) {
      spdlog::warn("[{}] node reported hash {} for {}", network.name,
                   result.string_value(), transaction.reference);
    }
  } catch (const json_rpc_error& e) {
    if (!is_already_known(e)) {
      nonces_.forget(network.name);
      throw;
    }
    spdlog::info("[{}] {} already known to the node", network.name,
                 transaction.reference);
  }
  return transaction.reference;
}

transaction_status_t evm_adapter::status(const network_t& network,
                                         const transaction_ref_t& reference) {
  const auto& target = binding(network);
  auto receipt = target.pool->call("eth_getTransactionReceipt",
                                   json::params({json::string(reference)}));
  if (json::is_null(receipt)) {
    auto transaction = target.pool->call(
        "eth_getTransactionByHash", json::params({json::string(reference)}));
    if (json::is_null(transaction)) {
      return tx_not_found{};
    }
    return tx_pending{};
  }

  auto outcome = json::string_field(receipt, "status");
  if (outcome && try_parse_amount(*outcome) == amount_t{0}) {
    return tx_failed{.reason = "transaction reverted"};
  }
  const auto* block = json::field(receipt, "blockNumber");
  if (block == nullptr || json::is_null(*block)) {
    return tx_pending{};
  }
  auto included_at = parse_quantity(*block, "blockNumber");
  auto head = parse_quantity(
      target.pool->call("eth_blockNumber", json::params({})), "eth_blockNumber");
  if (head < included_at) {
    return tx_pending{};
  }
  return tx_confirmed{
      .confirmations = static_cast<uint64_t>(head - included_at + 1)};
}

}  // namespace tollbooth::chain
