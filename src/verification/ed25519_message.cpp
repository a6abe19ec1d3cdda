#include <tollbooth/schema/key/builder.hpp>
#include <tollbooth/verification/ed25519_message.hpp>

using namespace tollbooth::schema;

namespace tollbooth::verification {

bytes_t make_ed25519_message(const payment_authorization_t& authorization,
                             const payment_requirement_t& requirement) {
  auto b = key::builder{};
  b.write(kEd25519MessageTag);
  b.write_prefixed(authorization.network.name);
  b.write_prefixed(requirement.asset);
  b.write_prefixed(authorization.payer);
  b.write_prefixed(authorization.payee);
  b.write(to_be_bytes32(authorization.amount));
  b.write(authorization.valid_after);
  b.write(authorization.valid_before);
  b.write(authorization.nonce);
  return b.data;
}

}  // namespace tollbooth::verification
