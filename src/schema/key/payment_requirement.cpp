#include <tollbooth/schema/key/builder.hpp>
#include <tollbooth/schema/key/payment_requirement.hpp>

using namespace tollbooth::schema;

namespace tollbooth::schema::key {

bytes_t make_requirement_key(const payment_requirement_t& requirement) {
  auto b = builder{};
  b.write(kRequirementPrefix);
  b.write_prefixed(requirement.resource);
  b.write(static_cast<uint8_t>(requirement.scheme));
  b.write_prefixed(requirement.network.name);
  return b.data;
}

}  // namespace tollbooth::schema::key
