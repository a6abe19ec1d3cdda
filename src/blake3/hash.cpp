#include <blake3.h>
#include <tollbooth/blake3/hash.hpp>

namespace tollbooth::blake3 {

struct hasher::state final {
  blake3_hasher inner;
};

hasher::hasher() : state_{new state{}} {
  blake3_hasher_init(&state_->inner);
}

hasher::~hasher() {
  delete state_;
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_->inner, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const tollbooth::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_->inner, bytes.data(), bytes.size());
  return *this;
}

tollbooth::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN
  auto output = tollbooth::schema::hash32_t{};
  blake3_hasher_finalize(&state_->inner, output.data(), output.size());
  return output;
}

tollbooth::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

tollbooth::schema::hash32_t hash(const tollbooth::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace tollbooth::blake3
