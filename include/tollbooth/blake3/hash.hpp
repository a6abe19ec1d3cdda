#pragma once
#include <tollbooth/schema/primitives.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace tollbooth::blake3 {

tollbooth::schema::hash32_t hash(const std::string_view& str);
tollbooth::schema::hash32_t hash(const tollbooth::schema::bytes_view_t& bytes);

/// Incremental hasher over several fields.
class hasher final {
 public:
  hasher();
  ~hasher();

  hasher(const hasher&) = delete;
  hasher& operator=(const hasher&) = delete;

  hasher& update(const std::string_view& str);
  hasher& update(const tollbooth::schema::bytes_view_t& bytes);
  tollbooth::schema::hash32_t finalize() const;

 private:
  struct state;
  state* state_;
};

}  // namespace tollbooth::blake3
