#pragma once
#include <tollbooth/schema/payment_requirement.hpp>
#include <tollbooth/schema/primitives.hpp>

#include <string_view>

// Schema key type: payment requirement.
// REQ|<resource><scheme><network> holds every declared requirement.
namespace tollbooth::schema::key {

inline constexpr auto kRequirementPrefix = std::string_view{"REQ|"};

bytes_t make_requirement_key(const payment_requirement_t& requirement);

}  // namespace tollbooth::schema::key
