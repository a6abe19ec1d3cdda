#pragma once
#include <tollbooth/schema/error_code.hpp>
#include <tollbooth/schema/payment_authorization.hpp>
#include <tollbooth/schema/payment_record.hpp>
#include <tollbooth/schema/payment_requirement.hpp>
#include <tollbooth/v1/facilitator.pb.h>

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

// Conversions between the x402 documents (as tollbooth.v1 messages) and the
// schema types. Malformed input is reported as a failure value, never thrown.
namespace tollbooth::codec {

inline constexpr auto kX402Version = int32_t{1};

/// Maps a network name to a network the instance knows about.
using network_resolver_fn =
    std::function<std::optional<tollbooth::schema::network_t>(std::string_view)>;

using authorization_result_t =
    std::variant<tollbooth::schema::payment_authorization_t,
                 tollbooth::schema::failure>;
using requirement_result_t =
    std::variant<tollbooth::schema::payment_requirement_t,
                 tollbooth::schema::failure>;

authorization_result_t to_authorization(const tollbooth::v1::PaymentPayload& payload,
                                        const network_resolver_fn& resolve);
tollbooth::v1::PaymentPayload to_proto(
    const tollbooth::schema::payment_authorization_t& authorization);

requirement_result_t to_requirement(
    const tollbooth::v1::PaymentRequirements& requirements,
    const network_resolver_fn& resolve);
tollbooth::v1::PaymentRequirements to_proto(
    const tollbooth::schema::payment_requirement_t& requirement);

tollbooth::v1::PaymentRecord to_proto(
    const tollbooth::schema::payment_record_t& record);

/// base64(JSON PaymentPayload), the X-PAYMENT header value.
std::optional<tollbooth::v1::PaymentPayload> decode_header_payload(
    std::string_view header);
authorization_result_t decode_header(std::string_view header,
                                     const network_resolver_fn& resolve);
std::string encode_header(
    const tollbooth::schema::payment_authorization_t& authorization);

tollbooth::v1::PaymentRequired make_payment_required(
    std::span<const tollbooth::schema::payment_requirement_t> accepts,
    std::string_view error);
/// JSON body of a 402 response.
std::string encode_payment_required(
    std::span<const tollbooth::schema::payment_requirement_t> accepts,
    std::string_view error);
std::optional<tollbooth::v1::PaymentRequired> decode_payment_required(
    std::string_view body);

}  // namespace tollbooth::codec
