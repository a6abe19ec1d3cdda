#include <tollbooth/chain/errors.hpp>
#include <tollbooth/chain/http_endpoint.hpp>
#include <tollbooth/chain/json.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>

namespace tollbooth::chain {

namespace {

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_slist_ptr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

constexpr auto kInternalError = int64_t{-32603};
constexpr auto kLimitExceeded = int64_t{-32005};

size_t write_to_string(char* data, size_t size, size_t count, void* user) {
  auto* out = static_cast<std::string*>(user);
  out->append(data, size * count);
  return size * count;
}

void ensure_curl_global_init() {
  static auto once = std::once_flag{};
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

std::string make_json_rpc_request(const uint64_t id,
                                  const std::string_view method,
                                  const google::protobuf::ListValue& params) {
  auto request = json::object({{"jsonrpc", json::string("2.0")},
                               {"id", json::number(static_cast<double>(id))},
                               {"method", json::string(method)}});
  auto& fields = *request.mutable_struct_value()->mutable_fields();
  *fields["params"].mutable_list_value() = params;
  return json::to_string(request);
}

google::protobuf::Value parse_json_rpc_response(const std::string_view body) {
  auto document = json::parse(body);
  if (!document || !document->has_struct_value()) {
    throw chain_unavailable{"malformed json-rpc response"};
  }
  if (const auto* error = json::field(*document, "error");
      error != nullptr && !json::is_null(*error)) {
    auto code = static_cast<int64_t>(json::number_field(*error, "code").value_or(0));
    auto message = json::string_field(*error, "message").value_or("");
    if (code == kInternalError || code == kLimitExceeded) {
      throw chain_unavailable{"json-rpc error " + std::to_string(code) + ": " +
                              message};
    }
    throw json_rpc_error{code, message};
  }
  const auto* result = json::field(*document, "result");
  if (result == nullptr) {
    throw chain_unavailable{"json-rpc response without result"};
  }
  return *result;
}

http_endpoint::http_endpoint(std::string url,
                             const tollbooth::schema::duration_milliseconds_t timeout)
    : url_{std::move(url)}, timeout_{timeout} {
  ensure_curl_global_init();
}

google::protobuf::Value http_endpoint::call(
    const std::string_view method,
    const google::protobuf::ListValue& params) {
  auto payload = make_json_rpc_request(next_id_.fetch_add(1), method, params);

  auto curl = curl_ptr{curl_easy_init(), curl_easy_cleanup};
  if (!curl) {
    throw chain_unavailable{"failed to init curl"};
  }
  auto headers = curl_slist_ptr{
      curl_slist_append(nullptr, "Content-Type: application/json"),
      curl_slist_free_all};

  auto body = std::string{};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(payload.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "tollbooth/1.0");
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

  auto code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    spdlog::warn("{} {} failed: {}", url_, method, curl_easy_strerror(code));
    throw chain_unavailable{url_ + ": " + curl_easy_strerror(code)};
  }

  auto status = 0L;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status == 429 || status >= 500) {
    spdlog::warn("{} {} returned HTTP {}", url_, method, status);
    throw chain_unavailable{url_ + ": HTTP " + std::to_string(status)};
  }
  if (status >= 400 && body.empty()) {
    throw chain_rejected{url_ + ": HTTP " + std::to_string(status)};
  }
  return parse_json_rpc_response(body);
}

}  // namespace tollbooth::chain
