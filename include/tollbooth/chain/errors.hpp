#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tollbooth::chain {

/// Transient: the chain could not be reached or did not answer. Retried with
/// backoff.
class chain_unavailable : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Permanent: the chain answered and refused. Never retried.
class chain_rejected : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Error object of a JSON-RPC 2.0 response.
class json_rpc_error final : public chain_rejected {
 public:
  json_rpc_error(int64_t code, const std::string& message)
      : chain_rejected{"json-rpc error " + std::to_string(code) + ": " +
                       message},
        code_{code},
        message_{message} {}

  int64_t code() const noexcept { return code_; }
  const std::string& rpc_message() const noexcept { return message_; }

 private:
  int64_t code_;
  std::string message_;
};

}  // namespace tollbooth::chain
