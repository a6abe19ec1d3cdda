#include <tollbooth/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string_view>

namespace tollbooth::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase58Alphabet = std::string_view{
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base58_digit(const char c) {
  auto position = kBase58Alphabet.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_view_t& bytes) {
  auto hash = hash32_t{};
  std::copy_n(std::begin(bytes), std::min(bytes.size(), hash.size()),
              std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  return make_hash32(*decoded);
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHexDigits[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHexDigits[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex_prefixed(const bytes_view_t& bytes) {
  return "0x" + to_hex(bytes);
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  while ((index + 3) <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    index += 3;
  }

  if (index < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    if ((index + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }

  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    compact.push_back(ch);
  }

  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto decode_char = [](const char ch) -> std::optional<uint8_t> {
    if (ch >= 'A' && ch <= 'Z') {
      return static_cast<uint8_t>(ch - 'A');
    }
    if (ch >= 'a' && ch <= 'z') {
      return static_cast<uint8_t>(ch - 'a' + 26);
    }
    if (ch >= '0' && ch <= '9') {
      return static_cast<uint8_t>(ch - '0' + 52);
    }
    if (ch == '+') {
      return uint8_t{62};
    }
    if (ch == '/') {
      return uint8_t{63};
    }
    return std::nullopt;
  };

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);

  for (size_t i = 0; i < compact.size(); i += 4) {
    auto is_last_chunk = (i + 4) == compact.size();
    auto v0 = decode_char(compact[i]);
    auto v1 = decode_char(compact[i + 1]);
    if (!v0 || !v1) {
      return std::nullopt;
    }
    auto value = (static_cast<uint32_t>(*v0) << 18u) |
                 (static_cast<uint32_t>(*v1) << 12u);

    if (compact[i + 2] == '=') {
      if (compact[i + 3] != '=' || !is_last_chunk) {
        return std::nullopt;
      }
      out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
      continue;
    }
    auto v2 = decode_char(compact[i + 2]);
    if (!v2) {
      return std::nullopt;
    }
    value |= static_cast<uint32_t>(*v2) << 6u;

    if (compact[i + 3] == '=') {
      if (!is_last_chunk) {
        return std::nullopt;
      }
      out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
      continue;
    }
    auto v3 = decode_char(compact[i + 3]);
    if (!v3) {
      return std::nullopt;
    }
    value |= static_cast<uint32_t>(*v3);
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    out.push_back(static_cast<uint8_t>(value & 0xFFu));
  }

  return out;
}

std::string to_base58(const bytes_view_t& bytes) {
  auto leading_zeros = std::size_t{0};
  while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0) {
    ++leading_zeros;
  }

  // Base-58 digits, least significant first.
  auto digits = std::vector<uint8_t>{};
  digits.reserve(bytes.size() * 138 / 100 + 1);
  for (auto i = leading_zeros; i < bytes.size(); ++i) {
    auto carry = static_cast<uint32_t>(bytes[i]);
    for (auto& digit : digits) {
      carry += static_cast<uint32_t>(digit) << 8u;
      digit = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(static_cast<uint8_t>(carry % 58));
      carry /= 58;
    }
  }

  auto out = std::string(leading_zeros, kBase58Alphabet[0]);
  out.reserve(leading_zeros + digits.size());
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    out.push_back(kBase58Alphabet[*it]);
  }
  return out;
}

std::optional<bytes_t> try_from_base58(const std::string_view encoded) {
  auto leading_ones = std::size_t{0};
  while (leading_ones < encoded.size() &&
         encoded[leading_ones] == kBase58Alphabet[0]) {
    ++leading_ones;
  }

  // Base-256 bytes, least significant first.
  auto bytes = std::vector<uint8_t>{};
  bytes.reserve(encoded.size() * 733 / 1000 + 1);
  for (auto i = leading_ones; i < encoded.size(); ++i) {
    auto digit = base58_digit(encoded[i]);
    if (!digit) {
      return std::nullopt;
    }
    auto carry = static_cast<uint32_t>(*digit);
    for (auto& byte : bytes) {
      carry += static_cast<uint32_t>(byte) * 58u;
      byte = static_cast<uint8_t>(carry & 0xFFu);
      carry >>= 8u;
    }
    while (carry > 0) {
      bytes.push_back(static_cast<uint8_t>(carry & 0xFFu));
      carry >>= 8u;
    }
  }

  auto out = bytes_t(leading_ones, 0);
  out.insert(std::end(out), bytes.rbegin(), bytes.rend());
  return out;
}

std::optional<amount_t> try_parse_amount(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  static const auto kMax = std::numeric_limits<amount_t>::max();
  auto value = amount_t{0};

  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    auto digits = text.substr(2);
    if (digits.empty() || digits.size() > 64) {
      return std::nullopt;
    }
    for (const auto c : digits) {
      auto nibble = hex_nibble(c);
      if (!nibble) {
        return std::nullopt;
      }
      value = (value << 4) | amount_t{*nibble};
    }
    return value;
  }

  for (const auto c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    auto digit = static_cast<unsigned>(c - '0');
    if (value > (kMax - digit) / 10) {
      return std::nullopt;
    }
    value = (value * 10) + digit;
  }
  return value;
}

std::string to_decimal(const amount_t& amount) {
  return amount.str();
}

std::string to_hex_quantity(const amount_t& amount) {
  if (amount.is_zero()) {
    return "0x0";
  }
  auto hex = to_hex(to_minimal_be_bytes(amount));
  if (hex.front() == '0') {
    hex.erase(0, 1);
  }
  return "0x" + hex;
}

hash32_t to_be_bytes32(const amount_t& amount) {
  auto minimal = to_minimal_be_bytes(amount);
  auto out = hash32_t{};
  std::copy(std::begin(minimal), std::end(minimal),
            std::begin(out) + static_cast<std::ptrdiff_t>(out.size() -
                                                          minimal.size()));
  return out;
}

amount_t from_be_bytes(const bytes_view_t& bytes) {
  auto value = amount_t{0};
  if (bytes.empty()) {
    return value;
  }
  boost::multiprecision::import_bits(value, std::begin(bytes), std::end(bytes),
                                     8);
  return value;
}

bytes_t to_minimal_be_bytes(const amount_t& amount) {
  auto out = bytes_t{};
  if (amount.is_zero()) {
    return out;
  }
  boost::multiprecision::export_bits(amount, std::back_inserter(out), 8);
  return out;
}

}  // namespace tollbooth::schema
