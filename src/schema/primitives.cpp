#include <pledge/common/critical.hpp>
#include <pledge/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string_view>

namespace pledge::schema {

namespace {

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

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    pledge::common::critical("invalid 32-byte hex string");
  }
  return *hash;
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto value : bytes) {
    out.push_back(kHex[(value >> 4u) & 0x0Fu]);
    out.push_back(kHex[value & 0x0Fu]);
  }
  return out;
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

std::string encode_base58(const bytes_view_t& bytes) {
  auto leading_zeros = size_t{0};
  while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0) {
    ++leading_zeros;
  }

  // Little-endian base58 digits of the big-endian input number.
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

std::optional<bytes_t> try_decode_base58(std::string_view text) {
  auto leading_ones = size_t{0};
  while (leading_ones < text.size() && text[leading_ones] == '1') {
    ++leading_ones;
  }

  // Little-endian base256 bytes of the decoded number.
  auto bytes = std::vector<uint8_t>{};
  bytes.reserve(text.size() * 733 / 1000 + 1);
  for (auto i = leading_ones; i < text.size(); ++i) {
    auto digit = base58_digit(text[i]);
    if (!digit) {
      return std::nullopt;
    }
    auto carry = static_cast<uint32_t>(*digit);
    for (auto& value : bytes) {
      carry += static_cast<uint32_t>(value) * 58;
      value = static_cast<uint8_t>(carry & 0xFFu);
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

std::string to_string(const amount_t& amount) {
  return amount.str();
}

std::optional<amount_t> try_make_amount(std::string_view decimal) {
  if (decimal.empty() || decimal.size() > 39) {
    return std::nullopt;
  }
  auto value = amount_t{0};
  const auto max = std::numeric_limits<amount_t>::max();
  for (const auto c : decimal) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return std::nullopt;
    }
    auto digit = static_cast<unsigned>(c - '0');
    if (value > (max - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

}  // namespace pledge::schema
