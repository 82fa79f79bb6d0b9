#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pledge::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint128_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

using account_id_t = std::string;
using merchant_id_t = std::string;
using subscription_id_t = std::string;

using ed25519_public_key_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Bitcoin-alphabet base58, as used by ledger key strings.
std::string encode_base58(const bytes_view_t& bytes);
std::optional<bytes_t> try_decode_base58(std::string_view text);

/// Decimal rendering of an amount in smallest-denomination units.
std::string to_string(const amount_t& amount);
/// Parse a non-negative decimal amount; rejects signs, blanks and overflow.
std::optional<amount_t> try_make_amount(std::string_view decimal);

}  // namespace pledge::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
