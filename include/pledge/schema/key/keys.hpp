#pragma once

#include <pledge/schema/primitives.hpp>

#include <algorithm>
#include <array>
#include <boost/endian/buffers.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: storage keys.
// Canonical key prefixes and key codecs for subscription state, the payer
// index, charge history, monitoring status and sealed key custody.
namespace pledge::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kSubscriptionKeyPrefix{
    "SYS|STATE|SUBSCRIPTION|"};
inline constexpr std::string_view kPayerIndexKeyPrefix{
    "SYS|STATE|PAYER_INDEX|"};
inline constexpr std::string_view kSubscriptionSequenceKey{
    "SYS|STATE|SUBSCRIPTION_SEQ"};
inline constexpr std::string_view kChargeHistoryPrefix{"SYS|HISTORY|CHARGE|"};
inline constexpr std::string_view kMonitoringStatusKey{"SYS|MONITOR|STATUS"};
inline constexpr std::string_view kSealedKeyPrefix{"SYS|SEALED|KEY|"};

/// Big-endian rendering so that lexicographic key order follows numeric order.
inline std::array<uint8_t, 8> make_ordered(const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  auto out = std::array<uint8_t, 8>{};
  std::copy_n(buffer.data(), out.size(), out.data());
  return out;
}

template <typename Encoder, typename T>
pledge::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes, so
  // encode(prefix) followed by encode(id) equals encode(tuple{prefix, id}).
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
pledge::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
pledge::schema::bytes_t make_subscription_key(
    Encoder& encoder,
    const pledge::schema::subscription_id_t& subscription_id) {
  return make_prefixed_key(encoder, kSubscriptionKeyPrefix, subscription_id);
}

template <typename Encoder>
pledge::schema::bytes_t make_payer_index_prefix(
    Encoder& encoder,
    const pledge::schema::account_id_t& payer_account_id) {
  return make_prefixed_key(encoder, kPayerIndexKeyPrefix, payer_account_id);
}

template <typename Encoder>
pledge::schema::bytes_t make_payer_index_key(
    Encoder& encoder,
    const pledge::schema::account_id_t& payer_account_id,
    const uint64_t sequence) {
  return make_prefixed_key(encoder, kPayerIndexKeyPrefix,
                           std::tuple{payer_account_id, make_ordered(sequence)});
}

template <typename Encoder>
pledge::schema::bytes_t make_charge_history_prefix(
    Encoder& encoder,
    const pledge::schema::subscription_id_t& subscription_id) {
  return make_prefixed_key(encoder, kChargeHistoryPrefix, subscription_id);
}

template <typename Encoder>
pledge::schema::bytes_t make_charge_history_key(
    Encoder& encoder,
    const pledge::schema::subscription_id_t& subscription_id,
    const uint32_t attempt) {
  return make_prefixed_key(encoder, kChargeHistoryPrefix,
                           std::tuple{subscription_id, make_ordered(attempt)});
}

template <typename Encoder>
pledge::schema::bytes_t make_sealed_key_key(
    Encoder& encoder,
    const pledge::schema::subscription_id_t& subscription_id) {
  return make_prefixed_key(encoder, kSealedKeyPrefix, subscription_id);
}

}  // namespace pledge::schema::key
