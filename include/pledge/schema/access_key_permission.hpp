#pragma once
#include <pledge/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: access key permission.
// Function-call-only grant: the key may call the listed methods on one
// receiver contract and spend at most `allowance` on fees.
namespace pledge::schema {

template <uint16_t Version>
struct function_call_permission;

template <>
struct function_call_permission<1> final {
  uint16_t version{1};
  std::optional<amount_t> allowance;
  account_id_t receiver_id;
  std::vector<std::string> method_names;
};

using function_call_permission_t = function_call_permission<1>;

template <uint16_t Version>
struct access_key;

template <>
struct access_key<1> final {
  uint16_t version{1};
  uint64_t nonce{};
  function_call_permission_t permission;
};

using access_key_t = access_key<1>;

}  // namespace pledge::schema
