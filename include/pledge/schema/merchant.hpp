#pragma once
#include <pledge/schema/primitives.hpp>
#include <string>

namespace pledge::schema {

template <uint16_t Version>
struct merchant;

template <>
struct merchant<1> final {
  uint16_t version{1};
  merchant_id_t id;
  std::string name;
  account_id_t payee_account_id;
};

using merchant_t = merchant<1>;

}  // namespace pledge::schema
