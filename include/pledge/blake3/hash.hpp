#pragma once
#include <pledge/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace pledge::blake3 {

pledge::schema::hash32_t hash(const std::string_view& str);
pledge::schema::hash32_t hash(const pledge::schema::bytes_view_t& bytes);

/// Hash the concatenation of several byte ranges without copying them.
pledge::schema::hash32_t hash(
    std::initializer_list<pledge::schema::bytes_view_t> parts);

}  // namespace pledge::blake3
