#include <blake3.h>
#include <pledge/blake3/hash.hpp>
#include <tuple>

namespace pledge::blake3 {

namespace {

struct hasher final {
  blake3_hasher state{};

  hasher() { blake3_hasher_init(&state); }

  void update(const void* data, size_t size) {
    blake3_hasher_update(&state, data, size);
  }

  pledge::schema::hash32_t finalize() {
    auto output = pledge::schema::hash32_t{};
    static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<pledge::schema::hash32_t>);
    blake3_hasher_finalize(&state, output.data(), output.size());
    return output;
  }
};

}  // namespace

pledge::schema::hash32_t hash(const std::string_view& str) {
  auto h = hasher{};
  h.update(str.data(), str.size());
  return h.finalize();
}

pledge::schema::hash32_t hash(const pledge::schema::bytes_view_t& bytes) {
  auto h = hasher{};
  h.update(bytes.data(), bytes.size());
  return h.finalize();
}

pledge::schema::hash32_t hash(
    std::initializer_list<pledge::schema::bytes_view_t> parts) {
  auto h = hasher{};
  for (const auto& part : parts) {
    h.update(part.data(), part.size());
  }
  return h.finalize();
}

}  // namespace pledge::blake3
