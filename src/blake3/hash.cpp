#include <scrip/blake3/hash.hpp>

namespace scrip::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

scrip::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN; finalize does not consume the state.
  auto output = scrip::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

scrip::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

scrip::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace scrip::blake3
