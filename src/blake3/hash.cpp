#include <blake3.h>
#include <bastion/blake3/hash.hpp>

namespace bastion::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  void update(const void* data, size_t size) {
    blake3_hasher_update(&state_, data, size);
  }

  bastion::schema::hash32_t finalize() {
    // BLAKE3_OUT_LEN
    auto output = bastion::schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

bastion::schema::hash32_t hash(const std::string_view& str) {
  auto h = hasher{};
  h.update(str.data(), str.size());
  return h.finalize();
}

bastion::schema::hash32_t hash(const bastion::schema::bytes_view_t& bytes) {
  auto h = hasher{};
  h.update(bytes.data(), bytes.size());
  return h.finalize();
}

bastion::schema::hash32_t hash(
    std::initializer_list<bastion::schema::bytes_view_t> parts) {
  auto h = hasher{};
  for (const auto& part : parts) {
    h.update(part.data(), part.size());
  }
  return h.finalize();
}

}  // namespace bastion::blake3
