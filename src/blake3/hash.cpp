#include <blake3.h>
#include <conduit/blake3/hash.hpp>

namespace conduit::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  hasher& update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
    return *this;
  }

  conduit::schema::hash32_t finalize() {
    static_assert(BLAKE3_OUT_LEN == 32);
    auto output = conduit::schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

conduit::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str.data(), str.size()).finalize();
}

conduit::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes.data(), bytes.size()).finalize();
}

conduit::schema::hash32_t fold(const conduit::schema::hash32_t& previous,
                               const std::span<const uint8_t>& bytes) {
  return hasher{}
      .update(previous.data(), previous.size())
      .update(bytes.data(), bytes.size())
      .finalize();
}

}  // namespace conduit::blake3
