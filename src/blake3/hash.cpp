#include <blake3.h>
#include <tandem/blake3/hash.hpp>

namespace tandem::blake3 {

tandem::schema::hash32_t hash(const tandem::schema::bytes_view_t& bytes) {
  return hash(std::initializer_list<tandem::schema::bytes_view_t>{bytes});
}

tandem::schema::hash32_t hash(
    std::initializer_list<tandem::schema::bytes_view_t> parts) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  auto digest = tandem::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return digest;
}

}  // namespace tandem::blake3
