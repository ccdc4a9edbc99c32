#include <tandem/blake3/hash.hpp>
#include <tandem/execution/address_deriver.hpp>

namespace tandem::execution {

namespace {

// Trailing scheme byte; keeps derived identities apart from other BLAKE3
// material such as authority proofs.
constexpr auto kDerivedAccountScheme = uint8_t{0xFE};

}  // namespace

address_deriver_t default_address_deriver() {
  return [](const tandem::schema::account_id_t& parent,
            const tandem::schema::bytes_view_t& seed) {
    return tandem::blake3::hash(
        {tandem::schema::make_bytes_view(parent), seed,
         tandem::schema::bytes_view_t{&kDerivedAccountScheme, 1}});
  };
}

}  // namespace tandem::execution
