#pragma once
#include <tandem/schema/primitives.hpp>

// Schema type: authority source.
// Handle to the right to act as an identity, owned by that identity. It is
// only ever turned into a proof by the authority redeemer.
namespace tandem::schema {

template <uint16_t Version>
struct authority_source;

template <>
struct authority_source<1> final {
  uint16_t version{1};
  account_id_t account{};
};

using authority_source_t = authority_source<1>;

}  // namespace tandem::schema
