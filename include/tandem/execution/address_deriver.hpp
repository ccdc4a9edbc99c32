#pragma once

#include <tandem/schema/primitives.hpp>
#include <functional>

namespace tandem::execution {

/// Deterministic identity derivation: `(parent, seed) -> identity`.
///
/// Implementations must be pure and injective over `(parent, seed)`.
using address_deriver_t =
    std::function<tandem::schema::account_id_t(
        const tandem::schema::account_id_t& parent,
        const tandem::schema::bytes_view_t& seed)>;

/// BLAKE3 over `parent || seed || scheme`, with a trailing scheme byte that
/// separates derived identities from other hashed material.
address_deriver_t default_address_deriver();

}  // namespace tandem::execution
