#pragma once
#include <tandem/schema/authority_source.hpp>

// Schema type: shared account state.
// Exists only at identities created by the shared-account factory; never
// mutated afterwards.
namespace tandem::schema {

template <uint16_t Version>
struct shared_account_state;

template <>
struct shared_account_state<1> final {
  uint16_t version{1};
  authority_source_t authority_source;
};

using shared_account_state_t = shared_account_state<1>;

}  // namespace tandem::schema
