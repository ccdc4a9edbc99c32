#pragma once
#include <tandem/schema/primitives.hpp>
#include <vector>

// Schema type: management state.
// Co-located with a shared account. `admin` is fixed at creation;
// `unclaimed` is the allow-list, unique and in insertion order.
namespace tandem::schema {

template <uint16_t Version>
struct management_state;

template <>
struct management_state<1> final {
  uint16_t version{1};
  account_id_t admin{};
  std::vector<account_id_t> unclaimed;
};

using management_state_t = management_state<1>;

}  // namespace tandem::schema
