#pragma once
#include <tandem/schema/primitives.hpp>

// Schema type: capability state.
// Single-use entitlement held by a claiming principal. At most one exists per
// holder; it is moved out of its slot on redemption and never copied.
namespace tandem::schema {

template <uint16_t Version>
struct capability_state;

template <>
struct capability_state<1> final {
  uint16_t version{1};
  account_id_t target{};

  capability_state() = default;
  explicit capability_state(const account_id_t& target_account)
      : target{target_account} {}

  capability_state(const capability_state&) = delete;
  capability_state& operator=(const capability_state&) = delete;
  capability_state(capability_state&&) noexcept = default;
  capability_state& operator=(capability_state&&) noexcept = default;
  ~capability_state() = default;
};

using capability_state_t = capability_state<1>;

}  // namespace tandem::schema
