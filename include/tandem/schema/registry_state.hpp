#pragma once
#include <tandem/schema/audit_event_type.hpp>
#include <tandem/schema/authority_source.hpp>
#include <tandem/schema/primitives.hpp>

#include <array>
#include <cstdint>

// Schema type: registry state.
// Module singleton stored at the module identity: its own authority source
// and one monotonically increasing counter per audit event kind.
namespace tandem::schema {

using audit_counters_t = std::array<uint64_t, kAuditEventTypeCount>;

template <uint16_t Version>
struct registry_state;

template <>
struct registry_state<1> final {
  uint16_t version{1};
  authority_source_t authority_source;
  audit_counters_t counters{};

  uint64_t counter(const audit_event_type_t type) const {
    return counters[static_cast<std::size_t>(type)];
  }
};

using registry_state_t = registry_state<1>;

}  // namespace tandem::schema
